#include "media_index.hpp"

#include <algorithm>

#include "errors.hpp"

MediaIndex::MediaIndex(std::vector<Sha1Digest> digests)
    : digests_(std::move(digests)) {}

bool MediaIndex::has_valid_header(std::string_view bytes){
    if(bytes.size() < kMediaIndexHeader.size()) return false;
    return std::equal(kMediaIndexHeader.begin(), kMediaIndexHeader.end(), bytes.begin());
}

MediaIndex MediaIndex::decode(std::string_view bytes){
    if(!has_valid_header(bytes)) {
        throw IndexFormatError("Invalid index.mth: missing MTHS 0.1 header");
    }
    const std::size_t body = bytes.size() - kMediaIndexHeader.size();
    const std::size_t count = body / SHA_DIGEST_LENGTH;

    std::vector<Sha1Digest> digests;
    digests.reserve(count);
    const char* cursor = bytes.data() + kMediaIndexHeader.size();
    for(std::size_t i = 0; i < count; ++i, cursor += SHA_DIGEST_LENGTH) {
        Sha1Digest d{};
        std::copy(cursor, cursor + SHA_DIGEST_LENGTH, d.begin());
        digests.push_back(d);
    }
    return MediaIndex(std::move(digests));
}

MediaIndex MediaIndex::load_file(const std::filesystem::path& file){
    return decode(read_binary_file(file));
}

std::string MediaIndex::encode() const {
    std::string out;
    out.reserve(kMediaIndexHeader.size() + digests_.size() * SHA_DIGEST_LENGTH);
    out.append(kMediaIndexHeader.data(), kMediaIndexHeader.size());
    for(const auto& d : digests_) {
        out.append(reinterpret_cast<const char*>(d.data()), d.size());
    }
    return out;
}

void MediaIndex::add(const Sha1Digest& digest){
    digests_.push_back(digest);
}

std::vector<std::string> MediaIndex::hex_hashes() const {
    std::vector<std::string> out;
    out.reserve(digests_.size());
    for(const auto& d : digests_) out.push_back(hex_from_digest(d));
    return out;
}
