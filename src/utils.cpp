#include "utils.hpp"

#include <algorithm>
#include <fstream>
#include <iomanip>
#include <iterator>
#include <sstream>

#include "errors.hpp"

namespace {
constexpr std::string_view kHexDigits = "0123456789abcdef";
}

std::string hex_from_bytes(const unsigned char* data, std::size_t size){
    std::ostringstream oss;
    for(std::size_t i = 0; i < size; ++i) oss << std::hex << std::setw(2) << std::setfill('0') << (int)data[i];
    return oss.str();
}

std::string hex_from_digest(const Sha1Digest& digest){
    return hex_from_bytes(digest.data(), digest.size());
}

Sha1Digest sha1_bytes(std::string_view data){
    Sha1Digest out{};
    SHA1(reinterpret_cast<const unsigned char*>(data.data()), data.size(), out.data());
    return out;
}

Sha1Digest sha1_file(const std::filesystem::path& file){
    std::ifstream in(file, std::ios::binary);
    if(!in) throw FilesystemError("cannot open " + file.string() + " for hashing");

    SHA_CTX ctx;
    if(SHA1_Init(&ctx) != 1) throw std::runtime_error("SHA1_Init failed");

    std::array<char, 8192> buffer{};
    while(in) {
        in.read(buffer.data(), buffer.size());
        std::streamsize read = in.gcount();
        if(read > 0) {
            if(SHA1_Update(&ctx, reinterpret_cast<const unsigned char*>(buffer.data()),
                           static_cast<size_t>(read)) != 1) {
                throw std::runtime_error("SHA1_Update failed");
            }
        }
    }
    if(in.bad()) throw FilesystemError("read failed while hashing " + file.string());

    Sha1Digest digest{};
    if(SHA1_Final(digest.data(), &ctx) != 1) throw std::runtime_error("SHA1_Final failed");
    return digest;
}

bool looks_like_media_hash(std::string_view name, bool strict){
    if(name.size() != kHashNameLength) return false;
    auto is_hex = [](char c){ return kHexDigits.find(c) != std::string_view::npos; };
    if(strict) return std::all_of(name.begin(), name.end(), is_hex);
    return std::any_of(name.begin(), name.end(), is_hex);
}

std::string ensure_trailing_slash(std::string url){
    if(url.empty() || url.back() != '/') url.push_back('/');
    return url;
}

std::string read_binary_file(const std::filesystem::path& file){
    std::ifstream in(file, std::ios::binary);
    if(!in) throw FilesystemError("cannot open " + file.string() + " for reading");
    std::string bytes((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
    if(in.bad()) throw FilesystemError("read failed: " + file.string());
    return bytes;
}

void write_binary_file(const std::filesystem::path& file, std::string_view bytes){
    std::ofstream out(file, std::ios::binary | std::ios::trunc);
    if(!out) throw FilesystemError("cannot open " + file.string() + " for writing");
    out.write(bytes.data(), static_cast<std::streamsize>(bytes.size()));
    out.close();
    if(!out) throw FilesystemError("write failed: " + file.string());
}
