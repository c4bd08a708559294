#pragma once
#include <array>
#include <cstddef>
#include <filesystem>
#include <string>
#include <string_view>
#include <vector>

#include "utils.hpp"

// "MTHS" followed by format version 0.1.
inline constexpr std::array<char, 6> kMediaIndexHeader = {'M', 'T', 'H', 'S', '\x00', '\x01'};
inline constexpr const char* kMediaIndexFileName = "index.mth";

// Ordered list of SHA-1 digests as stored in index.mth.
class MediaIndex {
public:
    MediaIndex() = default;
    explicit MediaIndex(std::vector<Sha1Digest> digests);

    // Throws IndexFormatError on a bad header. A trailing fragment shorter
    // than one digest is dropped.
    static MediaIndex decode(std::string_view bytes);
    static MediaIndex load_file(const std::filesystem::path& file);

    std::string encode() const;

    void add(const Sha1Digest& digest);
    std::vector<std::string> hex_hashes() const;
    std::size_t size() const { return digests_.size(); }
    bool empty() const { return digests_.empty(); }

    bool operator==(const MediaIndex& other) const { return digests_ == other.digests_; }

private:
    static bool has_valid_header(std::string_view bytes);

    std::vector<Sha1Digest> digests_;
};
