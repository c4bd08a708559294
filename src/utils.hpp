#pragma once
#include <openssl/sha.h>

#include <array>
#include <filesystem>
#include <string>
#include <string_view>

using Sha1Digest = std::array<unsigned char, SHA_DIGEST_LENGTH>;

// Length of a hex-encoded SHA-1, which is also the media file name length.
inline constexpr std::size_t kHashNameLength = SHA_DIGEST_LENGTH * 2;

std::string hex_from_bytes(const unsigned char* data, std::size_t size);
std::string hex_from_digest(const Sha1Digest& digest);

Sha1Digest sha1_bytes(std::string_view data);
Sha1Digest sha1_file(const std::filesystem::path& file);

// Weak form: 40 chars, at least one hex digit. Strict form: 40 lowercase hex digits.
bool looks_like_media_hash(std::string_view name, bool strict);

std::string ensure_trailing_slash(std::string url);

std::string read_binary_file(const std::filesystem::path& file);
void write_binary_file(const std::filesystem::path& file, std::string_view bytes);
