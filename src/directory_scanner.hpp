#pragma once
#include <filesystem>
#include <string>
#include <unordered_set>

#include "media_index.hpp"

class Logger;

// Every top-level entry name in dir, unfiltered. Throws FilesystemError.
std::unordered_set<std::string> list_directory_names(const std::filesystem::path& dir);

// Hashes each hash-named regular file in directory iteration order.
MediaIndex compute_local_index(const std::filesystem::path& dir,
                               bool strict_names,
                               Logger* logger = nullptr);
