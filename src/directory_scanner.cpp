#include "directory_scanner.hpp"

#include "errors.hpp"
#include "log.hpp"
#include "utils.hpp"

namespace {

FilesystemError listing_error(const std::filesystem::path& dir, const std::error_code& ec) {
  return FilesystemError("cannot list " + dir.string() + ": " + ec.message());
}

} // namespace

std::unordered_set<std::string> list_directory_names(const std::filesystem::path& dir) {
  std::unordered_set<std::string> names;
  std::error_code ec;
  std::filesystem::directory_iterator it(dir, ec);
  if(ec) throw listing_error(dir, ec);
  for(; it != std::filesystem::directory_iterator(); it.increment(ec)) {
    names.insert(it->path().filename().string());
  }
  if(ec) throw listing_error(dir, ec);
  return names;
}

MediaIndex compute_local_index(const std::filesystem::path& dir,
                               bool strict_names,
                               Logger* logger) {
  MediaIndex index;
  std::error_code ec;
  std::filesystem::directory_iterator it(dir, ec);
  if(ec) throw listing_error(dir, ec);
  for(; it != std::filesystem::directory_iterator(); it.increment(ec)) {
    const std::string name = it->path().filename().string();
    if(!looks_like_media_hash(name, strict_names)) continue;
    std::error_code type_ec;
    if(!it->is_regular_file(type_ec)) continue;
    print_out(logger, "\tHashing {}", name);
    index.add(sha1_file(it->path()));
  }
  if(ec) throw listing_error(dir, ec);
  return index;
}
