#pragma once

#include <cstddef>
#include <filesystem>
#include <iosfwd>
#include <string>

class Logger;
class MediaFetcher;

struct SyncOptions {
  std::string media_index;            // base URL, trailing '/' added if missing
  std::filesystem::path destination;  // must already exist
  bool delete_unlisted = true;
  bool generate_index = false;
  bool redownload = false;
  bool strict_names = false;
  bool show_progress = true;
  std::size_t progress_meter_size = 40;
};

struct SyncSummary {
  std::size_t found = 0;
  std::size_t downloaded = 0;
  std::size_t deleted = 0;
};

// One full pass: fetch index, reconcile, download, delete, write index.mth.
// Throws IndexFormatError, TransportError or FilesystemError; nothing is
// retried and files fetched before a failure stay on disk.
SyncSummary run_media_sync(const SyncOptions& options,
                           MediaFetcher& fetcher,
                           Logger* logger,
                           std::ostream& progress_out);
