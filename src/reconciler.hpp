#pragma once
#include <cstddef>
#include <functional>
#include <string>
#include <unordered_set>
#include <vector>

class Logger;

struct ReconcileOptions {
  bool redownload = false;
  bool delete_unlisted = true;
  bool strict_names = false;
};

struct ReconcilePlan {
  std::vector<std::string> to_download; // index order, duplicates kept
  std::vector<std::string> to_delete;   // sorted
  std::size_t found_count = 0;
  std::size_t download_count = 0;
  std::size_t delete_count = 0;
};

using DownloadHandler = std::function<void(const std::string& hash)>;

// Single pass over the remote hashes. Each match is erased from local_names,
// so afterwards local_names holds exactly the entries no hash accounted for.
// on_download, when set, runs for each scheduled hash as soon as it is
// scheduled; an exception from it ends the pass.
ReconcilePlan plan_reconciliation(const std::vector<std::string>& remote_hashes,
                                  std::unordered_set<std::string>& local_names,
                                  const ReconcileOptions& options,
                                  Logger* logger = nullptr,
                                  const DownloadHandler& on_download = {});
