#include "reconciler.hpp"

#include <algorithm>

#include "log.hpp"
#include "utils.hpp"

ReconcilePlan plan_reconciliation(const std::vector<std::string>& remote_hashes,
                                  std::unordered_set<std::string>& local_names,
                                  const ReconcileOptions& options,
                                  Logger* logger,
                                  const DownloadHandler& on_download) {
  ReconcilePlan plan;

  for(const auto& hash : remote_hashes) {
    ++plan.found_count;
    print_out(logger, "Processing {}", hash);

    auto it = local_names.find(hash);
    if(it != local_names.end()) {
      print_out(logger, "\tFile found in directory");
      local_names.erase(it);
      if(!options.redownload) continue;
    }

    plan.to_download.push_back(hash);
    ++plan.download_count;
    if(on_download) on_download(hash);
  }

  if(options.delete_unlisted) {
    for(const auto& name : local_names) {
      if(!looks_like_media_hash(name, options.strict_names)) continue;
      plan.to_delete.push_back(name);
    }
    std::sort(plan.to_delete.begin(), plan.to_delete.end());
    plan.delete_count = plan.to_delete.size();
  }

  log_debug(logger, "Plan: {} listed, {} to download, {} to delete",
            plan.found_count, plan.download_count, plan.delete_count);
  return plan;
}
