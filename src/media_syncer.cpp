#include "media_syncer.hpp"

#include <fstream>
#include <ostream>
#include <stdexcept>

#include "directory_scanner.hpp"
#include "errors.hpp"
#include "log.hpp"
#include "media_fetcher.hpp"
#include "media_index.hpp"
#include "progress_meter.hpp"
#include "reconciler.hpp"
#include "utils.hpp"

namespace {

// Streams into "<hash>.part"; only a complete body is renamed over the target.
void download_one(const std::string& url,
                  const std::filesystem::path& target,
                  const SyncOptions& options,
                  MediaFetcher& fetcher,
                  std::ostream& progress_out) {
  std::filesystem::path partial = target;
  partial += ".part";

  std::ofstream out;
  auto open_partial = [&]{
    if(out.is_open()) return;
    out.open(partial, std::ios::binary | std::ios::trunc);
    if(!out) throw FilesystemError("cannot open " + partial.string() + " for writing");
  };

  DownloadMeter meter(progress_out, "\tDownloading file", options.progress_meter_size, options.show_progress);
  try {
    fetcher.fetch_media(url,
      [&](std::optional<uint64_t> expected_length){
        open_partial();
        meter.start(expected_length);
      },
      [&](const char* data, std::size_t size){
        open_partial();
        out.write(data, static_cast<std::streamsize>(size));
        if(!out) throw FilesystemError("write failed: " + partial.string());
        meter.advance(size);
      });
    open_partial(); // empty body without a start callback
    out.close();
    if(!out) throw FilesystemError("write failed: " + partial.string());
  } catch(const std::exception&) {
    if(out.is_open()) out.close();
    std::error_code ignored;
    std::filesystem::remove(partial, ignored);
    throw;
  }
  meter.finish();

  std::error_code ec;
  std::filesystem::rename(partial, target, ec);
  if(ec) {
    std::error_code ignored;
    std::filesystem::remove(partial, ignored);
    throw FilesystemError("cannot move " + partial.string() + " to " + target.string() + ": " + ec.message());
  }
}

void delete_one(const std::filesystem::path& target) {
  std::error_code ec;
  if(std::filesystem::is_directory(std::filesystem::symlink_status(target, ec))) {
    throw FilesystemError("cannot delete " + target.string() + ": is a directory");
  }
  if(!std::filesystem::remove(target, ec) && ec) {
    throw FilesystemError("cannot delete " + target.string() + ": " + ec.message());
  }
}

} // namespace

SyncSummary run_media_sync(const SyncOptions& options,
                           MediaFetcher& fetcher,
                           Logger* logger,
                           std::ostream& progress_out) {
  if(options.media_index.empty()) {
    throw std::invalid_argument("media_index must not be empty");
  }
  const std::string base_url = ensure_trailing_slash(options.media_index);
  const auto& destination = options.destination;

  auto local_names = list_directory_names(destination);
  log_debug(logger, "{} entries in {}", local_names.size(), destination.string());

  const std::string index_bytes = fetcher.fetch_index(base_url + kMediaIndexFileName);
  const MediaIndex remote_index = MediaIndex::decode(index_bytes);
  log_debug(logger, "Remote index: {} bytes, {} hashes", index_bytes.size(), remote_index.size());

  ReconcileOptions reconcile;
  reconcile.redownload = options.redownload;
  reconcile.delete_unlisted = options.delete_unlisted;
  reconcile.strict_names = options.strict_names;
  // Each scheduled hash is fetched before the next one is processed.
  ReconcilePlan plan = plan_reconciliation(remote_index.hex_hashes(), local_names, reconcile, logger,
    [&](const std::string& hash){
      print_out(logger, "Downloading {}", hash);
      download_one(base_url + hash, destination / hash, options, fetcher, progress_out);
    });

  for(const auto& name : plan.to_delete) {
    print_out(logger, "Deleting {}", name);
    delete_one(destination / name);
  }

  const auto index_path = destination / kMediaIndexFileName;
  if(options.generate_index) {
    print_out(logger, "Generating {}", kMediaIndexFileName);
    MediaIndex local_index = compute_local_index(destination, options.strict_names, logger);
    write_binary_file(index_path, local_index.encode());
  } else {
    print_out(logger, "Writing remote {}", kMediaIndexFileName);
    write_binary_file(index_path, index_bytes);
  }

  SyncSummary summary;
  summary.found = plan.found_count;
  summary.downloaded = plan.download_count;
  summary.deleted = plan.delete_count;
  print_out(logger, "Done, found {}, downloaded {}, deleted {}",
            summary.found, summary.downloaded, summary.deleted);
  return summary;
}
