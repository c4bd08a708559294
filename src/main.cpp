#include <cpptrace/cpptrace.hpp>

#include <chrono>
#include <filesystem>
#include <iostream>

#include "command_line_parser.hpp"
#include "errors.hpp"
#include "log.hpp"
#include "media_fetcher.hpp"
#include "media_syncer.hpp"
#include "settings_manager.hpp"

namespace {

SyncOptions options_from_settings(const SettingsManager& settings) {
  SyncOptions options;
  options.media_index = settings.get<std::string>("media_index");
  options.destination = settings.get<std::string>("destination");
  options.delete_unlisted = settings.get<bool>("delete");
  options.generate_index = settings.get<bool>("generate");
  options.redownload = settings.get<bool>("redownload");
  options.strict_names = settings.get<bool>("strict_names");
  options.show_progress = settings.get<bool>("progress");
  int meter = settings.get<int>("progress_meter_size");
  options.progress_meter_size = meter > 0 ? static_cast<std::size_t>(meter) : 1;
  return options;
}

} // namespace

int main(int argc, char** argv){
  init(false);
  Logger logger("media_sync");
  CommandLineParser parser((argc > 0 && argv && argv[0])
                             ? std::filesystem::path(argv[0]).filename().string()
                             : "media_sync");
  SettingsManager settings(SETTINGS_SPECIFICATION, &logger);
  try {
    settings.load();
    parser.parse(argc, argv, settings);
    if(settings.help_requested()) {
      parser.usage(settings);
      return 0;
    }

    init(settings.get<bool>("verbose"));
    logger.debug("Verbose logging enabled");

    if(settings.save_requested()) {
      try {
        settings.save();
        logger.info("Settings saved to {}", settings.settings_path().string());
      } catch(const FilesystemError& e) {
        logger.error("Unable to persist settings: {}", e.what());
      }
    }

    auto options = options_from_settings(settings);
    if(options.media_index.empty() || options.destination.empty()) {
      throw CommandLineError("Both media_index and destination are required");
    }
    int timeout_value = settings.get<int>("timeout");
    if(timeout_value <= 0) {
      throw CommandLineError("Invalid timeout '" + std::to_string(timeout_value) + "'");
    }

    HttpMediaFetcher fetcher(std::chrono::seconds(timeout_value), &logger);
    run_media_sync(options, fetcher, &logger, std::cout);
    return 0;
  } catch(const CommandLineError& e) {
    print_err(nullptr, "{}", e.what());
    parser.usage(settings);
    return 1;
  } catch(const SettingsError& e) {
    logger.error("Settings error: {}", e.what());
    return 1;
  } catch(const IndexFormatError& e) {
    logger.error("{}", e.what());
    return 1;
  } catch(const TransportError& e) {
    logger.error("Network error: {}", e.what());
    return 1;
  } catch(const FilesystemError& e) {
    logger.error("Filesystem error: {}", e.what());
    return 1;
  } catch(const std::exception& e) {
    logger.error("Exception: {}", e.what());
    cpptrace::generate_trace().print();
    return 1;
  }
}
