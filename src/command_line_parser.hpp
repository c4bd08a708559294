#pragma once

#include <stdexcept>
#include <string>
#include <vector>

#include "settings_manager.hpp"

class CommandLineError : public std::runtime_error {
public:
  explicit CommandLineError(const std::string& what) : std::runtime_error(what) {}
};

// Applies argv on top of a SettingsManager. Options are named after the
// settings table, positional arguments fill positional_keys in order.
class CommandLineParser {
public:
  explicit CommandLineParser(std::string process_name = "media_sync",
                             std::vector<std::string> positional_keys = {"media_index", "destination"});

  // Throws CommandLineError; the caller prints it together with usage().
  void parse(int argc, char* argv[], SettingsManager& settings) const;
  void parse(const std::vector<std::string>& args, SettingsManager& settings) const;

  void usage(const SettingsManager& settings) const;

private:
  void apply(SettingsManager& settings, const std::string& key, const std::string& text) const;

  std::string process_name_;
  std::vector<std::string> positional_keys_;
};
