#pragma once

#include <filesystem>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

class Logger;

inline const nlohmann::json SETTINGS_SPECIFICATION = nlohmann::json::array({
  {{"key","media_index"},         {"aliases", {"url"}},     {"type","string"}, {"default",""},    {"description","Base URL of the remote media server"}, {"persistent", true}},
  {{"key","destination"},         {"aliases", {"dest"}},    {"type","string"}, {"default",""},    {"description","Local media directory (must exist)"}, {"persistent", true}},
  {{"key","delete"},              {"aliases", {"d"}},       {"type","bool"},   {"default",true},  {"description","Delete files not found in index.mth"}, {"persistent", true}},
  {{"key","generate"},            {"aliases", {"g"}},       {"type","bool"},   {"default",false}, {"description","Regenerate index.mth from local files instead of using the remote copy"}, {"persistent", true}},
  {{"key","redownload"},          {"aliases", {"r"}},       {"type","bool"},   {"default",false}, {"description","Re-download every file listed in index.mth"}, {"persistent", true}},
  {{"key","strict_names"},        {"aliases", {"strict"}},  {"type","bool"},   {"default",false}, {"description","Only treat names made of 40 lowercase hex digits as media files"}, {"persistent", true}},
  {{"key","timeout"},             {"aliases", {"t"}},       {"type","int"},    {"default",60},    {"description","Network timeout in seconds"}, {"persistent", true}},
  {{"key","progress"},            {"aliases", {"p"}},       {"type","bool"},   {"default",true},  {"description","Show a progress meter while downloading"}, {"persistent", true}},
  {{"key","progress_meter_size"}, {"aliases", {"meter"}},   {"type","int"},    {"default",40},    {"description","Width of the progress meter in characters"}, {"persistent", true}},
  {{"key","verbose"},             {"aliases", {"v"}},       {"type","bool"},   {"default",false}, {"description","Enable verbose logging"}, {"persistent", true}},
  {{"key","help"},                {"aliases", {"h","?"}},   {"type","bool"},   {"default",false}, {"description","Show command help and exit"}, {"persistent", false}},
  {{"key","save"},                {"aliases", {"persist"}}, {"type","bool"},   {"default",false}, {"description","Persist current settings to disk"}, {"persistent", false}}
});

class SettingsError : public std::runtime_error {
public:
  explicit SettingsError(const std::string& what) : std::runtime_error(what) {}
};

// Typed key/value store described by a JSON table, backed by a JSON file.
class SettingsManager {
public:
  enum class Type { Bool, Int, String };

  struct Setting {
    std::string key;
    std::vector<std::string> aliases; // lower-cased
    Type type = Type::String;
    nlohmann::json default_value;
    std::string description;
    bool persistent = true;
  };

  explicit SettingsManager(const nlohmann::json& table = SETTINGS_SPECIFICATION,
                           Logger* logger = nullptr);

  const std::vector<Setting>& settings() const { return settings_; }

  // Key or alias, case-insensitive.
  const Setting* find(const std::string& token) const;

  template<typename T>
  T get(const std::string& key) const {
    auto it = values_.find(key);
    if(it == values_.end()) throw SettingsError("unknown setting '" + key + "'");
    return it->get<T>();
  }

  // Both throw SettingsError for an unknown key or a value of the wrong type.
  void set(const std::string& key, const nlohmann::json& value);
  void set_text(const std::string& key, const std::string& text);

  bool help_requested() const { return get<bool>("help"); }
  bool save_requested() const { return get<bool>("save"); }

  // False when there is no settings file. Entries that do not fit the table
  // are skipped with a warning; unparsable JSON throws SettingsError.
  bool load();
  // Throws FilesystemError.
  void save() const;

  std::filesystem::path settings_path() const;
  void set_settings_path(const std::filesystem::path& path) { path_override_ = path; }

  nlohmann::json persistent_values() const;

  static std::optional<bool> parse_bool(const std::string& text);
  static std::string type_name(Type type);

private:
  static std::vector<Setting> parse_table(const nlohmann::json& table);
  const Setting& require(const std::string& key) const;
  nlohmann::json coerce(const Setting& setting, const nlohmann::json& value) const;

  std::vector<Setting> settings_;
  nlohmann::json values_ = nlohmann::json::object();
  std::filesystem::path path_override_;
  Logger* logger_ = nullptr;
};
