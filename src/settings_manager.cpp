#include "settings_manager.hpp"

#include <algorithm>
#include <cctype>
#include <fstream>

#include "errors.hpp"
#include "log.hpp"

namespace {

std::string lowered(std::string value) {
  std::transform(value.begin(), value.end(), value.begin(),
                 [](unsigned char ch){ return static_cast<char>(std::tolower(ch)); });
  return value;
}

std::string trimmed(const std::string& value) {
  auto first = std::find_if(value.begin(), value.end(),
                            [](unsigned char ch){ return !std::isspace(ch); });
  auto last = std::find_if(value.rbegin(), value.rend(),
                           [](unsigned char ch){ return !std::isspace(ch); }).base();
  return first < last ? std::string(first, last) : std::string();
}

SettingsManager::Type type_from_name(const std::string& name) {
  if(name == "bool") return SettingsManager::Type::Bool;
  if(name == "int") return SettingsManager::Type::Int;
  if(name == "string") return SettingsManager::Type::String;
  throw SettingsError("unsupported setting type '" + name + "'");
}

} // namespace

SettingsManager::SettingsManager(const nlohmann::json& table, Logger* logger)
  : settings_(parse_table(table)), logger_(logger) {
  for(const auto& setting : settings_) {
    values_[setting.key] = setting.default_value;
  }
}

std::vector<SettingsManager::Setting> SettingsManager::parse_table(const nlohmann::json& table) {
  std::vector<Setting> out;
  for(const auto& entry : table) {
    Setting setting;
    setting.key = entry.at("key").get<std::string>();
    for(const auto& alias : entry.value("aliases", std::vector<std::string>{})) {
      setting.aliases.push_back(lowered(alias));
    }
    setting.type = type_from_name(entry.at("type").get<std::string>());
    setting.default_value = entry.at("default");
    setting.description = entry.value("description", "");
    setting.persistent = entry.value("persistent", true);
    out.push_back(std::move(setting));
  }
  return out;
}

std::string SettingsManager::type_name(Type type) {
  switch(type) {
  case Type::Bool: return "bool";
  case Type::Int: return "int";
  case Type::String: return "string";
  }
  return "string";
}

const SettingsManager::Setting* SettingsManager::find(const std::string& token) const {
  const std::string wanted = lowered(token);
  for(const auto& setting : settings_) {
    if(lowered(setting.key) == wanted) return &setting;
    if(std::find(setting.aliases.begin(), setting.aliases.end(), wanted) != setting.aliases.end()) {
      return &setting;
    }
  }
  return nullptr;
}

const SettingsManager::Setting& SettingsManager::require(const std::string& key) const {
  const auto* setting = find(key);
  if(!setting) throw SettingsError("unknown setting '" + key + "'");
  return *setting;
}

std::optional<bool> SettingsManager::parse_bool(const std::string& text) {
  const std::string v = lowered(trimmed(text));
  if(v == "true" || v == "1" || v == "on" || v == "yes") return true;
  if(v == "false" || v == "0" || v == "off" || v == "no") return false;
  return std::nullopt;
}

nlohmann::json SettingsManager::coerce(const Setting& setting, const nlohmann::json& value) const {
  switch(setting.type) {
  case Type::Bool:
    if(value.is_boolean()) return value;
    if(value.is_number_integer()) return value.get<long long>() != 0;
    break;
  case Type::Int:
    if(value.is_number_integer()) return value;
    break;
  case Type::String:
    if(value.is_string()) return value;
    break;
  }
  throw SettingsError(setting.key + " expects " + type_name(setting.type) + ", got " + value.dump());
}

void SettingsManager::set(const std::string& key, const nlohmann::json& value) {
  const auto& setting = require(key);
  values_[setting.key] = coerce(setting, value);
}

void SettingsManager::set_text(const std::string& key, const std::string& text) {
  const auto& setting = require(key);
  const std::string clean = trimmed(text);
  switch(setting.type) {
  case Type::Bool: {
    auto parsed = parse_bool(clean);
    if(!parsed) throw SettingsError(setting.key + " expects true|false|on|off|yes|no, got '" + text + "'");
    values_[setting.key] = *parsed;
    return;
  }
  case Type::Int: {
    std::size_t used = 0;
    int parsed = 0;
    try {
      parsed = std::stoi(clean, &used);
    } catch(const std::logic_error&) {
      used = 0;
    }
    if(clean.empty() || used != clean.size()) {
      throw SettingsError(setting.key + " expects an integer, got '" + text + "'");
    }
    values_[setting.key] = parsed;
    return;
  }
  case Type::String:
    values_[setting.key] = clean;
    return;
  }
}

std::filesystem::path SettingsManager::settings_path() const {
  if(!path_override_.empty()) return path_override_;
  return std::filesystem::current_path() / ".config" / "media_sync.json";
}

bool SettingsManager::load() {
  const auto path = settings_path();
  std::ifstream in(path);
  if(!in) return false;

  nlohmann::json doc;
  try {
    in >> doc;
  } catch(const nlohmann::json::exception& e) {
    throw SettingsError("cannot parse " + path.string() + ": " + e.what());
  }
  if(!doc.is_object()) {
    throw SettingsError(path.string() + " does not hold a JSON object");
  }

  for(const auto& item : doc.items()) {
    const auto* setting = find(item.key());
    if(!setting || !setting->persistent) {
      log_warn(logger_, "Ignoring unknown setting '{}' in {}", item.key(), path.string());
      continue;
    }
    try {
      values_[setting->key] = coerce(*setting, item.value());
    } catch(const SettingsError& e) {
      log_warn(logger_, "Ignoring setting in {}: {}", path.string(), e.what());
    }
  }
  log_debug(logger_, "Loaded settings from {}", path.string());
  return true;
}

nlohmann::json SettingsManager::persistent_values() const {
  nlohmann::json doc = nlohmann::json::object();
  for(const auto& setting : settings_) {
    if(setting.persistent) doc[setting.key] = values_.at(setting.key);
  }
  return doc;
}

void SettingsManager::save() const {
  const auto path = settings_path();
  std::error_code ec;
  if(path.has_parent_path()) {
    std::filesystem::create_directories(path.parent_path(), ec);
    if(ec) throw FilesystemError("cannot create " + path.parent_path().string() + ": " + ec.message());
  }
  std::ofstream out(path, std::ios::trunc);
  if(!out) throw FilesystemError("cannot open " + path.string() + " for writing");
  out << persistent_values().dump(2) << "\n";
  out.close();
  if(!out) throw FilesystemError("write failed: " + path.string());
  log_debug(logger_, "Saved settings to {}", path.string());
}
