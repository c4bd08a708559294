#include "command_line_parser.hpp"

#include "log.hpp"

namespace {

bool looks_like_option(const std::string& token) {
  return token.size() > 1 && token[0] == '-';
}

} // namespace

CommandLineParser::CommandLineParser(std::string process_name,
                                     std::vector<std::string> positional_keys)
  : process_name_(std::move(process_name)),
    positional_keys_(std::move(positional_keys)) {}

void CommandLineParser::apply(SettingsManager& settings,
                              const std::string& key,
                              const std::string& text) const {
  try {
    settings.set_text(key, text);
  } catch(const SettingsError& e) {
    throw CommandLineError(std::string("Invalid value: ") + e.what());
  }
}

void CommandLineParser::parse(int argc, char* argv[], SettingsManager& settings) const {
  std::vector<std::string> args;
  if(argc > 1 && argv) args.assign(argv + 1, argv + argc);
  parse(args, settings);
}

void CommandLineParser::parse(const std::vector<std::string>& args, SettingsManager& settings) const {
  std::size_t next_positional = 0;
  bool options_done = false;

  for(std::size_t i = 0; i < args.size(); ++i) {
    const std::string& token = args[i];

    if(!options_done && token == "--") {
      options_done = true;
      continue;
    }

    if(!options_done && looks_like_option(token)) {
      const bool long_form = token.rfind("--", 0) == 0;
      std::string name = token.substr(long_form ? 2 : 1);
      std::optional<std::string> inline_value;
      if(long_form) {
        auto eq = name.find('=');
        if(eq != std::string::npos) {
          inline_value = name.substr(eq + 1);
          name.erase(eq);
        }
      }

      const auto* setting = settings.find(name);
      if(!setting && long_form && !inline_value && name.rfind("no-", 0) == 0) {
        const auto* negated = settings.find(name.substr(3));
        if(negated && negated->type == SettingsManager::Type::Bool) {
          settings.set(negated->key, false);
          continue;
        }
      }
      if(!setting) {
        throw CommandLineError("Unknown option " + token);
      }

      if(inline_value) {
        apply(settings, setting->key, *inline_value);
      } else if(setting->type == SettingsManager::Type::Bool) {
        // Flags never take the next argument; use --flag=false or --no-flag.
        settings.set(setting->key, true);
      } else {
        if(i + 1 >= args.size()) {
          throw CommandLineError("Missing value for option " + token);
        }
        apply(settings, setting->key, args[++i]);
      }
      continue;
    }

    if(next_positional >= positional_keys_.size()) {
      throw CommandLineError("Unexpected argument '" + token + "'");
    }
    apply(settings, positional_keys_[next_positional++], token);
  }
}

void CommandLineParser::usage(const SettingsManager& settings) const {
  std::string synopsis = process_name_ + " [options]";
  for(const auto& key : positional_keys_) synopsis += " <" + key + ">";

  print_out(nullptr, "{} - sync a directory with a remote media server", process_name_);
  print_out(nullptr, "Usage:");
  print_out(nullptr, "  {}", synopsis);
  print_out(nullptr, "");
  print_out(nullptr, "Options (values may also be given as --key=value):");
  for(const auto& setting : settings.settings()) {
    std::string option;
    std::string shown_default;
    if(setting.type == SettingsManager::Type::Bool) {
      option = "--" + setting.key + "/--no-" + setting.key;
      shown_default = setting.default_value.get<bool>() ? "true" : "false";
    } else {
      option = "--" + setting.key + " <" + SettingsManager::type_name(setting.type) + ">";
      shown_default = setting.default_value.is_string() ? setting.default_value.get<std::string>()
                                                         : setting.default_value.dump();
    }
    std::string aliases;
    for(const auto& alias : setting.aliases) {
      aliases += (aliases.empty() ? " (alias: -" : ", -") + alias;
    }
    if(!aliases.empty()) aliases += ")";
    print_out(nullptr, "  {:<40} {}{} (default: {})", option, setting.description, aliases, shown_default);
  }
  print_out(nullptr, "");
}
