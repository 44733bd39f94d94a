#include "command_line_parser.hpp"

#include <cctype>
#include <sstream>
#include <stdexcept>

#include "log.hpp"

CommandLineParser::CommandLineParser(std::string process_name,
                                     std::vector<std::string> positional,
                                     nlohmann::json settings_spec)
  : process_name_(std::move(process_name)),
    positional_(std::move(positional)),
    settings_spec_(std::move(settings_spec)) {
  SettingsManager probe(settings_spec_);
  for(const auto& key : positional_) {
    if(!probe.resolve_key(key)) {
      throw std::runtime_error("positional argument maps to unknown setting '" + key + "'");
    }
  }
}

bool CommandLineParser::is_option_token(const std::string& candidate) {
  if(candidate.rfind("--", 0) == 0) return true;
  return candidate.size() >= 2 && candidate[0] == '-' &&
         std::isalpha(static_cast<unsigned char>(candidate[1]));
}

bool CommandLineParser::parse(int argc, const char* const argv[],
                              SettingsManager& settings, std::string& error) const {
  std::vector<std::string> args;
  if(argc > 1 && argv) args.assign(argv + 1, argv + argc);
  std::size_t positional_index = 0;
  error.clear();

  for(std::size_t i = 0; i < args.size(); ++i) {
    const std::string& token = args[i];

    if(is_option_token(token)) {
      const bool long_form = token.rfind("--", 0) == 0;
      std::string key_token = token.substr(long_form ? 2 : 1);
      std::string inline_value;
      bool has_inline = false;
      auto eq = key_token.find('=');
      if(long_form && eq != std::string::npos) {
        inline_value = key_token.substr(eq + 1);
        key_token = key_token.substr(0, eq);
        has_inline = true;
      }
      auto resolved = settings.resolve_key(key_token);
      if(!resolved) {
        error = "Unknown option " + token;
        return false;
      }

      std::string value;
      if(has_inline) {
        value = inline_value;
      } else if(settings.is_bool_setting(*resolved)) {
        if(i + 1 < args.size() && SettingsManager::is_bool_literal(args[i + 1])) {
          value = args[++i];
        } else {
          value = "true";
        }
      } else {
        if(i + 1 >= args.size()) {
          error = "Missing value for option '" + token + "'";
          return false;
        }
        value = args[++i];
      }
      std::string set_error;
      if(!settings.set_from_string(*resolved, value, set_error)) {
        error = "Invalid value for option '" + token + "': " + set_error;
        return false;
      }
      continue;
    }

    if(positional_index >= positional_.size()) {
      error = "Unexpected positional argument '" + token + "'";
      return false;
    }
    const auto& key = positional_[positional_index++];
    std::string set_error;
    if(!settings.set_from_string(key, token, set_error)) {
      error = "Invalid value for " + key + " '" + token + "': " + set_error;
      return false;
    }
  }
  return true;
}

void CommandLineParser::usage() const {
  print_out(nullptr, "{} - share files and clipboard text between nearby devices", process_name_);
  print_out(nullptr, "Usage:");
  std::string cmd = process_name_;
  for(const auto& key : positional_) cmd += " [" + key + "]";
  print_out(nullptr, "  {} [options]", cmd);
  print_out(nullptr, "");
  print_out(nullptr, "Options:");
  for(const auto& entry : settings_spec_) {
    const auto key = entry.at("key").get<std::string>();
    const auto type = entry.at("type").get<std::string>();
    std::string hint = type == "bool" ? "[true|false]" : "<" + type + ">";
    if(entry.contains("choices")) {
      hint.clear();
      for(const auto& c : entry.at("choices")) {
        hint += (hint.empty() ? "" : "|") + c.get<std::string>();
      }
    }
    std::ostringstream aliases;
    const auto alias_list = entry.value("aliases", nlohmann::json::array());
    for(std::size_t i = 0; i < alias_list.size(); ++i) {
      aliases << (i == 0 ? " (alias: " : ", ") << "-" << alias_list[i].get<std::string>();
    }
    if(!alias_list.empty()) aliases << ")";
    const auto& def = entry.at("default");
    std::string default_str = def.is_string() ? def.get<std::string>()
                            : def.is_boolean() ? (def.get<bool>() ? "true" : "false")
                            : def.dump();
    print_out(nullptr, "  --{:<26} {:<30} {}{} (default: {})",
              key, hint, entry.value("description", ""), aliases.str(), default_str);
  }
  print_out(nullptr, "");
}
