#pragma once

#include <string>
#include <vector>

#include "settings_manager.hpp"

// Maps argv onto settings: "--key value", "--key=value", "-alias value", and
// bare words filling `positional` keys in order. A bool option takes the next
// word only when it is a bool literal.
class CommandLineParser {
public:
  explicit CommandLineParser(std::string process_name = "snapsend",
                             std::vector<std::string> positional = {"mode", "device_name"},
                             nlohmann::json settings_spec = SETTINGS_SPECIFICATION);

  // On failure returns false with a message in error; settings already
  // applied stay applied.
  bool parse(int argc, const char* const argv[], SettingsManager& settings, std::string& error) const;
  void usage() const;

private:
  static bool is_option_token(const std::string& candidate);

  std::string process_name_;
  std::vector<std::string> positional_;
  nlohmann::json settings_spec_;
};
