#pragma once

#include <string>
#include <vector>

#include "settings_manager.hpp"

// Applies argv on top of a SettingsManager. Accepted forms:
//   --key value, -alias value, --flag / --flag false for bools,
//   and positional values in argv_spec order (peer_ip first).
class CommandLineParser {
public:
  CommandLineParser(std::string process_name = "pairsync",
                    nlohmann::json settings_spec = SETTINGS_SPECIFICATION,
                    nlohmann::json argv_spec = nlohmann::json::array({
                      {{"index",0},{"key","peer_ip"}}
                    }));

  // Returns false with a human readable `error` on the first bad token.
  bool parse(int argc, char* argv[], SettingsManager& settings, std::string& error) const;
  void usage() const;

private:
  struct ArgvSpec {
    std::size_t index = 0;
    std::string key;
  };

  std::vector<ArgvSpec> build_positional_specs(const nlohmann::json& spec) const;
  static bool is_option_token(const std::string& candidate);
  static bool is_bool_literal(const std::string& value);

  std::string process_name_;
  nlohmann::json settings_spec_;
  std::vector<ArgvSpec> positional_specs_;
};
