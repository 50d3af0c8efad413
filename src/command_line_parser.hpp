#pragma once

#include <string>
#include <vector>

#include "settings_manager.hpp"

// Maps argv onto settings: "--key value", "-alias value", bare "--flag" for
// booleans, and positional arguments in the order given by argv_spec.
class CommandLineParser {
public:
  CommandLineParser(std::string process_name = "clipsync",
                    nlohmann::json settings_spec = SETTINGS_SPECIFICATION,
                    nlohmann::json argv_spec = nlohmann::json::array({
                      {{"index",0},{"key","device_name"}},
                      {{"index",1},{"key","transport"}},
                      {{"index",2},{"key","bootstrap_peer"}}
                    }));

  // Returns false with `error` set on the first bad argument; settings parsed
  // before it stay applied.
  bool parse(int argc, char* argv[], SettingsManager& settings, std::string& error) const;
  bool parse(const std::vector<std::string>& args, SettingsManager& settings, std::string& error) const;
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
