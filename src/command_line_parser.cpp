#include "command_line_parser.hpp"

#include <algorithm>
#include <cctype>
#include <stdexcept>

#include "log.hpp"

CommandLineParser::CommandLineParser(std::string process_name,
                                     nlohmann::json settings_spec,
                                     nlohmann::json argv_spec)
  : process_name_(std::move(process_name)),
    settings_spec_(std::move(settings_spec)),
    positional_specs_(build_positional_specs(argv_spec)) {}

std::vector<CommandLineParser::ArgvSpec> CommandLineParser::build_positional_specs(const nlohmann::json& spec) const {
  std::vector<ArgvSpec> result;
  for(const auto& entry : spec) {
    ArgvSpec out;
    out.index = entry.at("index").get<std::size_t>();
    out.key = entry.at("key").get<std::string>();
    result.push_back(std::move(out));
  }
  std::sort(result.begin(), result.end(),
            [](const ArgvSpec& a, const ArgvSpec& b){ return a.index < b.index; });

  SettingsManager scratch(settings_spec_);
  for(const auto& argv_entry : result) {
    if(!scratch.resolve_key(argv_entry.key)) {
      throw std::invalid_argument("positional argument refers to unknown setting '" + argv_entry.key + "'");
    }
  }
  return result;
}

bool CommandLineParser::is_option_token(const std::string& candidate) {
  if(candidate.rfind("--", 0) == 0) return true;
  return candidate.size() >= 2 && candidate[0] == '-' &&
         std::isalpha(static_cast<unsigned char>(candidate[1]));
}

bool CommandLineParser::is_bool_literal(const std::string& value) {
  std::string lowered = SettingsManager::to_lower(SettingsManager::trim_copy(value));
  return lowered == "true" || lowered == "false" ||
         lowered == "on" || lowered == "off" ||
         lowered == "1" || lowered == "0" ||
         lowered == "yes" || lowered == "no";
}

bool CommandLineParser::parse(int argc, char* argv[], SettingsManager& settings, std::string& error) const {
  std::vector<std::string> args;
  if(argc > 1 && argv) {
    args.assign(argv + 1, argv + argc);
  }
  return parse(args, settings, error);
}

bool CommandLineParser::parse(const std::vector<std::string>& args,
                              SettingsManager& settings,
                              std::string& error) const {
  error.clear();
  std::size_t positional_index = 0;

  for(std::size_t i = 0; i < args.size(); ++i) {
    const std::string& token = args[i];

    bool long_form = token.rfind("--", 0) == 0 && token.size() > 2;
    bool short_form = !long_form && token.size() > 1 && token[0] == '-' && token[1] != '-';
    if(long_form || short_form) {
      std::string name = token.substr(long_form ? 2 : 1);
      std::string inline_value;
      bool has_inline = false;
      if(auto eq = name.find('='); eq != std::string::npos) {
        inline_value = name.substr(eq + 1);
        name = name.substr(0, eq);
        has_inline = true;
      }

      auto resolved = settings.resolve_key(name);
      if(resolved) {
        std::string value;
        if(has_inline) {
          value = inline_value;
        } else if(settings.is_bool_setting(*resolved)) {
          if(i + 1 < args.size() && !is_option_token(args[i + 1]) && is_bool_literal(args[i + 1])) {
            value = args[++i];
          } else {
            value = "true";
          }
        } else {
          if(i + 1 >= args.size()) {
            error = "missing value for option '" + token + "'";
            return false;
          }
          value = args[++i];
        }
        std::string set_error;
        if(!settings.set_from_string(*resolved, value, set_error)) {
          error = "invalid value for option '" + token + "': " + set_error;
          return false;
        }
        continue;
      }
      if(long_form) {
        error = "unknown option " + token;
        return false;
      }
      // unknown short tokens fall through as positional values
    }

    if(positional_index >= positional_specs_.size()) {
      error = "unexpected argument '" + token + "'";
      return false;
    }
    const auto& spec = positional_specs_[positional_index++];
    std::string set_error;
    if(!settings.set_from_string(spec.key, token, set_error)) {
      error = "invalid value for " + spec.key + " '" + token + "': " + set_error;
      return false;
    }
  }
  return true;
}

void CommandLineParser::usage() const {
  print_out(nullptr, "{} - LAN clipboard sync node", process_name_);
  print_out(nullptr, "Usage:");

  std::string cmd = process_name_ + " [options]";
  for(const auto& pos : positional_specs_) {
    cmd += " [" + pos.key + "]";
  }
  print_out(nullptr, "  {}", cmd);
  print_out(nullptr, "");
  print_out(nullptr, "Options:");
  SettingsManager scratch(settings_spec_);
  for(const auto& line : scratch.describe()) {
    print_out(nullptr, "{}", line);
  }
  print_out(nullptr, "");
}
