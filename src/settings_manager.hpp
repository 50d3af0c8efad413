#pragma once

#include <algorithm>
#include <cctype>
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <optional>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "log.hpp"

// Every setting the node understands. "min"/"max" bound int and int_list
// values, "choices" restricts strings. Empty device_name/device_ip mean
// "detect from the host".
inline const nlohmann::json SETTINGS_SPECIFICATION = nlohmann::json::array({
  {{"key","device_name"},        {"aliases", {"name","n"}},        {"type","string"},   {"default",""},          {"description","Name announced to other devices (default: hostname)"}, {"persistent", true}},
  {{"key","device_ip"},          {"aliases", {"ip"}},              {"type","string"},   {"default",""},          {"description","Address announced to other devices (default: detected)"}, {"persistent", true}},
  {{"key","transport"},          {"aliases", {"t","mode"}},        {"type","string"},   {"default","udp"},       {"choices", {"udp","broadcast","websocket","ws"}}, {"description","Sync transport: udp or websocket"}, {"persistent", true}},
  {{"key","udp_port"},           {"aliases", {"port","p"}},        {"type","int"},      {"default",5555},        {"min",1}, {"max",65535}, {"description","UDP port to bind (tries higher ports when busy)"}, {"persistent", true}},
  {{"key","broadcast_ports"},    {"aliases", {"bp"}},              {"type","int_list"}, {"default",{5555,5556,5557,5558,5559}}, {"min",1}, {"max",65535}, {"description","Ports every UDP packet is also sent to (e.g. 5555-5559)"}, {"persistent", true}},
  {{"key","broadcast_addresses"},{"aliases", {"ba"}},              {"type","string_list"},{"default",nlohmann::json::array()}, {"description","Extra destination addresses for UDP packets"}, {"persistent", true}},
  {{"key","bind_attempts"},      {"aliases", {"attempts"}},        {"type","int"},      {"default",10},          {"min",1}, {"max",100}, {"description","Ports tried before giving up on bind"}, {"persistent", true}},
  {{"key","reuse_address"},      {"aliases", {"reuse"}},           {"type","bool"},     {"default",false},       {"description","Set SO_REUSEADDR on the UDP socket"}, {"persistent", true}},
  {{"key","discovery_port"},     {"aliases", {"dp"}},              {"type","int"},      {"default",8766},        {"min",1}, {"max",65535}, {"description","Side channel UDP port used by the websocket transport"}, {"persistent", true}},
  {{"key","websocket_port"},     {"aliases", {"wp","ws_port"}},    {"type","int"},      {"default",8765},        {"min",1}, {"max",65535}, {"description","WebSocket listen port"}, {"persistent", true}},
  {{"key","enable_discovery"},   {"aliases", {"discovery"}},       {"type","bool"},     {"default",true},        {"description","Locate websocket peers through the side channel"}, {"persistent", true}},
  {{"key","bootstrap_peer"},     {"aliases", {"bootstrap","peer"}},{"type","string"},   {"default",""},          {"description","WebSocket peer host:port dialled at start"}, {"persistent", true}},
  {{"key","heartbeat_interval"}, {"aliases", {"hb"}},              {"type","int"},      {"default",10000},       {"min",100}, {"max",3600000}, {"description","Milliseconds between heartbeats"}, {"persistent", true}},
  {{"key","sweep_interval"},     {"aliases", {"sweep"}},           {"type","int"},      {"default",2000},        {"min",50}, {"max",3600000}, {"description","Milliseconds between presence sweeps"}, {"persistent", true}},
  {{"key","device_timeout"},     {"aliases", {"timeout"}},         {"type","int"},      {"default",15000},       {"min",100}, {"max",86400000}, {"description","Milliseconds of silence before a device is dropped"}, {"persistent", true}},
  {{"key","dedup_capacity"},     {"aliases", {"dedup"}},           {"type","int"},      {"default",100},         {"min",1}, {"max",100000}, {"description","Clipboard messages remembered for duplicate suppression"}, {"persistent", true}},
  {{"key","history_capacity"},   {"aliases", {"history"}},         {"type","int"},      {"default",5},           {"min",1}, {"max",1000}, {"description","Clipboard entries kept in history"}, {"persistent", true}},
  {{"key","apply_remote"},       {"aliases", {"apply"}},           {"type","bool"},     {"default",true},        {"description","Write received content to the local clipboard"}, {"persistent", true}},
  {{"key","interactive"},        {"aliases", {"i","cli"}},         {"type","bool"},     {"default",true},        {"description","Run the interactive console"}, {"persistent", true}},
  {{"key","verbose"},            {"aliases", {"v"}},               {"type","bool"},     {"default",false},       {"description","Enable verbose logging"}, {"persistent", true}},
  {{"key","log_file"},           {"aliases", {"log"}},             {"type","string"},   {"default",""},          {"description","Also write log lines to this rotating file"}, {"persistent", true}},
  {{"key","help"},               {"aliases", {"h","?"}},           {"type","bool"},     {"default",false},       {"description","Show command help and exit"}, {"persistent", false}},
  {{"key","save"},               {"aliases", {"persist"}},         {"type","bool"},     {"default",false},       {"description","Persist current settings to disk"}, {"persistent", false}}
});

class SettingsManager {
public:
  SettingsManager();
  explicit SettingsManager(const nlohmann::json& specification);

  template<typename T>
  T get(const std::string& key) const;

  bool has(const std::string& key) const;

  bool set_from_string(const std::string& key, const std::string& value, std::string& error);
  bool set_from_json(const std::string& key, const nlohmann::json& value, std::string& error);

  bool save() const;
  bool load();
  bool save_to_file(const std::filesystem::path& path) const;
  bool load_from_file(const std::filesystem::path& path);

  bool save_requested() const { return has("save") && get<bool>("save"); }
  bool help_requested() const { return has("help") && get<bool>("help"); }

  std::vector<std::string> keys() const;
  std::string value_as_string(const std::string& key) const;
  std::optional<std::string> resolve_key(const std::string& token) const;
  bool is_bool_setting(const std::string& key) const;

  // One line per setting: key, aliases, type, default and description.
  std::vector<std::string> describe() const;

  std::filesystem::path settings_path() const;
  void set_settings_path(const std::filesystem::path& path);

  void set_json(const nlohmann::json& doc);
  nlohmann::json get_json(bool persistent_only = true) const;
  static std::string to_lower(std::string value);
  static std::string trim_copy(std::string value);
  static std::vector<std::string> split_list(const std::string& value);

private:
  struct SettingSpec {
    std::string key;
    std::vector<std::string> aliases;
    std::string normalized_key;
    std::string type;
    nlohmann::json default_value;
    std::string description;
    bool persistent = true;
    std::optional<long long> min;
    std::optional<long long> max;
    std::vector<std::string> choices;
  };

  static std::vector<SettingSpec> build_setting_specs(const nlohmann::json& specification);

  const SettingSpec* find_spec(const std::string& token) const;

  void apply_defaults();
  void merge_from_json(const nlohmann::json& doc);

  bool convert_and_store(const SettingSpec& spec, const nlohmann::json& value, std::string& error);
  bool check_range(const SettingSpec& spec, long long value, std::string& error) const;
  nlohmann::json parse_string_value(const SettingSpec& spec, const std::string& value, std::string& error) const;
  static bool parse_int(const std::string& text, long long& out, std::string& error);

  std::string default_to_string(const SettingSpec& spec) const;

  nlohmann::json settings_;
  std::vector<SettingSpec> setting_specs_;
  std::filesystem::path settings_path_override_;
};

// ---- implementation -------------------------------------------------------

inline std::vector<SettingsManager::SettingSpec> SettingsManager::build_setting_specs(const nlohmann::json& specification) {
  std::vector<SettingSpec> result;
  for(const auto& entry : specification) {
    SettingSpec spec;
    spec.key = entry.at("key").get<std::string>();
    spec.normalized_key = to_lower(spec.key);
    if(entry.contains("aliases")) {
      spec.aliases = entry.at("aliases").get<std::vector<std::string>>();
      for(auto& alias : spec.aliases) alias = to_lower(alias);
    }
    spec.type = entry.at("type").get<std::string>();
    spec.default_value = entry.at("default");
    spec.description = entry.value("description", "");
    spec.persistent = entry.value("persistent", true);
    if(entry.contains("min")) spec.min = entry.at("min").get<long long>();
    if(entry.contains("max")) spec.max = entry.at("max").get<long long>();
    if(entry.contains("choices")) spec.choices = entry.at("choices").get<std::vector<std::string>>();
    result.push_back(std::move(spec));
  }
  return result;
}

inline SettingsManager::SettingsManager()
  : SettingsManager(SETTINGS_SPECIFICATION) {}

inline SettingsManager::SettingsManager(const nlohmann::json& specification)
  : setting_specs_(build_setting_specs(specification)) {
  apply_defaults();
}

inline void SettingsManager::apply_defaults() {
  settings_ = nlohmann::json::object();
  for(const auto& spec : setting_specs_) {
    settings_[spec.key] = spec.default_value;
  }
}

inline const SettingsManager::SettingSpec* SettingsManager::find_spec(const std::string& token) const {
  std::string lowered = to_lower(token);
  for(const auto& spec : setting_specs_) {
    if(lowered == spec.normalized_key) return &spec;
    if(std::find(spec.aliases.begin(), spec.aliases.end(), lowered) != spec.aliases.end()) {
      return &spec;
    }
  }
  return nullptr;
}

inline bool SettingsManager::has(const std::string& key) const {
  return settings_.contains(key);
}

inline std::vector<std::string> SettingsManager::keys() const {
  std::vector<std::string> out;
  out.reserve(setting_specs_.size());
  for(const auto& spec : setting_specs_) out.push_back(spec.key);
  return out;
}

inline std::string SettingsManager::value_as_string(const std::string& key) const {
  if(!has(key)) return "<unknown>";
  const auto& value = settings_.at(key);
  if(value.is_string()) return value.get<std::string>();
  if(value.is_boolean()) return value.get<bool>() ? "true" : "false";
  if(value.is_array()) {
    std::string out;
    for(const auto& item : value) {
      if(!out.empty()) out += ",";
      out += item.is_string() ? item.get<std::string>() : item.dump();
    }
    return out;
  }
  return value.dump();
}

inline std::vector<std::string> SettingsManager::describe() const {
  std::vector<std::string> lines;
  for(const auto& spec : setting_specs_) {
    std::string names = "--" + spec.key;
    for(const auto& alias : spec.aliases) {
      names += (alias.size() == 1 ? ", -" : ", --") + alias;
    }
    lines.push_back(fmt::format("  {:<34} {:<11} {} (default: {})",
                                names, spec.type, spec.description, default_to_string(spec)));
  }
  return lines;
}

inline void SettingsManager::set_settings_path(const std::filesystem::path& path) {
  settings_path_override_ = path;
}

inline std::filesystem::path SettingsManager::settings_path() const {
  if(!settings_path_override_.empty()) {
    return settings_path_override_;
  }
  return std::filesystem::current_path() / ".config" / "settings.json";
}

inline bool SettingsManager::load() {
  return load_from_file(settings_path());
}

inline bool SettingsManager::save() const {
  return save_to_file(settings_path());
}

inline bool SettingsManager::load_from_file(const std::filesystem::path& path) {
  if(path.empty()) return false;
  std::ifstream in(path);
  if(!in) return false;
  try {
    nlohmann::json doc;
    in >> doc;
    merge_from_json(doc);
    return true;
  } catch(const nlohmann::json::exception& e) {
    print_err(nullptr, "Failed to parse {}: {}", path.string(), e.what());
    return false;
  }
}

inline bool SettingsManager::save_to_file(const std::filesystem::path& path) const {
  if(path.empty()) return false;
  std::error_code ec;
  if(path.has_parent_path()) {
    std::filesystem::create_directories(path.parent_path(), ec);
    if(ec) {
      print_err(nullptr, "Unable to create {}: {}", path.parent_path().string(), ec.message());
      return false;
    }
  }
  std::ofstream out(path);
  if(!out) {
    print_err(nullptr, "Unable to write {}", path.string());
    return false;
  }
  out << get_json(true).dump(2);
  return static_cast<bool>(out);
}

inline void SettingsManager::merge_from_json(const nlohmann::json& doc) {
  if(!doc.is_object()) return;
  for(const auto& item : doc.items()) {
    const auto* spec = find_spec(item.key());
    if(!spec) continue;
    std::string error;
    if(!convert_and_store(*spec, item.value(), error)) {
      print_err(nullptr, "Ignoring invalid setting '{}': {}", item.key(), error);
    }
  }
}

inline void SettingsManager::set_json(const nlohmann::json& doc) {
  merge_from_json(doc);
}

inline nlohmann::json SettingsManager::get_json(bool persistent_only) const {
  nlohmann::json doc = nlohmann::json::object();
  for(const auto& spec : setting_specs_) {
    if(persistent_only && !spec.persistent) continue;
    if(settings_.contains(spec.key)) {
      doc[spec.key] = settings_.at(spec.key);
    }
  }
  return doc;
}

inline bool SettingsManager::check_range(const SettingSpec& spec, long long value, std::string& error) const {
  if((spec.min && value < *spec.min) || (spec.max && value > *spec.max)) {
    error = fmt::format("{} is outside {}..{}", value,
                        spec.min ? std::to_string(*spec.min) : std::string("-inf"),
                        spec.max ? std::to_string(*spec.max) : std::string("inf"));
    return false;
  }
  return true;
}

inline bool SettingsManager::convert_and_store(const SettingSpec& spec,
                                               const nlohmann::json& value,
                                               std::string& error) {
  error.clear();
  if(spec.type == "bool") {
    if(value.is_boolean()) {
      settings_[spec.key] = value.get<bool>();
      return true;
    }
    if(value.is_number_integer()) {
      settings_[spec.key] = (value.get<long long>() != 0);
      return true;
    }
    error = "expected boolean";
    return false;
  }
  if(spec.type == "int") {
    if(!value.is_number_integer()) {
      error = "expected integer";
      return false;
    }
    const auto v = value.get<long long>();
    if(!check_range(spec, v, error)) return false;
    settings_[spec.key] = v;
    return true;
  }
  if(spec.type == "int_list") {
    if(!value.is_array()) {
      error = "expected a list of integers";
      return false;
    }
    nlohmann::json out = nlohmann::json::array();
    for(const auto& item : value) {
      if(!item.is_number_integer()) {
        error = "expected a list of integers";
        return false;
      }
      const auto v = item.get<long long>();
      if(!check_range(spec, v, error)) return false;
      out.push_back(v);
    }
    settings_[spec.key] = std::move(out);
    return true;
  }
  if(spec.type == "string_list") {
    if(!value.is_array() ||
       !std::all_of(value.begin(), value.end(), [](const auto& item){ return item.is_string(); })) {
      error = "expected a list of strings";
      return false;
    }
    settings_[spec.key] = value;
    return true;
  }
  if(spec.type == "string") {
    if(!value.is_string()) {
      error = "expected string";
      return false;
    }
    auto text = value.get<std::string>();
    if(!spec.choices.empty() &&
       std::find(spec.choices.begin(), spec.choices.end(), to_lower(text)) == spec.choices.end()) {
      std::string allowed;
      for(const auto& c : spec.choices) allowed += (allowed.empty() ? "" : "|") + c;
      error = "expected one of " + allowed;
      return false;
    }
    settings_[spec.key] = std::move(text);
    return true;
  }
  error = "unknown type";
  return false;
}

inline bool SettingsManager::parse_int(const std::string& text, long long& out, std::string& error) {
  try {
    std::size_t used = 0;
    out = std::stoll(text, &used);
    if(used != text.size()) {
      error = "'" + text + "' is not an integer";
      return false;
    }
    return true;
  } catch(const std::exception&) {
    error = "'" + text + "' is not an integer";
    return false;
  }
}

inline nlohmann::json SettingsManager::parse_string_value(const SettingSpec& spec,
                                                          const std::string& value,
                                                          std::string& error) const {
  error.clear();
  std::string clean = trim_copy(value);
  if(spec.type == "bool") {
    std::string v = to_lower(clean);
    if(v == "true" || v == "1" || v == "on" || v == "yes") return true;
    if(v == "false" || v == "0" || v == "off" || v == "no") return false;
    error = "expected boolean (true|false|on|off)";
    return {};
  }
  if(spec.type == "int") {
    long long v = 0;
    if(!parse_int(clean, v, error)) return {};
    return v;
  }
  if(spec.type == "int_list") {
    // "5555,5557" or "5555-5559"
    nlohmann::json out = nlohmann::json::array();
    for(const auto& item : split_list(clean)) {
      auto dash = item.find('-', 1);
      long long first = 0;
      long long last = 0;
      if(dash == std::string::npos) {
        if(!parse_int(item, first, error)) return {};
        last = first;
      } else if(!parse_int(trim_copy(item.substr(0, dash)), first, error) ||
                !parse_int(trim_copy(item.substr(dash + 1)), last, error)) {
        return {};
      }
      if(last < first || last - first > 1000) {
        error = "bad range '" + item + "'";
        return {};
      }
      for(long long v = first; v <= last; ++v) out.push_back(v);
    }
    return out;
  }
  if(spec.type == "string_list") {
    nlohmann::json out = nlohmann::json::array();
    for(const auto& item : split_list(clean)) out.push_back(item);
    return out;
  }
  if(spec.type == "string") {
    return clean;
  }
  error = "unsupported type";
  return {};
}

inline bool SettingsManager::set_from_string(const std::string& key,
                                             const std::string& value,
                                             std::string& error) {
  const auto* spec = find_spec(key);
  if(!spec) {
    error = "unknown setting";
    return false;
  }
  auto parsed = parse_string_value(*spec, value, error);
  if(!error.empty()) return false;
  return convert_and_store(*spec, parsed, error);
}

inline bool SettingsManager::set_from_json(const std::string& key,
                                           const nlohmann::json& value,
                                           std::string& error) {
  const auto* spec = find_spec(key);
  if(!spec) {
    error = "unknown setting";
    return false;
  }
  return convert_and_store(*spec, value, error);
}

inline std::string SettingsManager::to_lower(std::string value) {
  std::transform(value.begin(), value.end(), value.begin(),
                 [](unsigned char ch){ return static_cast<char>(std::tolower(ch)); });
  return value;
}

inline std::string SettingsManager::trim_copy(std::string value) {
  value.erase(value.begin(), std::find_if(value.begin(), value.end(),
    [](unsigned char ch){ return !std::isspace(ch); }));
  value.erase(std::find_if(value.rbegin(), value.rend(),
    [](unsigned char ch){ return !std::isspace(ch); }).base(), value.end());
  return value;
}

inline std::vector<std::string> SettingsManager::split_list(const std::string& value) {
  std::vector<std::string> out;
  std::stringstream ss(value);
  std::string item;
  while(std::getline(ss, item, ',')) {
    item = trim_copy(item);
    if(!item.empty()) out.push_back(item);
  }
  return out;
}

inline std::string SettingsManager::default_to_string(const SettingSpec& spec) const {
  if(spec.type == "bool") {
    return spec.default_value.get<bool>() ? "true" : "false";
  }
  if(spec.default_value.is_string()) {
    return spec.default_value.get<std::string>();
  }
  return spec.default_value.dump();
}

inline std::optional<std::string> SettingsManager::resolve_key(const std::string& token) const {
  if(const auto* spec = find_spec(token)) {
    return spec->key;
  }
  return std::nullopt;
}

inline bool SettingsManager::is_bool_setting(const std::string& key) const {
  const auto* spec = find_spec(key);
  return spec && spec->type == "bool";
}

template<typename T>
inline T SettingsManager::get(const std::string& key) const {
  if(!has(key)) {
    throw std::runtime_error("Unknown setting: " + key);
  }
  return settings_.at(key).get<T>();
}
