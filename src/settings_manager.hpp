#pragma once

#include <algorithm>
#include <cctype>
#include <cstddef>
#include <filesystem>
#include <fstream>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "log.hpp"

inline const nlohmann::json SETTINGS_SPECIFICATION = nlohmann::json::array({
  {{"key","peer_ip"},             {"aliases", {"ip","peer"}},            {"type","string"}, {"default",""},                   {"description","Address of the other peer"}, {"persistent", true}},
  {{"key","port"},                {"aliases", {"p"}},                    {"type","int"},    {"default",23333},                {"description","TCP port used both to connect and to listen"}, {"persistent", true}},
  {{"key","listen_ip"},           {"aliases", {"li"}},                   {"type","string"}, {"default","0.0.0.0"},            {"description","Interface/IP to bind when acting as server"}, {"persistent", true}},
  {{"key","receive_buffer_size"}, {"aliases", {"rbs","buffer"}},         {"type","int"},    {"default",104857600},            {"description","Largest single read of file content in bytes"}, {"persistent", true}},
  {{"key","share_dir"},           {"aliases", {"share"}},                {"type","string"}, {"default","./share"},            {"description","Directory kept in sync with the peer (relative)"}, {"persistent", true}},
  {{"key","record_file"},         {"aliases", {"record"}},               {"type","string"}, {"default","./sync_record.json"}, {"description","Transfer record (JSON)"}, {"persistent", true}},
  {{"key","accept_timeout_ms"},   {"aliases", {"accept_timeout","ato"}}, {"type","int"},    {"default",5000},                 {"description","How long to wait for the peer while listening during bootstrap"}, {"persistent", true}},
  {{"key","retry_delay_ms"},      {"aliases", {"retry_delay"}},          {"type","int"},    {"default",1000},                 {"description","Pause after failing to bind the listening port"}, {"persistent", true}},
  {{"key","round_interval_ms"},   {"aliases", {"interval","ri"}},        {"type","int"},    {"default",1000},                 {"description","Pause between two sync rounds on the client side"}, {"persistent", true}},
  {{"key","verbose"},             {"aliases", {"v"}},                    {"type","bool"},   {"default",false},                {"description","Enable verbose logging"}, {"persistent", true}},
  {{"key","help"},                {"aliases", {"h","?"}},                {"type","bool"},   {"default",false},                {"description","Show command help and exit"}, {"persistent", false}},
  {{"key","save"},                {"aliases", {"persist"}},              {"type","bool"},   {"default",false},                {"description","Persist current settings to disk"}, {"persistent", false}}
});

// Typed view over SETTINGS_SPECIFICATION. Values come from the defaults,
// then the settings file, then the command line (CommandLineParser).
class SettingsManager {
public:
  SettingsManager();
  explicit SettingsManager(const nlohmann::json& specification);

  template<typename T>
  T get(const std::string& key) const;

  // Parses `value` according to the setting's type. Accepts aliases.
  bool set_from_string(const std::string& key, const std::string& value, std::string& error);

  // Missing file is not an error; returns false in that case too.
  bool load();
  bool save() const;

  bool save_requested() const { return get<bool>("save"); }
  bool help_requested() const { return get<bool>("help"); }

  // Checks the values the sync process cannot run without. On failure
  // `error` names the offending setting.
  bool validate(std::string& error) const;

  std::vector<std::string> keys() const;
  std::string value_as_string(const std::string& key) const;
  std::optional<std::string> resolve_key(const std::string& token) const;
  bool is_bool_setting(const std::string& key) const;

  std::filesystem::path settings_path() const;
  void set_settings_path(const std::filesystem::path& path);

  static std::string to_lower(std::string value);
  static std::string trim_copy(std::string value);

private:
  enum class Type { Bool, Int, String };

  struct Entry {
    std::string key;
    std::vector<std::string> aliases;
    Type type = Type::String;
    bool persistent = true;
    nlohmann::json value;
  };

  static Type parse_type(const std::string& name);
  static std::vector<Entry> build_entries(const nlohmann::json& specification);
  const Entry* find(const std::string& token) const;
  Entry* find(const std::string& token);

  static bool accepts(Type type, const nlohmann::json& value);
  static std::optional<nlohmann::json> parse_text(Type type, const std::string& text, std::string& error);

  std::vector<Entry> entries_;
  std::filesystem::path settings_path_;
};

// ---- implementation -------------------------------------------------------

inline SettingsManager::Type SettingsManager::parse_type(const std::string& name) {
  if(name == "bool") return Type::Bool;
  if(name == "int") return Type::Int;
  if(name == "string") return Type::String;
  throw std::invalid_argument("unsupported setting type '" + name + "'");
}

inline std::vector<SettingsManager::Entry> SettingsManager::build_entries(const nlohmann::json& specification) {
  std::vector<Entry> entries;
  for(const auto& item : specification) {
    Entry entry;
    entry.key = item.at("key").get<std::string>();
    for(const auto& alias : item.value("aliases", std::vector<std::string>{})) {
      entry.aliases.push_back(to_lower(alias));
    }
    entry.type = parse_type(item.at("type").get<std::string>());
    entry.persistent = item.value("persistent", true);
    entry.value = item.at("default");
    entries.push_back(std::move(entry));
  }
  return entries;
}

inline SettingsManager::SettingsManager()
  : SettingsManager(SETTINGS_SPECIFICATION) {}

inline SettingsManager::SettingsManager(const nlohmann::json& specification)
  : entries_(build_entries(specification)) {}

inline const SettingsManager::Entry* SettingsManager::find(const std::string& token) const {
  const std::string wanted = to_lower(token);
  auto it = std::find_if(entries_.begin(), entries_.end(), [&](const Entry& entry){
    return to_lower(entry.key) == wanted ||
           std::find(entry.aliases.begin(), entry.aliases.end(), wanted) != entry.aliases.end();
  });
  return it == entries_.end() ? nullptr : &*it;
}

inline SettingsManager::Entry* SettingsManager::find(const std::string& token) {
  return const_cast<Entry*>(static_cast<const SettingsManager*>(this)->find(token));
}

inline bool SettingsManager::accepts(Type type, const nlohmann::json& value) {
  switch(type) {
    case Type::Bool: return value.is_boolean();
    case Type::Int: return value.is_number_integer();
    case Type::String: return value.is_string();
  }
  return false;
}

inline std::optional<nlohmann::json> SettingsManager::parse_text(Type type,
                                                                 const std::string& text,
                                                                 std::string& error) {
  const std::string clean = trim_copy(text);
  switch(type) {
    case Type::Bool: {
      const std::string v = to_lower(clean);
      if(v == "true" || v == "1" || v == "on" || v == "yes") return nlohmann::json(true);
      if(v == "false" || v == "0" || v == "off" || v == "no") return nlohmann::json(false);
      error = "expected boolean (true|false|on|off)";
      return std::nullopt;
    }
    case Type::Int: {
      try {
        std::size_t used = 0;
        int parsed = std::stoi(clean, &used);
        if(used != clean.size()) {
          error = "trailing characters after number";
          return std::nullopt;
        }
        return nlohmann::json(parsed);
      } catch(const std::logic_error&) {
        error = "expected integer";
        return std::nullopt;
      }
    }
    case Type::String:
      return nlohmann::json(clean);
  }
  error = "unsupported type";
  return std::nullopt;
}

inline bool SettingsManager::set_from_string(const std::string& key,
                                             const std::string& value,
                                             std::string& error) {
  auto* entry = find(key);
  if(!entry) {
    error = "unknown setting";
    return false;
  }
  auto parsed = parse_text(entry->type, value, error);
  if(!parsed) return false;
  entry->value = std::move(*parsed);
  return true;
}

inline std::filesystem::path SettingsManager::settings_path() const {
  if(!settings_path_.empty()) return settings_path_;
  return std::filesystem::current_path() / ".config" / "settings.json";
}

inline void SettingsManager::set_settings_path(const std::filesystem::path& path) {
  settings_path_ = path;
}

inline bool SettingsManager::load() {
  const auto path = settings_path();
  std::ifstream in(path);
  if(!in) return false;

  nlohmann::json doc;
  try {
    in >> doc;
  } catch(const nlohmann::json::exception& e) {
    print_err(nullptr, "Failed to parse {}: {}", path.string(), e.what());
    return false;
  }
  if(!doc.is_object()) {
    print_err(nullptr, "Ignoring {}: not a JSON object", path.string());
    return false;
  }
  for(const auto& item : doc.items()) {
    auto* entry = find(item.key());
    if(!entry || !entry->persistent) continue;
    if(!accepts(entry->type, item.value())) {
      print_err(nullptr, "Ignoring invalid setting '{}' in {}", item.key(), path.string());
      continue;
    }
    entry->value = item.value();
  }
  return true;
}

inline bool SettingsManager::save() const {
  const auto path = settings_path();
  std::error_code ec;
  if(path.has_parent_path()) {
    std::filesystem::create_directories(path.parent_path(), ec);
  }
  nlohmann::json doc = nlohmann::json::object();
  for(const auto& entry : entries_) {
    if(entry.persistent) doc[entry.key] = entry.value;
  }
  std::ofstream out(path, std::ios::trunc);
  if(!out) {
    print_err(nullptr, "Unable to write {}", path.string());
    return false;
  }
  out << doc.dump(2);
  return static_cast<bool>(out);
}

inline bool SettingsManager::validate(std::string& error) const {
  if(get<std::string>("peer_ip").empty()) {
    error = "peer_ip is required";
    return false;
  }
  int port = get<int>("port");
  if(port <= 0 || port > 65535) {
    error = "port must be within 1-65535 (got " + std::to_string(port) + ")";
    return false;
  }
  if(get<int>("receive_buffer_size") <= 0) {
    error = "receive_buffer_size must be positive";
    return false;
  }
  for(const char* key : {"accept_timeout_ms", "retry_delay_ms", "round_interval_ms"}) {
    if(get<int>(key) < 0) {
      error = std::string(key) + " must not be negative";
      return false;
    }
  }
  if(get<std::string>("record_file").empty()) {
    error = "record_file must be set";
    return false;
  }
  // share paths travel on the wire and the peer only accepts relative ones
  const std::filesystem::path share = get<std::string>("share_dir");
  if(share.empty() || share.is_absolute()) {
    error = "share_dir must be a relative path (got '" + share.string() + "')";
    return false;
  }
  for(const auto& part : share) {
    if(part == "..") {
      error = "share_dir must not contain '..' (got '" + share.string() + "')";
      return false;
    }
  }
  return true;
}

inline std::vector<std::string> SettingsManager::keys() const {
  std::vector<std::string> out;
  out.reserve(entries_.size());
  for(const auto& entry : entries_) out.push_back(entry.key);
  return out;
}

inline std::string SettingsManager::value_as_string(const std::string& key) const {
  const auto* entry = find(key);
  if(!entry) return "<unknown>";
  if(entry->value.is_string()) return entry->value.get<std::string>();
  if(entry->value.is_boolean()) return entry->value.get<bool>() ? "true" : "false";
  return entry->value.dump();
}

inline std::optional<std::string> SettingsManager::resolve_key(const std::string& token) const {
  if(const auto* entry = find(token)) return entry->key;
  return std::nullopt;
}

inline bool SettingsManager::is_bool_setting(const std::string& key) const {
  const auto* entry = find(key);
  return entry && entry->type == Type::Bool;
}

inline std::string SettingsManager::to_lower(std::string value) {
  std::transform(value.begin(), value.end(), value.begin(),
                 [](unsigned char ch){ return static_cast<char>(std::tolower(ch)); });
  return value;
}

inline std::string SettingsManager::trim_copy(std::string value) {
  auto not_space = [](unsigned char ch){ return !std::isspace(ch); };
  value.erase(value.begin(), std::find_if(value.begin(), value.end(), not_space));
  value.erase(std::find_if(value.rbegin(), value.rend(), not_space).base(), value.end());
  return value;
}

template<typename T>
inline T SettingsManager::get(const std::string& key) const {
  const auto* entry = find(key);
  if(!entry) {
    throw std::runtime_error("Unknown setting: " + key);
  }
  return entry->value.get<T>();
}
