#include "recorder.hpp"

#include <algorithm>
#include <fstream>
#include <stdexcept>

#include "utils.hpp"

void to_json(nlohmann::json& j, const TransferRecord& record) {
  j = nlohmann::json::object();
  j["ownership"] = record.ownership;
  if(record.mtime) {
    j["mtime"] = *record.mtime;
  }
}

void from_json(const nlohmann::json& j, TransferRecord& record) {
  record.ownership = j.value("ownership", false);
  if(j.contains("mtime") && j.at("mtime").is_number()) {
    record.mtime = j.at("mtime").get<double>();
  } else {
    record.mtime.reset();
  }
}

Recorder::Recorder(std::filesystem::path record_file,
                   std::filesystem::path share_dir,
                   std::shared_ptr<Logger> logger)
  : record_file_(std::move(record_file)),
    share_dir_(std::move(share_dir)),
    logger_(std::move(logger)) {
  load();
}

void Recorder::load() {
  records_.clear();
  std::ifstream in(record_file_);
  if(!in) {
    log_debug(logger_.get(), "No transfer record at {}, starting empty", record_file_.string());
    return;
  }
  nlohmann::json doc;
  try {
    in >> doc;
  } catch(const nlohmann::json::exception& e) {
    log_warn(logger_.get(), "Ignoring unreadable transfer record {}: {}", record_file_.string(), e.what());
    return;
  }
  if(!doc.is_object()) {
    log_warn(logger_.get(), "Ignoring transfer record {}: not a JSON object", record_file_.string());
    return;
  }
  for(const auto& item : doc.items()) {
    if(!item.value().is_object()) continue;
    records_[item.key()] = item.value().get<TransferRecord>();
  }
  log_debug(logger_.get(), "Loaded {} transfer record(s) from {}", records_.size(), record_file_.string());
}

void Recorder::persist() const {
  nlohmann::json doc = nlohmann::json::object();
  for(const auto& [path, record] : records_) {
    doc[path] = record;
  }

  auto tmp = record_file_;
  tmp += ".tmp";
  {
    std::ofstream out(tmp, std::ios::trunc);
    if(!out) {
      throw std::runtime_error("unable to write transfer record " + tmp.string());
    }
    out << doc.dump();
    out.flush();
    if(!out) {
      throw std::runtime_error("short write to transfer record " + tmp.string());
    }
  }
  std::error_code ec;
  std::filesystem::rename(tmp, record_file_, ec);
  if(ec) {
    throw std::runtime_error("unable to replace transfer record " + record_file_.string() + ": " + ec.message());
  }
}

bool Recorder::is_unsent(const std::string& path) const {
  if(std::filesystem::is_directory(path)) return false;

  auto it = records_.find(path);
  if(it == records_.end()) return true;

  const auto& record = it->second;
  if(record.mtime) {
    return file_mtime(path) != *record.mtime;
  }
  // Interrupted transfer: only the sender retries.
  return record.ownership;
}

void Recorder::set_ownership(const std::string& path, bool is_owner) {
  TransferRecord record;
  record.ownership = is_owner;
  records_[path] = record;
  persist();
}

void Recorder::add_record(const std::string& path) {
  auto it = records_.find(path);
  if(it == records_.end()) {
    throw std::runtime_error("no transfer record for " + path);
  }
  it->second.mtime = file_mtime(path);
  persist();
}

void Recorder::delete_record(const std::string& path) {
  records_.erase(path);
  persist();
}

std::optional<TransferRecord> Recorder::find(const std::string& path) const {
  auto it = records_.find(path);
  if(it == records_.end()) return std::nullopt;
  return it->second;
}

std::vector<std::string> Recorder::unsent_files() const {
  std::vector<std::string> out;
  if(!std::filesystem::is_directory(share_dir_)) {
    log_debug(logger_.get(), "Share directory {} does not exist", share_dir_.string());
    return out;
  }
  collect_unsent(share_dir_, out);
  return out;
}

void Recorder::collect_unsent(const std::filesystem::path& dir, std::vector<std::string>& out) const {
  std::vector<std::filesystem::path> subdirs;
  std::vector<std::filesystem::path> entries;
  for(const auto& entry : std::filesystem::directory_iterator(dir)) {
    if(entry.is_directory() && !entry.is_symlink()) {
      subdirs.push_back(entry.path());
    } else {
      entries.push_back(entry.path());
    }
  }
  std::sort(subdirs.begin(), subdirs.end());
  std::sort(entries.begin(), entries.end());

  for(const auto& sub : subdirs) {
    collect_unsent(sub, out);
  }
  // directories are part of the walk but is_unsent always rejects them
  entries.insert(entries.end(), subdirs.begin(), subdirs.end());
  for(const auto& path : entries) {
    auto key = path.generic_string();
    if(is_unsent(key)) out.push_back(std::move(key));
  }
}
