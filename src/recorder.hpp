#pragma once
#include <filesystem>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "log.hpp"

// Transfer state of one path. A record with no mtime marks a transfer that
// started but never completed.
struct TransferRecord {
  bool ownership = false;
  std::optional<double> mtime;
};

void to_json(nlohmann::json& j, const TransferRecord& record);
void from_json(const nlohmann::json& j, TransferRecord& record);

// Persistent path -> TransferRecord map backing the "what needs sending"
// decision. Every mutation rewrites the record file as a whole through a
// temporary file and a rename, so the file on disk always matches the last
// completed mutation.
//
// Paths are used verbatim as keys, e.g. "./share/docs/a.txt".
class Recorder {
public:
  Recorder(std::filesystem::path record_file,
           std::filesystem::path share_dir,
           std::shared_ptr<Logger> logger = nullptr);

  // Directories are never unsent. Files are unsent when they have no
  // record, when their mtime moved since the last completed transfer, or
  // when an unfinished transfer was ours to send.
  bool is_unsent(const std::string& path) const;

  void set_ownership(const std::string& path, bool is_owner);

  // Stamps the current mtime of `path` on its existing record.
  // Throws std::runtime_error if there is no record for it.
  void add_record(const std::string& path);

  void delete_record(const std::string& path);

  // Bottom-up walk of the share directory: a directory's subdirectories
  // come before its own files, siblings in sorted order.
  std::vector<std::string> unsent_files() const;

  std::optional<TransferRecord> find(const std::string& path) const;
  std::size_t size() const { return records_.size(); }

  const std::filesystem::path& record_file() const { return record_file_; }
  const std::filesystem::path& share_dir() const { return share_dir_; }

private:
  void load();
  void persist() const;
  void collect_unsent(const std::filesystem::path& dir, std::vector<std::string>& out) const;

  std::filesystem::path record_file_;
  std::filesystem::path share_dir_;
  std::map<std::string, TransferRecord> records_;
  std::shared_ptr<Logger> logger_;
};
