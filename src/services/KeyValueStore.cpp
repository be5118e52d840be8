/* @file KeyValueStore.cpp
 * @brief shared_mutex over an in-memory JSON object mirrored to disk
 *
 * © 2025 Milo Medical — MIT-licensed.
 */

#include <filesystem>
#include <fstream>
#include <mutex>
#include <stdexcept>

#include "core/Logger.hpp"
#include "services/KeyValueStore.hpp"

using namespace genesis::services;

namespace {
  constexpr const char* kTag = "KeyValueStore";
}

KeyValueStore::KeyValueStore(std::string path, std::shared_ptr<core::Logger> logger)
    : path_(std::move(path)), logger_(std::move(logger)) {}

void KeyValueStore::load() {
  std::unique_lock<std::shared_mutex> lock(mtx_);
  std::ifstream in(path_);
  if (!in) {
    data_ = nlohmann::json::object();
    logger_->info(kTag, "no store at " + path_ + ", starting empty");
    return;
  }

  auto doc = nlohmann::json::parse(in, nullptr, false);
  if (doc.is_discarded() || !doc.is_object())
    throw std::runtime_error("[KeyValueStore] malformed store file: " + path_);
  data_ = std::move(doc);
  logger_->info(kTag, "loaded " + std::to_string(data_.size()) + " key(s) from " + path_);
}

bool KeyValueStore::put(const std::string& key, nlohmann::json value) {
  std::unique_lock<std::shared_mutex> lock(mtx_);
  auto previous = data_.contains(key) ? std::optional<nlohmann::json>(data_[key]) : std::nullopt;
  data_[key] = std::move(value);
  if (persistLocked())
    return true;

  if (previous)
    data_[key] = std::move(*previous);
  else
    data_.erase(key);
  return false;
}

std::optional<nlohmann::json> KeyValueStore::get(const std::string& key) const {
  std::shared_lock<std::shared_mutex> lock(mtx_);
  auto it = data_.find(key);
  if (it == data_.end())
    return std::nullopt;
  return *it;
}

bool KeyValueStore::erase(const std::string& key) {
  std::unique_lock<std::shared_mutex> lock(mtx_);
  auto it = data_.find(key);
  if (it == data_.end())
    return false;
  auto previous = std::move(*it);
  data_.erase(it);
  if (persistLocked())
    return true;
  data_[key] = std::move(previous);
  return false;
}

std::vector<std::string> KeyValueStore::keys() const {
  std::shared_lock<std::shared_mutex> lock(mtx_);
  std::vector<std::string> out;
  for (auto it = data_.begin(); it != data_.end(); ++it)
    out.push_back(it.key());
  return out;
}

std::size_t KeyValueStore::append(const std::string& key, nlohmann::json item) {
  std::unique_lock<std::shared_mutex> lock(mtx_);
  const bool created = !data_.contains(key);
  auto& slot = data_[key];
  if (slot.is_null())
    slot = nlohmann::json::array();
  if (!slot.is_array()) {
    logger_->warn(kTag, "append to non-array key '" + key + "'");
    return 0;
  }

  slot.push_back(std::move(item));
  if (persistLocked())
    return slot.size();

  slot.erase(slot.size() - 1);
  if (created)
    data_.erase(key);
  return 0;
}

bool KeyValueStore::persistLocked() const {
  namespace fs = std::filesystem;
  std::error_code ec;
  const fs::path target(path_);
  if (target.has_parent_path())
    fs::create_directories(target.parent_path(), ec);

  const std::string tmp = path_ + ".tmp";
  {
    std::ofstream out(tmp, std::ios::trunc);
    if (!out) {
      logger_->error(kTag, "cannot write " + tmp);
      return false;
    }
    // invalid UTF-8 from speech text is stored as U+FFFD rather than failing the write
    out << data_.dump(2, ' ', false, nlohmann::json::error_handler_t::replace);
    if (!out.flush()) {
      logger_->error(kTag, "short write to " + tmp);
      return false;
    }
  }

  fs::rename(tmp, target, ec);
  if (ec) {
    logger_->error(kTag, "cannot replace " + path_ + ": " + ec.message());
    return false;
  }
  return true;
}
