#pragma once
/** @file  KeyValueStore.hpp
 *  @brief JSON-file backed key/value storage shared with plugins.
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

#include <cstddef>
#include <memory>
#include <optional>
#include <shared_mutex>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

namespace genesis {
  namespace core {
    class Logger;
  }

  namespace services {

    /**
 * @class KeyValueStore
 * @brief Readers share the lock, writers take it exclusively.
 *
 *  * Every successful write rewrites the backing file (temp file + rename).
 *  * A write that cannot be persisted is rolled back in memory too.
 */
    class KeyValueStore {
    public:
      KeyValueStore(std::string path, std::shared_ptr<core::Logger> logger);

      /// Read the backing file. A missing file is an empty store.
      /// @throws std::runtime_error on malformed content.
      void load();

      bool put(const std::string& key, nlohmann::json value);
      std::optional<nlohmann::json> get(const std::string& key) const;
      bool erase(const std::string& key);
      std::vector<std::string> keys() const;

      /// Push \p item onto the array under \p key (created if absent).
      /// @returns the new array length, 0 if it could not be stored.
      std::size_t append(const std::string& key, nlohmann::json item);

      const std::string& path() const { return path_; }

    private:
      bool persistLocked() const;

      std::string path_;
      std::shared_ptr<core::Logger> logger_;
      mutable std::shared_mutex mtx_;
      nlohmann::json data_ = nlohmann::json::object();
    };

  } // namespace services
} // namespace genesis
