#pragma once
/** @file  PluginRegistry.hpp
 *  @brief Build-time registry that maps plugin names to creators.
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

#include <functional>
#include <memory>
#include <string>
#include <vector>

#include "plugins/Plugin.hpp"

namespace genesis::core {

  class Logger;

  /**
 * @class PluginRegistry
 * @brief Register & instantiate plugin objects by string key.
 *
 *  * Keeps the orchestrator decoupled from concrete plugins.
 *  * Creators only see the resources declared at registration.
 *  * Intent lookup scans live plugins in registration order; first match wins.
 *  * Populated at start-up; read-only while turns run.
 */
  class PluginRegistry {
  public:
    using Creator = std::function<std::unique_ptr<plugins::Plugin>(const plugins::SharedResources&)>;

    explicit PluginRegistry(std::shared_ptr<Logger> logger);

    /// Register a plugin under \p name.  Returns false on duplicate.
    bool registerPlugin(const std::string& name, std::vector<plugins::Resource> required,
                        Creator maker);

    /// Create a fresh instance or throw `std::out_of_range` if unknown.
    std::unique_ptr<plugins::Plugin> create(const std::string& name,
                                            const plugins::SharedResources& available) const;

    /// Create every registered plugin whose resources are available.
    /// @returns number of live plugins.
    std::size_t instantiate(const plugins::SharedResources& available);

    /// First live plugin declaring \p intent; nullptr if none does.
    plugins::Plugin* findSupporter(const std::string& intent) const;

    const std::vector<std::unique_ptr<plugins::Plugin>>& plugins() const { return live_; }
    std::vector<std::string> registeredNames() const;

  private:
    struct Entry {
      std::string name;
      std::vector<plugins::Resource> required;
      Creator maker;
    };

    const Entry* entry(const std::string& name) const;

    std::shared_ptr<Logger> logger_;
    std::vector<Entry> entries_; ///< registration order
    std::vector<std::unique_ptr<plugins::Plugin>> live_;
  };

} // namespace genesis::core
