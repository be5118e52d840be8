/* @file PluginRegistry.cpp
 * @brief ordered creator table, resource-checked instantiation, intent lookup
 *
 * © 2025 Milo Medical — MIT-licensed.
 */

#include <stdexcept>

#include "core/Logger.hpp"
#include "core/PluginRegistry.hpp"

using namespace genesis::core;

namespace {
  constexpr const char* kTag = "PluginRegistry";
}

PluginRegistry::PluginRegistry(std::shared_ptr<Logger> logger) : logger_(std::move(logger)) {}

bool PluginRegistry::registerPlugin(const std::string& name, std::vector<plugins::Resource> required,
                                    Creator maker) {
  if (!maker || entry(name))
    return false;
  entries_.push_back({ name, std::move(required), std::move(maker) });
  return true;
}

std::unique_ptr<genesis::plugins::Plugin>
PluginRegistry::create(const std::string& name, const plugins::SharedResources& available) const {
  const Entry* e = entry(name);
  if (!e)
    throw std::out_of_range("[PluginRegistry] unknown plugin: " + name);
  for (auto r : e->required)
    if (!available.has(r))
      throw std::runtime_error("[PluginRegistry] " + name + " requires unavailable resource " +
                               plugins::toString(r));
  return e->maker(available.filtered(e->required));
}

std::size_t PluginRegistry::instantiate(const plugins::SharedResources& available) {
  live_.clear();
  for (const auto& e : entries_) {
    try {
      auto plugin = create(e.name, available);
      if (!plugin) {
        logger_->warn(kTag, "creator for '" + e.name + "' returned nothing");
        continue;
      }
      logger_->info(kTag, "loaded plugin '" + plugin->name() + "': " + plugin->description());
      live_.push_back(std::move(plugin));
    } catch (const std::exception& ex) {
      logger_->error(kTag, "skipping plugin '" + e.name + "': " + ex.what());
    }
  }
  return live_.size();
}

genesis::plugins::Plugin* PluginRegistry::findSupporter(const std::string& intent) const {
  for (const auto& p : live_)
    if (p->supportsIntent(intent))
      return p.get();
  return nullptr;
}

std::vector<std::string> PluginRegistry::registeredNames() const {
  std::vector<std::string> out;
  out.reserve(entries_.size());
  for (const auto& e : entries_)
    out.push_back(e.name);
  return out;
}

const PluginRegistry::Entry* PluginRegistry::entry(const std::string& name) const {
  for (const auto& e : entries_)
    if (e.name == name)
      return &e;
  return nullptr;
}
