/* @file Plugin.cpp
 * @brief resource naming and per-plugin resource filtering
 *
 * © 2025 Milo Medical — MIT-licensed.
 */

#include <algorithm>

#include "plugins/Plugin.hpp"

using namespace genesis::plugins;

const char* genesis::plugins::toString(Resource resource) {
  switch (resource) {
  case Resource::Storage:
    return "storage";
  case Resource::Scheduler:
    return "scheduler";
  case Resource::HardwareLink:
    return "hardwareLink";
  case Resource::Settings:
    return "settings";
  case Resource::MainLoop:
    return "mainLoopHandle";
  }
  return "unknown";
}

bool SharedResources::has(Resource resource) const {
  switch (resource) {
  case Resource::Storage:
    return storage != nullptr;
  case Resource::Scheduler:
    return scheduler != nullptr;
  case Resource::HardwareLink:
    return hardwareLink != nullptr;
  case Resource::Settings:
    return settings != nullptr;
  case Resource::MainLoop:
    return mainLoop != nullptr;
  }
  return false;
}

SharedResources SharedResources::filtered(const std::vector<Resource>& declared) const {
  auto wants = [&](Resource r) { return std::find(declared.begin(), declared.end(), r) != declared.end(); };

  SharedResources out;
  if (wants(Resource::Storage))
    out.storage = storage;
  if (wants(Resource::Scheduler))
    out.scheduler = scheduler;
  if (wants(Resource::HardwareLink))
    out.hardwareLink = hardwareLink;
  if (wants(Resource::Settings))
    out.settings = settings;
  if (wants(Resource::MainLoop))
    out.mainLoop = mainLoop;
  return out;
}
