/* @file SourceRegistry.cpp
 * @brief backend name -> creator table
 *
 * © 2025 Milo Medical — MIT-licensed.
 */

// STL headers
#include <algorithm>
#include <utility>

// VibroSweep headers
#include "acq/AcquisitionSource.hpp"
#include "core/Errors.hpp"
#include "core/SourceRegistry.hpp"

using namespace vsweep::core;

bool SourceRegistry::registerSource(const std::string& name, Creator maker) {
  if (!maker)
    return false;
  return creators_.emplace(name, std::move(maker)).second;
}

std::unique_ptr<vsweep::acq::AcquisitionSource>
SourceRegistry::create(const std::string& name, const BoardConfig& board) const {
  auto it = creators_.find(name);
  if (it == creators_.end()) {
    std::string known;
    for (const auto& n : names())
      known += (known.empty() ? "" : ", ") + n;
    throw ConfigurationError("acquisition backend '" + name + "' not available in this build" +
                             (known.empty() ? "" : " (built: " + known + ")"));
  }
  return it->second(board);
}

std::vector<std::string> SourceRegistry::names() const {
  std::vector<std::string> out;
  out.reserve(creators_.size());
  for (const auto& [name, creator] : creators_)
    out.push_back(name);
  std::sort(out.begin(), out.end());
  return out;
}
