/* @file ConfigLoader.cpp
 * @brief reads measurement / device documents from disk
 *
 * © 2025 Milo Medical — MIT-licensed.
 */

// STL headers
#include <fstream>
#include <sstream>
#include <utility>

// 3rd-party headers
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

// VibroSweep headers
#include "core/ConfigLoader.hpp"
#include "core/Errors.hpp"

using namespace vsweep::core;

ConfigLoader::ConfigLoader(std::string configPath) : path_(std::move(configPath)) {}

std::string ConfigLoader::text() const {
  std::ifstream in(path_, std::ios::binary);
  if (!in)
    throw ConfigurationError("[ConfigLoader] cannot open " + path_);

  std::ostringstream ss;
  ss << in.rdbuf();
  return ss.str();
}

nlohmann::json ConfigLoader::load() const {
  const std::string raw = text();
  spdlog::debug("[ConfigLoader] parsing {} ({} bytes)", path_, raw.size());

  try {
    return nlohmann::json::parse(raw);
  } catch (const nlohmann::json::parse_error& e) {
    throw ConfigurationError("[ConfigLoader] " + path_ + ": " + e.what());
  }
}
