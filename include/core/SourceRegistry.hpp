#pragma once
/** @file  SourceRegistry.hpp
 *  @brief Runtime registry that maps acquisition backend names to creators.
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

#include <functional>
#include <memory>
#include <string>
#include <unordered_map>
#include <vector>

namespace vsweep::acq {
  class AcquisitionSource;
}

namespace vsweep::core {

  struct BoardConfig;

  /**
 * @class SourceRegistry
 * @brief Register & instantiate acquisition backends by string key.
 *
 *  * Keeps SystemCoordinator decoupled from concrete SDKs.
 *  * Creators are lambdas returning `unique_ptr<AcquisitionSource>`.
 */
  class SourceRegistry {
  public:
    using Creator = std::function<std::unique_ptr<acq::AcquisitionSource>(const BoardConfig&)>;

    /// Register a backend under \p name.  Returns false on duplicate.
    bool registerSource(const std::string& name, Creator maker);

    /// Create a fresh instance or throw `ConfigurationError` if unknown.
    std::unique_ptr<acq::AcquisitionSource> create(const std::string& name,
                                                   const BoardConfig& board) const;

    bool contains(const std::string& name) const { return creators_.count(name) != 0; }
    std::vector<std::string> names() const;

  private:
    std::unordered_map<std::string, Creator> creators_;
  };

  /// Registers every backend compiled into this build (LSL, BrainFlow).
  void registerBuiltinSources(SourceRegistry& registry);

} // namespace vsweep::core
