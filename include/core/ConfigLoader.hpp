#pragma once
/** @file  ConfigLoader.hpp
 *  @brief Loads one configuration document (JSON) from the host FS.
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

#include <string>

#include <nlohmann/json_fwd.hpp>

namespace vsweep::core {

  /**
 * @class ConfigLoader
 * @brief Thin helper that reads a JSON file and hands the parsed object to the
 *        caller, keeping the verbatim text for the run metadata.
 *
 *  * No caching: every call to `load()` re-reads the file.
 *  * All schema validation lives in the calling layer (SweepConfig).
 */
  class ConfigLoader {
  public:
    /// @param configPath  Absolute or relative path on the host FS.
    explicit ConfigLoader(std::string configPath);

    /// Parse the file into a nlohmann::json object or throw `ConfigurationError`.
    nlohmann::json load() const;

    /// Verbatim file contents; throws `ConfigurationError` if unreadable.
    std::string text() const;

    const std::string& path() const { return path_; }

  private:
    std::string path_;
  };

} // namespace vsweep::core
