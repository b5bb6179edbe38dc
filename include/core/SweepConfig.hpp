#pragma once
/** @file  SweepConfig.hpp
 *  @brief Validated, immutable view of the measurement and device documents.
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

// STL headers
#include <cstddef>
#include <filesystem>
#include <optional>
#include <string>

#include <nlohmann/json_fwd.hpp>

namespace vsweep {
  namespace core {

    /// One swept dimension: {start, start+step, ...} up to the last value <= end.
    struct SweepRange {
      int start{ 0 };
      int end{ 0 };
      int step{ 1 };
    };

    /// Optional firmware timing block; absent keys are never sent.
    struct StimulusTiming {
      std::optional<int> duration;
      std::optional<int> cyclePeriod;
      std::optional<int> pauseCyclePeriod;
      std::optional<int> pausedCycles;
      std::optional<int> jitter;
    };

    struct MeasurementProtocol {
      SweepRange channel;
      SweepRange frequency;
      SweepRange volume;
      int cycles{ 1 };
      double durationOn{ 0.0 };  ///< seconds
      double durationOff{ 0.0 }; ///< seconds
      double baseline1{ 0.0 };   ///< seconds
      double baseline2{ 0.0 };   ///< seconds
      double baseline3{ 0.0 };   ///< seconds
      StimulusTiming stimulus;
    };

    /// `Board` section of the device document.
    struct BoardConfig {
      std::string id;
      std::optional<std::string> master;
      std::optional<std::string> mac;
      std::optional<std::string> file;
      std::optional<std::string> serial;
      std::optional<std::string> streamName;
      bool keepAlive{ false };
      std::size_t channels{ 33 }; ///< columns per recorded row

      /// "lsl" when a stream name is configured, "brainflow" otherwise.
      std::string backendName() const;
    };

    struct DeviceConfig {
      BoardConfig board;
      std::string stimulatorPort; ///< `VHP.Serial`
    };

    /**
 * @class SweepConfig
 * @brief Immutable run configuration (created once at startup).
 *
 *  * Throws `ConfigurationError` naming the offending key path on any missing
 *    key, wrong type, or invalid range.
 *  * Keeps the verbatim documents for the metadata summary.
 */
    class SweepConfig {
    public:
      SweepConfig(MeasurementProtocol protocol, DeviceConfig device, std::string measurementText,
                  std::string deviceText, std::filesystem::path outputDir, std::string timestamp);

      /// Read, parse and validate both documents from disk.
      static SweepConfig load(const std::string& measurementPath, const std::string& devicePath,
                              const std::filesystem::path& outputDir);

      static MeasurementProtocol parseMeasurement(const nlohmann::json& doc);
      /// `Board` block only; shared with the stream bridge, which has no stimulator.
      static BoardConfig parseBoard(const nlohmann::json& doc);
      static DeviceConfig parseDevice(const nlohmann::json& doc);

      const MeasurementProtocol& protocol() const { return protocol_; }
      const DeviceConfig& device() const { return device_; }
      const std::string& measurementText() const { return measurementText_; }
      const std::string& deviceText() const { return deviceText_; }
      const std::string& timestamp() const { return timestamp_; }

      /// `<outputDir>/Recordings`
      std::filesystem::path recordingsDir() const;

    private:
      MeasurementProtocol protocol_;
      DeviceConfig device_;
      std::string measurementText_;
      std::string deviceText_;
      std::filesystem::path outputDir_;
      std::string timestamp_; ///< `%y%m%d-%H%M`, prefix of every output file
    };

    /// Local wall-clock time rendered with \p format (strftime syntax).
    std::string localTimestamp(const char* format);

  } // namespace core
} // namespace vsweep
