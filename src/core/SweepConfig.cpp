/* @file SweepConfig.cpp
 * @brief schema checks for the measurement protocol and device documents
 *
 * © 2025 Milo Medical — MIT-licensed.
 */

// STL headers
#include <chrono>
#include <ctime>
#include <utility>

// 3rd-party headers
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

// VibroSweep headers
#include "core/ConfigLoader.hpp"
#include "core/Errors.hpp"
#include "core/SweepConfig.hpp"

using namespace vsweep::core;
using nlohmann::json;

namespace {

  const json& require(const json& doc, const std::string& section, const std::string& key) {
    if (!doc.is_object() || !doc.contains(section) || !doc.at(section).is_object())
      throw ConfigurationError("missing section '" + section + "'");
    const json& sec = doc.at(section);
    if (!sec.contains(key))
      throw ConfigurationError("missing key '" + section + "." + key + "'");
    return sec.at(key);
  }

  template <typename T>
  T requireAs(const json& doc, const std::string& section, const std::string& key) {
    const json& value = require(doc, section, key);
    try {
      return value.get<T>();
    } catch (const json::type_error&) {
      throw ConfigurationError("key '" + section + "." + key + "' has wrong type");
    }
  }

  /// integer or fractional seconds, never negative
  double requireSeconds(const json& doc, const std::string& section, const std::string& key) {
    const json& value = require(doc, section, key);
    if (!value.is_number())
      throw ConfigurationError("key '" + section + "." + key + "' must be a number of seconds");
    const double seconds = value.get<double>();
    if (seconds < 0.0)
      throw ConfigurationError("key '" + section + "." + key + "' must not be negative");
    return seconds;
  }

  std::optional<std::string> optionalText(const json& section, const std::string& key) {
    if (!section.contains(key) || section.at(key).is_null())
      return std::nullopt;
    const json& value = section.at(key);
    if (value.is_string()) {
      if (value.get<std::string>().empty())
        return std::nullopt;
      return value.get<std::string>();
    }
    return value.dump();
  }

  std::optional<int> optionalInt(const json& section, const std::string& key) {
    if (!section.contains(key))
      return std::nullopt;
    if (!section.at(key).is_number_integer())
      throw ConfigurationError("key 'Stimulus." + key + "' must be an integer");
    return section.at(key).get<int>();
  }

  SweepRange parseRange(const json& doc, const std::string& section) {
    SweepRange r;
    r.start = requireAs<int>(doc, section, "Start");
    r.end = requireAs<int>(doc, section, "End");
    r.step = requireAs<int>(doc, section, "Steps");
    if (r.step <= 0)
      throw ConfigurationError("'" + section + ".Steps' must be > 0");
    if (r.end < r.start)
      throw ConfigurationError("'" + section + ".End' must be >= '" + section + ".Start'");
    return r;
  }

} // namespace

std::string BoardConfig::backendName() const { return streamName ? "lsl" : "brainflow"; }

SweepConfig::SweepConfig(MeasurementProtocol protocol, DeviceConfig device,
                         std::string measurementText, std::string deviceText,
                         std::filesystem::path outputDir, std::string timestamp)
    : protocol_(std::move(protocol)), device_(std::move(device)),
      measurementText_(std::move(measurementText)), deviceText_(std::move(deviceText)),
      outputDir_(std::move(outputDir)), timestamp_(std::move(timestamp)) {}

MeasurementProtocol SweepConfig::parseMeasurement(const json& doc) {
  MeasurementProtocol p;
  p.channel = parseRange(doc, "Channel");
  p.volume = parseRange(doc, "Volume");
  p.frequency = parseRange(doc, "Frequency");

  p.cycles = requireAs<int>(doc, "Measurements", "Number");
  if (p.cycles < 1)
    throw ConfigurationError("'Measurements.Number' must be >= 1");
  p.durationOn = requireSeconds(doc, "Measurements", "Duration_on");
  p.durationOff = requireSeconds(doc, "Measurements", "Duration_off");

  p.baseline1 = requireSeconds(doc, "Baselines", "Baseline_1");
  p.baseline2 = requireSeconds(doc, "Baselines", "Baseline_2");
  p.baseline3 = requireSeconds(doc, "Baselines", "Baseline_3");

  if (doc.contains("Stimulus")) {
    const json& s = doc.at("Stimulus");
    if (!s.is_object())
      throw ConfigurationError("section 'Stimulus' must be a mapping");
    p.stimulus.duration = optionalInt(s, "Duration");
    p.stimulus.cyclePeriod = optionalInt(s, "Cycle_period");
    p.stimulus.pauseCyclePeriod = optionalInt(s, "Pause_cycle_period");
    p.stimulus.pausedCycles = optionalInt(s, "Paused_cycles");
    p.stimulus.jitter = optionalInt(s, "Jitter");
  }
  return p;
}

BoardConfig SweepConfig::parseBoard(const json& doc) {
  BoardConfig b;

  const json& id = require(doc, "Board", "Id");
  b.id = id.is_string() ? id.get<std::string>() : id.dump();

  const json& board = doc.at("Board");
  b.master = optionalText(board, "Master");
  b.mac = optionalText(board, "Mac");
  b.file = optionalText(board, "File");
  b.serial = optionalText(board, "Serial");
  b.streamName = optionalText(board, "StreamName");

  for (const char* key : { "Keep_alive", "Keep_ble_alive" }) {
    if (board.contains(key)) {
      if (!board.at(key).is_boolean())
        throw ConfigurationError(std::string("key 'Board.") + key + "' must be true/false");
      b.keepAlive = board.at(key).get<bool>();
    }
  }

  if (board.contains("Channels")) {
    const json& ch = board.at("Channels");
    if (!ch.is_number_integer() || ch.get<int>() <= 0)
      throw ConfigurationError("key 'Board.Channels' must be a positive integer");
    b.channels = ch.get<std::size_t>();
  }

  if (b.master && !b.file)
    throw ConfigurationError("'Board.Master' playback requires 'Board.File'");
  return b;
}

DeviceConfig SweepConfig::parseDevice(const json& doc) {
  DeviceConfig d;
  d.board = parseBoard(doc);
  d.stimulatorPort = requireAs<std::string>(doc, "VHP", "Serial");
  return d;
}

SweepConfig SweepConfig::load(const std::string& measurementPath, const std::string& devicePath,
                              const std::filesystem::path& outputDir) {
  ConfigLoader measurement(measurementPath);
  ConfigLoader device(devicePath);

  MeasurementProtocol protocol = parseMeasurement(measurement.load());
  DeviceConfig dev = parseDevice(device.load());

  spdlog::info("Sweep: CH {}..{} step {}, FREQ {}..{} step {}, VOL {}..{} step {}",
               protocol.channel.start, protocol.channel.end, protocol.channel.step,
               protocol.frequency.start, protocol.frequency.end, protocol.frequency.step,
               protocol.volume.start, protocol.volume.end, protocol.volume.step);
  spdlog::info("Measurements: Number={}, Duration_on={}s, Duration_off={}s", protocol.cycles,
               protocol.durationOn, protocol.durationOff);
  spdlog::info("Baselines: B1={}s, B2={}s, B3={}s", protocol.baseline1, protocol.baseline2,
               protocol.baseline3);
  spdlog::info("Board: Id={}, backend={}, VHP={}", dev.board.id, dev.board.backendName(),
               dev.stimulatorPort);

  return SweepConfig(std::move(protocol), std::move(dev), measurement.text(), device.text(),
                     outputDir, localTimestamp("%y%m%d-%H%M"));
}

std::filesystem::path SweepConfig::recordingsDir() const { return outputDir_ / "Recordings"; }

std::string vsweep::core::localTimestamp(const char* format) {
  const std::time_t now = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
  std::tm local{};
  localtime_r(&now, &local);

  char buf[64];
  const std::size_t n = std::strftime(buf, sizeof(buf), format, &local);
  return std::string(buf, n);
}
