/* @file config_test.cpp
 * @brief measurement / device document parsing and validation
 *
 * © 2025 Milo Medical — MIT-licensed.
 */

// STL headers
#include <filesystem>
#include <fstream>

// Linux headers
#include <unistd.h>

// 3rd-party headers
#include <nlohmann/json.hpp>

// VibroSweep headers
#include "core/ConfigLoader.hpp"
#include "core/Errors.hpp"
#include "core/SweepConfig.hpp"

// GTest headers
#include <gmock/gmock.h>
#include <gtest/gtest.h>

using namespace vsweep::core;
using nlohmann::json;

namespace {

  json measurementDoc() {
    return json::parse(R"({
      "Channel":      { "Start": 0,  "End": 2,  "Steps": 1 },
      "Volume":       { "Start": 50, "End": 50, "Steps": 1 },
      "Frequency":    { "Start": 10, "End": 10, "Steps": 1 },
      "Measurements": { "Number": 2, "Duration_on": 1, "Duration_off": 0.5 },
      "Baselines":    { "Baseline_1": 5, "Baseline_2": 3, "Baseline_3": 2 }
    })");
  }

  json deviceDoc() {
    return json::parse(R"({
      "Board": { "Id": "CYTON_BOARD", "Serial": "/dev/ttyUSB0", "Keep_alive": true },
      "VHP":   { "Serial": "/dev/ttyACM0" }
    })");
  }

  /// Asserts parsing fails with a message naming @p needle.
  template <typename Fn> void expectConfigError(Fn&& fn, const std::string& needle) {
    try {
      fn();
      FAIL() << "expected ConfigurationError mentioning " << needle;
    } catch (const ConfigurationError& e) {
      EXPECT_THAT(e.what(), testing::HasSubstr(needle));
    }
  }

  std::filesystem::path writeScratch(const std::string& name, const std::string& content) {
    auto dir = std::filesystem::temp_directory_path() /
               ("vsweep_config_" + std::to_string(::getpid()));
    std::filesystem::create_directories(dir);
    auto p = dir / name;
    std::ofstream(p) << content;
    return p;
  }

} // namespace

TEST(measurement_config, parses_reference_document) {
  const auto p = SweepConfig::parseMeasurement(measurementDoc());
  EXPECT_EQ(p.channel.start, 0);
  EXPECT_EQ(p.channel.end, 2);
  EXPECT_EQ(p.channel.step, 1);
  EXPECT_EQ(p.volume.start, 50);
  EXPECT_EQ(p.frequency.end, 10);
  EXPECT_EQ(p.cycles, 2);
  EXPECT_DOUBLE_EQ(p.durationOn, 1.0);
  EXPECT_DOUBLE_EQ(p.durationOff, 0.5);
  EXPECT_DOUBLE_EQ(p.baseline1, 5.0);
  EXPECT_DOUBLE_EQ(p.baseline3, 2.0);
  EXPECT_FALSE(p.stimulus.duration);
  EXPECT_FALSE(p.stimulus.jitter);
}

TEST(measurement_config, missing_key_is_named) {
  auto doc = measurementDoc();
  doc["Channel"].erase("Start");
  expectConfigError([&] { SweepConfig::parseMeasurement(doc); }, "Channel.Start");

  doc = measurementDoc();
  doc.erase("Baselines");
  expectConfigError([&] { SweepConfig::parseMeasurement(doc); }, "Baselines");
}

TEST(measurement_config, rejects_bad_values) {
  auto doc = measurementDoc();
  doc["Volume"]["Steps"] = 0;
  expectConfigError([&] { SweepConfig::parseMeasurement(doc); }, "Volume.Steps");

  doc = measurementDoc();
  doc["Frequency"]["End"] = 5;
  expectConfigError([&] { SweepConfig::parseMeasurement(doc); }, "Frequency.End");

  doc = measurementDoc();
  doc["Measurements"]["Number"] = 0;
  expectConfigError([&] { SweepConfig::parseMeasurement(doc); }, "Measurements.Number");

  doc = measurementDoc();
  doc["Baselines"]["Baseline_2"] = -1;
  expectConfigError([&] { SweepConfig::parseMeasurement(doc); }, "Baselines.Baseline_2");

  doc = measurementDoc();
  doc["Channel"]["Start"] = "zero";
  expectConfigError([&] { SweepConfig::parseMeasurement(doc); }, "Channel.Start");
}

TEST(measurement_config, stimulus_block_is_optional_per_key) {
  auto doc = measurementDoc();
  doc["Stimulus"] = { { "Duration", 100 }, { "Jitter", 5 } };
  const auto p = SweepConfig::parseMeasurement(doc);
  ASSERT_TRUE(p.stimulus.duration);
  EXPECT_EQ(*p.stimulus.duration, 100);
  ASSERT_TRUE(p.stimulus.jitter);
  EXPECT_EQ(*p.stimulus.jitter, 5);
  EXPECT_FALSE(p.stimulus.cyclePeriod);
  EXPECT_FALSE(p.stimulus.pausedCycles);
}

TEST(device_config, parses_brainflow_board) {
  const auto d = SweepConfig::parseDevice(deviceDoc());
  EXPECT_EQ(d.board.id, "CYTON_BOARD");
  EXPECT_EQ(d.board.serial.value_or(""), "/dev/ttyUSB0");
  EXPECT_TRUE(d.board.keepAlive);
  EXPECT_EQ(d.board.channels, 33u);
  EXPECT_EQ(d.board.backendName(), "brainflow");
  EXPECT_EQ(d.stimulatorPort, "/dev/ttyACM0");
}

TEST(device_config, stream_name_selects_lsl) {
  auto doc = deviceDoc();
  doc["Board"] = { { "Id", 0 }, { "StreamName", "SynAmpsRT" }, { "Keep_ble_alive", false },
                   { "Channels", 8 } };
  const auto d = SweepConfig::parseDevice(doc);
  EXPECT_EQ(d.board.id, "0");
  EXPECT_EQ(d.board.backendName(), "lsl");
  EXPECT_FALSE(d.board.keepAlive);
  EXPECT_EQ(d.board.channels, 8u);
}

TEST(device_config, rejects_incomplete_documents) {
  auto doc = deviceDoc();
  doc.erase("VHP");
  expectConfigError([&] { SweepConfig::parseDevice(doc); }, "VHP");

  doc = deviceDoc();
  doc["Board"]["Master"] = "CYTON_BOARD";
  expectConfigError([&] { SweepConfig::parseDevice(doc); }, "Board.File");

  doc = deviceDoc();
  doc["Board"]["Channels"] = 0;
  expectConfigError([&] { SweepConfig::parseDevice(doc); }, "Board.Channels");
}

TEST(device_config, board_block_parses_without_a_stimulator) {
  auto doc = deviceDoc();
  doc.erase("VHP");
  doc["Board"] = { { "Id", "PLAYBACK_FILE_BOARD" }, { "Master", "CYTON_BOARD" },
                   { "File", "session.csv" } };
  const auto board = SweepConfig::parseBoard(doc);
  EXPECT_EQ(board.master.value_or(""), "CYTON_BOARD");
  EXPECT_EQ(board.file.value_or(""), "session.csv");
  EXPECT_EQ(board.backendName(), "brainflow");

  doc["Board"].erase("File");
  expectConfigError([&] { SweepConfig::parseBoard(doc); }, "Board.File");
  doc.erase("Board");
  expectConfigError([&] { SweepConfig::parseBoard(doc); }, "Board");
}

TEST(config_loader, loads_files_and_keeps_text) {
  const auto m = writeScratch("measure.json", measurementDoc().dump(2));
  const auto d = writeScratch("device.json", deviceDoc().dump(2));

  const auto cfg = SweepConfig::load(m.string(), d.string(), "/tmp/vsweep-out");
  EXPECT_EQ(cfg.protocol().cycles, 2);
  EXPECT_EQ(cfg.device().stimulatorPort, "/dev/ttyACM0");
  EXPECT_EQ(cfg.measurementText(), measurementDoc().dump(2));
  EXPECT_EQ(cfg.recordingsDir().string(), "/tmp/vsweep-out/Recordings");
  EXPECT_EQ(cfg.timestamp().size(), 11u); // yymmdd-HHMM
}

TEST(config_loader, unreadable_or_malformed_is_configuration_error) {
  EXPECT_THROW(ConfigLoader("/nonexistent/vsweep.json").load(), ConfigurationError);

  const auto bad = writeScratch("bad.json", "{ \"Channel\": ");
  EXPECT_THROW(ConfigLoader(bad.string()).load(), ConfigurationError);
}
