/* @file orchestrator_test.cpp
 * @brief full baseline + sweep runs against fake stimulator and fake source
 *
 * © 2025 Milo Medical — MIT-licensed.
 */

// STL headers
#include <algorithm>
#include <atomic>
#include <filesystem>
#include <fstream>
#include <functional>
#include <optional>
#include <sstream>

// Linux headers
#include <unistd.h>

// 3rd-party headers
#include <nlohmann/json.hpp>

// VibroSweep-Prod headers
#include "core/CommandLine.hpp"
#include "core/ErrorMonitor.hpp"
#include "core/Errors.hpp"
#include "core/SweepOrchestrator.hpp"
#include "core/SystemCoordinator.hpp"
#include "ui/OperatorGate.hpp"

// VibroSweep-Fake headers
#include "FakeAcquisitionSource.hpp"
#include "FakeSerialChannel.hpp"

// GTest headers
#include <gmock/gmock.h>
#include <gtest/gtest.h>

namespace vsweep::test {

  using namespace std::chrono_literals;
  using vsweep::core::Phase;
  using vsweep::core::SweepConfig;
  using vsweep::core::SweepOrchestrator;
  using vsweep::core::SweepTiming;
  using Markers = std::vector<std::string>;

  namespace {

    std::filesystem::path scratchDir() {
      const auto* info = ::testing::UnitTest::GetInstance()->current_test_info();
      auto dir = std::filesystem::temp_directory_path() /
                 ("vsweep_" + std::to_string(::getpid()) + "_" + info->name());
      std::filesystem::remove_all(dir);
      std::filesystem::create_directories(dir);
      return dir;
    }

    std::vector<std::string> readLines(const std::filesystem::path& p) {
      std::ifstream in(p);
      std::vector<std::string> lines;
      for (std::string line; std::getline(in, line);)
        lines.push_back(line);
      return lines;
    }

    /// Non-empty marker cells of a recording, in file order.
    Markers markersIn(const std::filesystem::path& p) {
      Markers out;
      for (const auto& line : readLines(p)) {
        const auto m = line.substr(line.rfind(',') + 1);
        if (!m.empty())
          out.push_back(m);
      }
      return out;
    }

    SweepTiming fastTiming() {
      SweepTiming t;
      t.presenceInterval = 10ms;
      t.presenceHold = 0ms;
      t.pollTimeout = 2ms;
      t.countdownTick = 5ms;
      t.stimulator.warmUp = 0ms;
      t.stimulator.settle = 0ms;
      return t;
    }

  } // namespace

  class SweepOrchestratorTest : public ::testing::Test {
  protected:
    void SetUp() override {
      outDir = scratchDir();

      protocol.channel = { 0, 2, 1 };
      protocol.frequency = { 10, 10, 1 };
      protocol.volume = { 50, 50, 1 };
      protocol.cycles = 2;
      protocol.durationOn = 0.01;
      protocol.durationOff = 0.01;
      protocol.baseline1 = 0.02;
      protocol.baseline2 = 0.01;
      protocol.baseline3 = 0.01;

      device.board.id = "CYTON_BOARD";
      device.board.channels = 4;
      device.stimulatorPort = "/dev/ttyACM0";

      source.generate = true;
      stim = std::make_shared<FakeDevice>();
      monitor = std::make_shared<vsweep::core::ErrorMonitor>();
    }

    bool runSweep(SweepTiming timing = fastTiming()) {
      config.emplace(protocol, device, R"({"Channel": {"Start": 0}})", R"({"Board": {}})", outDir,
                     "260101-1200");
      orchestrator = std::make_unique<SweepOrchestrator>(
          *config, source, gate, [this] { return std::make_unique<FakeSerialChannel>(stim); },
          monitor, console, timing);
      orchestrator->setCancelFlag(&cancel);
      return orchestrator->run();
    }

    std::string recording(const std::string& name) const {
      return (outDir / "Recordings" / ("260101-1200_CYTON_BOARD_" + name)).string();
    }

    std::filesystem::path outDir;
    vsweep::core::MeasurementProtocol protocol;
    vsweep::core::DeviceConfig device;
    std::optional<SweepConfig> config;

    FakeAcquisitionSource source;
    std::shared_ptr<FakeDevice> stim;
    std::shared_ptr<vsweep::core::ErrorMonitor> monitor;
    std::vector<std::string> prompts;
    std::function<void()> onGate;
    vsweep::ui::CallbackGate gate{ [this](const std::string& p) {
      prompts.push_back(p);
      if (onGate)
        onGate();
    } };
    std::ostringstream console;
    std::atomic<bool> cancel{ false };
    std::unique_ptr<SweepOrchestrator> orchestrator;
  };

  TEST_F(SweepOrchestratorTest, referenceScenario_ProducesOneFilePerPoint) {
    ASSERT_TRUE(runSweep()) << orchestrator->lastError();
    EXPECT_EQ(orchestrator->phase(), Phase::Complete);
    EXPECT_EQ(orchestrator->progress().total, 6u);
    EXPECT_EQ(orchestrator->progress().current, 6u);

    const auto& files = orchestrator->artifacts().pointFiles;
    ASSERT_EQ(files.size(), 3u);
    EXPECT_EQ(files[0].string(), recording("c0_f10_v50.csv"));
    EXPECT_EQ(files[1].string(), recording("c1_f10_v50.csv"));
    EXPECT_EQ(files[2].string(), recording("c2_f10_v50.csv"));

    std::size_t csvCount = 0;
    for (const auto& entry : std::filesystem::directory_iterator(outDir / "Recordings"))
      if (entry.path().filename().string().find("_c") != std::string::npos &&
          entry.path().filename().string().find("baseline") == std::string::npos)
        ++csvCount;
    EXPECT_EQ(csvCount, 3u);

    for (const auto& f : files) {
      EXPECT_EQ(markersIn(f), (Markers{ "333", "0", "1", "11", "0", "1", "11" })) << f.string();
      for (const auto& line : readLines(f))
        EXPECT_EQ(std::count(line.begin(), line.end(), ','), 5) << line;
    }

    EXPECT_FALSE(monitor->hasFailures());
    EXPECT_EQ(stim->opens, 2); // one presence check, one controller
    EXPECT_EQ(stim->closes, 2);
  }

  TEST_F(SweepOrchestratorTest, referenceScenario_CommandOrder) {
    ASSERT_TRUE(runSweep()) << orchestrator->lastError();

    std::vector<std::string> expected{ "C0", "V50", "F10", "1", "0", "M1" };
    for (const char* ch : { "C0", "C1", "C2" })
      for (const char* cmd : { ch, "V50", "F10", "1", "0", "1", "0" })
        expected.emplace_back(cmd);
    EXPECT_EQ(stim->commands(), expected);
  }

  TEST_F(SweepOrchestratorTest, baselineAndMetadata_AreWritten) {
    ASSERT_TRUE(runSweep()) << orchestrator->lastError();

    const auto& art = orchestrator->artifacts();
    EXPECT_EQ(art.baseline2.string(),
              recording("baseline_with_VHP_powered_ON_stim_ON_no_contact_c0_f10_v50.csv"));
    EXPECT_EQ(markersIn(art.baseline2), (Markers{ "31", "33" }));
    EXPECT_FALSE(std::filesystem::exists(art.baseline1)); // stimulator was already on

    ASSERT_TRUE(std::filesystem::exists(art.metadata));
    std::ifstream in(art.metadata);
    const std::string meta((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
    EXPECT_THAT(meta, testing::StartsWith("Recording on: "));
    EXPECT_THAT(meta, testing::HasSubstr("*** Measure Configuration ***\n{\"Channel\": {\"Start\": 0}}"));
    EXPECT_THAT(meta, testing::HasSubstr("*** Device Configuration ***"));
    EXPECT_THAT(meta, testing::HasSubstr(art.baseline2.string()));

    ASSERT_EQ(prompts.size(), 2u);
    EXPECT_THAT(prompts[0], testing::HasSubstr("NO CONTACT"));
    EXPECT_THAT(prompts[1], testing::HasSubstr("(CONTACT)"));
    EXPECT_THAT(console.str(), testing::HasSubstr("100.00%"));
  }

  TEST_F(SweepOrchestratorTest, progressLines_DoNotShareALineWithLaterOutput) {
    ASSERT_TRUE(runSweep()) << orchestrator->lastError();

    std::istringstream lines(console.str());
    int progressLines = 0;
    for (std::string line; std::getline(lines, line);) {
      const auto bar = line.find("Global sweep |");
      if (bar == std::string::npos)
        continue;
      ++progressLines;
      // the bar is the last thing written on its line
      EXPECT_EQ(line.find("Global sweep", bar + 1), std::string::npos) << line;
      EXPECT_THAT(line, testing::EndsWith("s")) << line;
    }
    EXPECT_EQ(progressLines, 6);
    EXPECT_EQ(console.str().back(), '\n');
  }

  TEST_F(SweepOrchestratorTest, baselines_ShowCountdownAndKeepOneMarker) {
    protocol.baseline2 = 0.05;
    protocol.channel = { 0, 0, 1 };
    auto timing = fastTiming();
    timing.countdownTick = 10ms;
    ASSERT_TRUE(runSweep(timing)) << orchestrator->lastError();

    const std::string out = console.str();
    EXPECT_GE(std::count(out.begin(), out.end(), '\r'), 4);
    EXPECT_THAT(out, testing::HasSubstr("\rBaseline 2:"));
    EXPECT_THAT(out, testing::HasSubstr("\rBaseline 2 (stim OFF):"));
    EXPECT_THAT(out, testing::HasSubstr("s remaining  ETA: "));

    // several slices, still one marker per window
    EXPECT_EQ(markersIn(orchestrator->artifacts().baseline2), (Markers{ "31", "33" }));
    EXPECT_GE(readLines(orchestrator->artifacts().baseline2).size(), 5u);
  }

  TEST_F(SweepOrchestratorTest, poweredOffStimulator_RecordsDeviceWaitBaseline) {
    stim->failOpens = 3;
    ASSERT_TRUE(runSweep()) << orchestrator->lastError();

    const auto& baseline1 = orchestrator->artifacts().baseline1;
    EXPECT_EQ(baseline1.string(), recording("baseline_with_VHP_powered_OFF.csv"));
    ASSERT_TRUE(std::filesystem::exists(baseline1));
    EXPECT_EQ(markersIn(baseline1), (Markers{ "3", "33" }));
    EXPECT_GE(readLines(baseline1).size(), 3u);
    EXPECT_EQ(stim->opens, 5); // three failed presence checks, one good one, the controller
    EXPECT_THAT(console.str(), testing::HasSubstr("\rBaseline 1:"));
    EXPECT_EQ(orchestrator->phase(), Phase::Complete);
  }

  TEST_F(SweepOrchestratorTest, withoutPreStimulusWindow_OnlyOnOffMarkers) {
    auto timing = fastTiming();
    timing.recordPreStimulusWindow = false;
    protocol.channel = { 4, 4, 1 };
    ASSERT_TRUE(runSweep(timing)) << orchestrator->lastError();
    ASSERT_EQ(orchestrator->artifacts().pointFiles.size(), 1u);
    EXPECT_EQ(markersIn(orchestrator->artifacts().pointFiles[0]),
              (Markers{ "333", "1", "11", "1", "11" }));
  }

  TEST_F(SweepOrchestratorTest, stimulusTiming_SentOnlyForConfiguredKeys) {
    protocol.channel = { 1, 1, 1 };
    protocol.cycles = 1;
    protocol.stimulus.duration = 100;
    protocol.stimulus.jitter = 5;
    ASSERT_TRUE(runSweep()) << orchestrator->lastError();

    const auto cmds = stim->commands();
    const auto m1 = std::find(cmds.begin(), cmds.end(), "M1");
    ASSERT_NE(m1, cmds.end());
    ASSERT_GE(cmds.end() - m1, 3);
    EXPECT_EQ(*(m1 + 1), "D100");
    EXPECT_EQ(*(m1 + 2), "J5");
    EXPECT_EQ(*(m1 + 3), "C1");
  }

  TEST_F(SweepOrchestratorTest, transportFailureMidRun_EndsInError) {
    onGate = [this] {
      if (prompts.size() == 2)
        stim->writeSucceeds = false; // stimulator unplugged at the contact gate
    };
    EXPECT_FALSE(runSweep());
    EXPECT_EQ(orchestrator->phase(), Phase::Error);
    EXPECT_THAT(orchestrator->lastError(), testing::HasSubstr("M1"));
    EXPECT_TRUE(monitor->hasFailures());
    EXPECT_TRUE(orchestrator->artifacts().pointFiles.empty());
    EXPECT_FALSE(std::filesystem::exists(orchestrator->artifacts().metadata));
    EXPECT_EQ(stim->opens, stim->closes);
  }

  TEST_F(SweepOrchestratorTest, sourceFailure_EndsInError) {
    source.failAfterPulls = 3;
    EXPECT_FALSE(runSweep());
    EXPECT_EQ(orchestrator->phase(), Phase::Error);
    EXPECT_THAT(orchestrator->lastError(), testing::HasSubstr("fake stream lost"));
    EXPECT_EQ(stim->opens, stim->closes);
  }

  TEST_F(SweepOrchestratorTest, cancelFlag_InterruptsRun) {
    onGate = [this] { cancel = true; };
    EXPECT_FALSE(runSweep());
    EXPECT_EQ(orchestrator->phase(), Phase::Error);
    EXPECT_EQ(orchestrator->lastError(), vsweep::core::RunCancelled().what());
    EXPECT_EQ(prompts.size(), 1u);
  }

  // ---------------------------------------------------------------------------
  // SystemCoordinator: config files on disk -> registry -> orchestrator -> exit code
  // ---------------------------------------------------------------------------

  class SystemCoordinatorTest : public ::testing::Test {
  protected:
    void SetUp() override {
      outDir = scratchDir();
      options.measureConfig = write("measure.json", R"({
        "Channel":      { "Start": 0,  "End": 1,  "Steps": 1 },
        "Volume":       { "Start": 50, "End": 50, "Steps": 1 },
        "Frequency":    { "Start": 10, "End": 10, "Steps": 1 },
        "Measurements": { "Number": 1, "Duration_on": 0.01, "Duration_off": 0.01 },
        "Baselines":    { "Baseline_1": 0.01, "Baseline_2": 0.01, "Baseline_3": 0.01 }
      })");
      options.deviceConfig = write("device.json", R"({
        "Board": { "Id": "CYTON_BOARD", "Serial": "/dev/ttyUSB0", "Keep_alive": true, "Channels": 2 },
        "VHP":   { "Serial": "/dev/ttyACM0" }
      })");
      options.outputDir = outDir.string();

      registry.registerSource("brainflow", [this](const vsweep::core::BoardConfig&) {
        auto fake = std::make_unique<FakeAcquisitionSource>();
        fake->generate = true;
        created = fake.get();
        return fake;
      });
      stim = std::make_shared<FakeDevice>();
    }

    std::string write(const std::string& name, const std::string& text) {
      const auto p = outDir / name;
      std::ofstream(p) << text;
      return p.string();
    }

    std::unique_ptr<vsweep::core::SystemCoordinator> makeCoordinator() {
      auto c = std::make_unique<vsweep::core::SystemCoordinator>(registry, input, output);
      c->setChannelFactory([this] { return std::make_unique<FakeSerialChannel>(stim); });
      c->setTiming(fastTiming());
      return c;
    }

    std::filesystem::path outDir;
    vsweep::core::CommandLineOptions options;
    vsweep::core::SourceRegistry registry;
    FakeAcquisitionSource* created{ nullptr };
    std::shared_ptr<FakeDevice> stim;
    std::istringstream input{ "\n\n" };
    std::ostringstream output;
  };

  TEST_F(SystemCoordinatorTest, completedRun_ExitsZero) {
    auto coordinator = makeCoordinator();
    coordinator->initialize(options);
    ASSERT_NE(created, nullptr);
    EXPECT_TRUE(created->started);

    EXPECT_EQ(coordinator->run(), vsweep::core::kExitOk);
    EXPECT_EQ(created->stops, 1);
    EXPECT_FALSE(coordinator->errors().hasFailures());
    EXPECT_THAT(output.str(), testing::HasSubstr("Press SPACEBAR then ENTER when ready..."));
    EXPECT_EQ(std::distance(std::filesystem::directory_iterator(outDir / "Recordings"),
                            std::filesystem::directory_iterator{}),
              4); // baseline 2, two points, metadata
  }

  TEST_F(SystemCoordinatorTest, closedOperatorInput_ExitsNonZero) {
    input.str("");
    auto coordinator = makeCoordinator();
    coordinator->initialize(options);
    EXPECT_EQ(coordinator->run(), vsweep::core::kExitFailure);
    EXPECT_TRUE(coordinator->errors().hasFailures());
  }

  TEST_F(SystemCoordinatorTest, unknownBackend_IsConfigurationError) {
    vsweep::core::SystemCoordinator coordinator(vsweep::core::SourceRegistry{}, input, output);
    EXPECT_THROW(coordinator.initialize(options), vsweep::core::ConfigurationError);
  }

  TEST_F(SystemCoordinatorTest, interruptedRun_Exits130) {
    std::atomic<bool> stop{ false };
    auto coordinator = makeCoordinator();
    coordinator->setCancelFlag(&stop);
    coordinator->setOperatorGate(
        std::make_unique<vsweep::ui::CallbackGate>([&](const std::string&) { stop = true; }));
    coordinator->initialize(options);
    EXPECT_EQ(coordinator->run(), vsweep::core::kExitInterrupted);
  }

} // namespace vsweep::test
