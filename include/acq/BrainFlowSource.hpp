#pragma once
/** @file  BrainFlowSource.hpp
 *  @brief Acquisition source via the BrainFlow BoardShim API (live or playback).
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

// STL headers
#include <chrono>
#include <memory>
#include <optional>
#include <string>
#include <vector>

// VibroSweep headers
#include "acq/AcquisitionSource.hpp"

class BoardShim;

namespace vsweep::core {
  struct BoardConfig;
}

namespace vsweep::acq {

  struct BrainFlowSourceConfig {
    int boardId{ -1 };
    std::optional<int> masterBoard; ///< playback: board whose layout the file has
    std::string file;               ///< playback CSV
    std::string serialPort;
    std::string macAddress;
    bool loopback{ false };         ///< playback: replay the file endlessly
  };

  /// Board name (`FREEEEG32_BOARD`, ...) or a numeric id; throws ConfigurationError.
  int resolveBoardId(const std::string& nameOrNumber);

  /// Live board (`Id` + `Serial`/`Mac`) or playback (`Master` + `File`) from the device document.
  BrainFlowSourceConfig makeBrainFlowConfig(const core::BoardConfig& board);

  /**
 * @class BrainFlowSource
 * @brief Prepares the board session, streams, and hands out new samples as
 *        EEG rows plus the board timestamp.
 *
 *  * `stop()` stops the stream and releases the session if it was prepared,
 *    on every exit path (destructor included).
 *  * `ping()` queries the buffered sample count, leaving samples in place.
 */
  class BrainFlowSource final : public AcquisitionSource {
  public:
    explicit BrainFlowSource(BrainFlowSourceConfig config);
    ~BrainFlowSource() override;

    void start() override;
    void stop() override;
    Chunk pullChunk(std::chrono::milliseconds timeout) override;
    bool isLive() const override;
    void ping() override;
    std::string description() const override;

    /// Valid after `start()`.
    const std::vector<int>& eegRows() const { return eegRows_; }
    int samplingRate() const { return samplingRate_; }
    /// Board whose channel layout the data has (master board in playback).
    int layoutBoard() const { return config_.masterBoard.value_or(config_.boardId); }

  private:
    BrainFlowSourceConfig config_;
    std::unique_ptr<BoardShim> board_;
    std::vector<int> eegRows_;
    int timestampRow_{ -1 };
    int samplingRate_{ 0 };
    bool streaming_{ false };
  };

} // namespace vsweep::acq
