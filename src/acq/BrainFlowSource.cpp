/* @file BrainFlowSource.cpp
 * @brief BrainFlow BoardShim backend
 *
 * © 2025 Milo Medical — MIT-licensed.
 */

// STL headers
#include <stdexcept>
#include <string>
#include <thread>
#include <unordered_map>
#include <utility>

// 3rd-party headers
#include <board_shim.h>
#include <spdlog/spdlog.h>

// VibroSweep headers
#include "acq/BrainFlowSource.hpp"
#include "core/Errors.hpp"
#include "core/SweepConfig.hpp"

using namespace vsweep::acq;
using vsweep::core::ConfigurationError;
using vsweep::core::TransportError;

namespace {

  const std::unordered_map<std::string, BoardIds>& knownBoards() {
    static const std::unordered_map<std::string, BoardIds> boards{
      { "PLAYBACK_FILE_BOARD", BoardIds::PLAYBACK_FILE_BOARD },
      { "SYNTHETIC_BOARD", BoardIds::SYNTHETIC_BOARD },
      { "CYTON_BOARD", BoardIds::CYTON_BOARD },
      { "GANGLION_BOARD", BoardIds::GANGLION_BOARD },
      { "CYTON_DAISY_BOARD", BoardIds::CYTON_DAISY_BOARD },
      { "UNICORN_BOARD", BoardIds::UNICORN_BOARD },
      { "FREEEEG32_BOARD", BoardIds::FREEEEG32_BOARD },
    };
    return boards;
  }

  constexpr auto kEmptyPoll = std::chrono::milliseconds{ 5 };

} // namespace

int vsweep::acq::resolveBoardId(const std::string& nameOrNumber) {
  const auto& boards = knownBoards();
  if (auto it = boards.find(nameOrNumber); it != boards.end())
    return static_cast<int>(it->second);

  try {
    std::size_t used = 0;
    const int id = std::stoi(nameOrNumber, &used);
    if (used == nameOrNumber.size())
      return id;
  } catch (const std::logic_error&) {
    // fall through to the error below
  }
  throw ConfigurationError("unknown BrainFlow board '" + nameOrNumber + "'");
}

BrainFlowSourceConfig vsweep::acq::makeBrainFlowConfig(const core::BoardConfig& board) {
  BrainFlowSourceConfig cfg;
  cfg.boardId = resolveBoardId(board.id);
  if (board.master) {
    cfg.masterBoard = resolveBoardId(*board.master);
    cfg.file = board.file.value_or("");
  }
  cfg.serialPort = board.serial.value_or("");
  cfg.macAddress = board.mac.value_or("");
  return cfg;
}

BrainFlowSource::BrainFlowSource(BrainFlowSourceConfig config) : config_(std::move(config)) {}

BrainFlowSource::~BrainFlowSource() { stop(); }

void BrainFlowSource::start() {
  if (board_)
    return;

  BrainFlowInputParams params;
  if (config_.masterBoard) {
    params.file = config_.file;
    params.master_board = *config_.masterBoard;
  } else {
    params.serial_port = config_.serialPort;
    params.mac_address = config_.macAddress;
  }

  // channel layout comes from the board that produced the data
  const int layout = layoutBoard();

  try {
    BoardShim::enable_dev_board_logger();
    board_ = std::make_unique<BoardShim>(config_.boardId, params);
    board_->prepare_session();
    if (config_.masterBoard && config_.loopback) {
      const std::string reply = board_->config_board("loopback_true");
      spdlog::debug("[BrainFlowSource] loopback_true -> '{}'", reply);
    }
    board_->start_stream();
    streaming_ = true;

    eegRows_ = BoardShim::get_eeg_channels(layout);
    timestampRow_ = BoardShim::get_timestamp_channel(layout);
    samplingRate_ = BoardShim::get_sampling_rate(layout);
    spdlog::info("BrainFlow board {} streaming ({} EEG ch @ {} Hz)", config_.boardId,
                 eegRows_.size(), samplingRate_);
  } catch (const BrainFlowException& e) {
    stop();
    throw TransportError("[BrainFlowSource] cannot start board " + std::to_string(config_.boardId) +
                         ": " + e.what() + " (code " + std::to_string(e.exit_code) + ")");
  }
}

void BrainFlowSource::stop() {
  if (!board_)
    return;

  try {
    if (board_->is_prepared()) {
      if (streaming_)
        board_->stop_stream();
      board_->release_session();
      spdlog::info("BrainFlow session released.");
    }
  } catch (const BrainFlowException& e) {
    spdlog::warn("[BrainFlowSource] release failed: {} (code {})", e.what(), e.exit_code);
  }
  streaming_ = false;
  board_.reset();
}

Chunk BrainFlowSource::pullChunk(std::chrono::milliseconds timeout) {
  if (!board_)
    throw TransportError("[BrainFlowSource] pull on a stopped source");

  Chunk chunk;
  try {
    const auto deadline = std::chrono::steady_clock::now() + timeout;
    while (board_->get_board_data_count() == 0) {
      if (std::chrono::steady_clock::now() >= deadline)
        return chunk;
      std::this_thread::sleep_for(kEmptyPoll);
    }

    BrainFlowArray<double, 2> data = board_->get_board_data();
    const int samples = data.get_size(1);
    chunk.reserve(static_cast<std::size_t>(samples));
    for (int col = 0; col < samples; ++col) {
      Sample s;
      s.timestamp = data.at(timestampRow_, col);
      s.values.reserve(eegRows_.size());
      for (int row : eegRows_)
        s.values.push_back(data.at(row, col));
      chunk.push_back(std::move(s));
    }
  } catch (const BrainFlowException& e) {
    throw TransportError(std::string("[BrainFlowSource] read failed: ") + e.what());
  }
  return chunk;
}

bool BrainFlowSource::isLive() const { return board_ && board_->is_prepared(); }

void BrainFlowSource::ping() {
  if (!board_)
    throw TransportError("[BrainFlowSource] keepalive on a stopped source");
  try {
    (void)board_->get_board_data_count();
  } catch (const BrainFlowException& e) {
    throw TransportError(std::string("[BrainFlowSource] keepalive failed: ") + e.what());
  }
}

std::string BrainFlowSource::description() const {
  if (config_.masterBoard)
    return "BrainFlow playback of " + config_.file;
  return "BrainFlow board " + std::to_string(config_.boardId);
}
