/* @file LslSource.cpp
 * @brief liblsl inlet backend
 *
 * © 2025 Milo Medical — MIT-licensed.
 */

// STL headers
#include <utility>
#include <vector>

// 3rd-party headers
#include <lsl_cpp.h>
#include <spdlog/spdlog.h>

// VibroSweep headers
#include "acq/LslSource.hpp"
#include "core/Errors.hpp"

using namespace vsweep::acq;

LslSource::LslSource(LslSourceConfig config) : config_(std::move(config)) {}

LslSource::~LslSource() { stop(); }

void LslSource::start() {
  if (inlet_)
    return;

  spdlog::info("Resolving LSL stream: {}", config_.streamName);
  std::vector<lsl::stream_info> found;
  while (found.empty()) {
    found = lsl::resolve_stream("name", config_.streamName, 1, config_.resolveTimeout.count());
    if (found.empty())
      spdlog::info("LSL stream '{}' not found yet, still resolving...", config_.streamName);
  }

  try {
    inlet_ = std::make_unique<lsl::stream_inlet>(found.front());
    inlet_->open_stream(config_.resolveTimeout.count());
    lsl::stream_info info = inlet_->info();
    channelCount_ = static_cast<std::size_t>(info.channel_count());
    sampleRate_ = info.nominal_srate();
    spdlog::info("Connected to LSL stream: {} ({} ch @ {} Hz)", info.name(), channelCount_,
                 sampleRate_);
  } catch (const std::exception& e) {
    inlet_.reset();
    throw vsweep::core::TransportError(std::string("[LslSource] cannot open inlet: ") + e.what());
  }
}

void LslSource::stop() {
  if (!inlet_)
    return;
  inlet_->close_stream();
  inlet_.reset();
  spdlog::debug("[LslSource] inlet closed");
}

Chunk LslSource::pullChunk(std::chrono::milliseconds timeout) {
  if (!inlet_)
    throw vsweep::core::TransportError("[LslSource] pull on a stopped source");

  std::vector<double> flat;
  std::vector<double> stamps;
  try {
    inlet_->pull_chunk_multiplexed(flat, &stamps,
                                   std::chrono::duration<double>(timeout).count());
  } catch (const lsl::lost_error& e) {
    throw vsweep::core::TransportError(std::string("[LslSource] stream lost: ") + e.what());
  }

  Chunk chunk;
  if (stamps.empty() || channelCount_ == 0)
    return chunk;

  chunk.reserve(stamps.size());
  for (std::size_t i = 0; i < stamps.size(); ++i) {
    const auto first = flat.begin() + static_cast<std::ptrdiff_t>(i * channelCount_);
    chunk.push_back(
        Sample{ stamps[i], std::vector<double>(first, first + static_cast<std::ptrdiff_t>(channelCount_)) });
  }
  return chunk;
}

std::string LslSource::description() const {
  return "LSL stream '" + config_.streamName + "' (" + std::to_string(channelCount_) + " ch @ " +
         std::to_string(sampleRate_) + " Hz)";
}
