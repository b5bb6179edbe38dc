/* @file StreamBridge.cpp
 * @brief source -> outlet forwarding loop
 *
 * © 2025 Milo Medical — MIT-licensed.
 */

// STL headers
#include <thread>

// 3rd-party headers
#include <spdlog/spdlog.h>

// VibroSweep headers
#include "acq/AcquisitionSource.hpp"
#include "acq/ChunkOutlet.hpp"
#include "acq/StreamBridge.hpp"

using namespace vsweep::acq;

StreamBridge::StreamBridge(AcquisitionSource& source, ChunkOutlet& outlet,
                           StreamBridgeTiming timing)
    : source_(source), outlet_(outlet), timing_(timing) {}

std::size_t StreamBridge::run(const std::atomic<bool>& stop) {
  std::size_t samples = 0;

  while (!stop.load()) {
    const Chunk chunk = source_.pullChunk(timing_.pollTimeout);
    if (chunk.empty())
      continue;

    outlet_.pushChunk(chunk);
    samples += chunk.size();
    forwarded_ += chunk.size();
    ++chunks_;
    spdlog::trace("[StreamBridge] pushed {} samples", chunk.size());

    std::this_thread::sleep_for(timing_.afterPush);
  }

  spdlog::debug("[StreamBridge] stopped after {} samples in {} chunks", forwarded_, chunks_);
  return samples;
}
