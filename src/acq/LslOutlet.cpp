/* @file LslOutlet.cpp
 * @brief liblsl outlet backend
 *
 * © 2025 Milo Medical — MIT-licensed.
 */

// STL headers
#include <algorithm>
#include <cstdint>
#include <string>
#include <vector>

// 3rd-party headers
#include <lsl_cpp.h>
#include <spdlog/spdlog.h>

// VibroSweep headers
#include "acq/LslOutlet.hpp"
#include "core/Errors.hpp"

using namespace vsweep::acq;

LslOutlet::LslOutlet(const LslOutletConfig& config) : channels_(config.channelRows.size()) {
  if (channels_ == 0)
    throw vsweep::core::ConfigurationError("[LslOutlet] stream '" + config.streamName +
                                           "' has no channels");

  lsl::stream_info info(config.streamName, config.type, static_cast<std::int32_t>(channels_),
                        config.samplingRate, lsl::cf_float32, config.sourceId);

  lsl::xml_element channels = info.desc().append_child("channels");
  for (int row : config.channelRows)
    channels.append_child("channel").append_child_value("label", "EEG_" + std::to_string(row));

  outlet_ = std::make_unique<lsl::stream_outlet>(info);
  spdlog::info("LSL outlet '{}' ready ({} ch @ {} Hz)", config.streamName, channels_,
               config.samplingRate);
}

LslOutlet::~LslOutlet() = default;

void LslOutlet::pushChunk(const Chunk& chunk) {
  std::vector<float> flat(chunk.size() * channels_, 0.0f);
  for (std::size_t i = 0; i < chunk.size(); ++i) {
    const auto& values = chunk[i].values;
    const std::size_t n = std::min(channels_, values.size());
    for (std::size_t c = 0; c < n; ++c)
      flat[i * channels_ + c] = static_cast<float>(values[c]);
  }
  outlet_->push_chunk_multiplexed(flat);
}
