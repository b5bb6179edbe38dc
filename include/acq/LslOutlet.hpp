#pragma once
/** @file  LslOutlet.hpp
 *  @brief ChunkOutlet that publishes an EEG stream through a liblsl outlet.
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

// STL headers
#include <cstddef>
#include <memory>
#include <string>
#include <vector>

// VibroSweep headers
#include "acq/ChunkOutlet.hpp"

namespace lsl {
  class stream_outlet;
}

namespace vsweep::acq {

  struct LslOutletConfig {
    std::string streamName{ "BrainFlowEEG" };
    std::string type{ "EEG" };
    std::string sourceId;
    std::vector<int> channelRows; ///< board rows, published as `EEG_<row>` labels
    double samplingRate{ 0.0 };
  };

  /**
 * @class LslOutlet
 * @brief float32 multiplexed outlet, one channel per configured row.
 *
 *  * Timestamps are assigned by LSL at push time.
 *  * Samples narrower than the channel count are zero-padded, wider ones cut.
 */
  class LslOutlet final : public ChunkOutlet {
  public:
    explicit LslOutlet(const LslOutletConfig& config);
    ~LslOutlet() override;

    void pushChunk(const Chunk& chunk) override;

    std::size_t channelCount() const { return channels_; }

  private:
    std::unique_ptr<lsl::stream_outlet> outlet_;
    std::size_t channels_{ 0 };
  };

} // namespace vsweep::acq
