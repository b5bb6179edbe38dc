#pragma once
/** @file  LslSource.hpp
 *  @brief Acquisition source via a Lab Streaming Layer (LSL) inlet.
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

// STL headers
#include <chrono>
#include <cstddef>
#include <memory>
#include <string>

// VibroSweep headers
#include "acq/AcquisitionSource.hpp"

namespace lsl {
  class stream_inlet;
}

namespace vsweep::acq {

  struct LslSourceConfig {
    std::string streamName{ "SynAmpsRT" };
    std::chrono::duration<double> resolveTimeout{ 5.0 }; ///< per attempt; retried until found
  };

  /**
 * @class LslSource
 * @brief Resolves a named stream on the local network and pulls multiplexed
 *        chunks from it.
 *
 *  * `start()` blocks until the stream is found (the amplifier software is
 *    often started after us).
 *  * Timestamps are the LSL timestamps of the outlet.
 */
  class LslSource final : public AcquisitionSource {
  public:
    explicit LslSource(LslSourceConfig config = {});
    ~LslSource() override;

    void start() override;
    void stop() override;
    Chunk pullChunk(std::chrono::milliseconds timeout) override;
    bool isLive() const override { return inlet_ != nullptr; }
    std::string description() const override;

  private:
    LslSourceConfig config_;
    std::unique_ptr<lsl::stream_inlet> inlet_;
    std::size_t channelCount_{ 0 };
    double sampleRate_{ 0.0 };
  };

} // namespace vsweep::acq
