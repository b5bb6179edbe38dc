#pragma once
/** @file  StreamBridge.hpp
 *  @brief Pump that republishes an acquisition source on a ChunkOutlet.
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

// STL headers
#include <atomic>
#include <chrono>
#include <cstddef>

namespace vsweep::acq {

  class AcquisitionSource;
  class ChunkOutlet;

  struct StreamBridgeTiming {
    std::chrono::milliseconds pollTimeout{ 100 }; ///< per chunk pull
    std::chrono::milliseconds afterPush{ 100 };   ///< pause after a non-empty chunk
  };

  /**
 * @class StreamBridge
 * @brief Pulls chunks from @p source and pushes every non-empty one to
 *        @p outlet until the stop flag is raised.
 *
 *  * Source and outlet faults propagate to the caller; the owner releases
 *    the source.
 */
  class StreamBridge {
  public:
    StreamBridge(AcquisitionSource& source, ChunkOutlet& outlet, StreamBridgeTiming timing = {});

    /// @returns samples forwarded during this call.
    std::size_t run(const std::atomic<bool>& stop);

    std::size_t forwarded() const { return forwarded_; }
    std::size_t chunks() const { return chunks_; }

  private:
    AcquisitionSource& source_;
    ChunkOutlet& outlet_;
    StreamBridgeTiming timing_;
    std::size_t forwarded_{ 0 };
    std::size_t chunks_{ 0 };
  };

} // namespace vsweep::acq
