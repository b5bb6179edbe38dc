#pragma once
/** @file  AcquisitionSource.hpp
 *  @brief Abstract biosignal backend (device SDK or network stream).
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

// STL headers
#include <chrono>
#include <string>
#include <vector>

namespace vsweep::acq {

  /// One multi-channel reading; the marker is attached later by the recorder.
  struct Sample {
    double timestamp{ 0.0 };
    std::vector<double> values;
  };

  using Chunk = std::vector<Sample>;

  /**
 * @class AcquisitionSource
 * @brief The phase state machine is written once against this interface.
 *
 *  * `start()` connects and begins streaming; `stop()` releases everything and
 *    must be safe to call twice.
 *  * `pullChunk()` blocks for at most @p timeout and returns the samples that
 *    arrived, oldest first (possibly none). Transport faults throw
 *    `core::TransportError`.
 *  * `ping()` keeps an idle link awake without consuming samples.
 */
  class AcquisitionSource {
  public:
    virtual ~AcquisitionSource() = default;

    virtual void start() = 0;
    virtual void stop() = 0;
    virtual Chunk pullChunk(std::chrono::milliseconds timeout) = 0;
    virtual bool isLive() const = 0;
    virtual void ping() {}
    virtual std::string description() const = 0;
  };

} // namespace vsweep::acq
