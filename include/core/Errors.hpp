#pragma once
/** @file  Errors.hpp
 *  @brief Exception hierarchy shared by every VibroSweep layer.
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

// STL headers
#include <stdexcept>
#include <string>

namespace vsweep {
  namespace core {

    /** Root of all sweep failures; callers that only need "it failed" catch this. */
    class SweepError : public std::runtime_error {
    public:
      using std::runtime_error::runtime_error;
    };

    /// A required key is missing or holds a value outside its valid domain.
    class ConfigurationError : public SweepError {
    public:
      using SweepError::SweepError;
    };

    /// The stimulator did not answer an open or presence check on its serial port.
    class DeviceUnreachable : public SweepError {
    public:
      using SweepError::SweepError;
    };

    /// Line transport, stream pull or operator input failed mid-session.
    class TransportError : public SweepError {
    public:
      using SweepError::SweepError;
    };

    /// A recording or metadata file could not be opened, written or flushed.
    class RecordingIOError : public SweepError {
    public:
      using SweepError::SweepError;
    };

    /// The operator interrupted the run (SIGINT).
    class RunCancelled : public SweepError {
    public:
      RunCancelled() : SweepError("run interrupted by operator") {}
    };

  } // namespace core
} // namespace vsweep
