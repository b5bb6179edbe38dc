#pragma once
/** @file  Command.hpp
 *  @brief Stimulator line-protocol commands, with firmware value clamps.
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

// STL headers
#include <string>

namespace vsweep {
  namespace protocols {

    /**
 * @struct Command
 * @brief One text command; `toWire()` adds the `\n` terminator.
 *
 *  Factory helpers clamp into the range the stimulator firmware accepts,
 *  e.g. `Command::channel(12).payload == "C8"`.
 */
    struct Command {
      std::string payload;
      std::string toWire() const { return payload + "\n"; }

      static Command channel(int n);    ///< `C<n>`, n in [0,8]
      static Command volume(int n);     ///< `V<n>`, n in [0,100]
      static Command frequency(int hz); ///< `F<n>`, device-defined range
      static Command testMode(bool enabled);
      static Command start(); ///< `1`
      static Command stop();  ///< `0`

      static Command duration(int ms);        ///< `D<n>`, [1,65535]
      static Command cyclePeriod(int ms);     ///< `Y<n>`, [1,65535]
      static Command pauseCyclePeriod(int n); ///< `P<n>`, [0,100]
      static Command pausedCycles(int n);     ///< `Q<n>`, [0,100]
      static Command jitter(int n);           ///< `J<n>`, [0,1000]
    };

  } // namespace protocols
} // namespace vsweep
