/* @file Command.cpp
 * @brief stimulator wire commands
 *
 * © 2025 Milo Medical — MIT-licensed.
 */

// STL headers
#include <algorithm>

// VibroSweep headers
#include "protocols/Command.hpp"

using namespace vsweep::protocols;

namespace {
  Command make(char op, int value) { return Command{ op + std::to_string(value) }; }
  Command makeClamped(char op, int value, int lo, int hi) { return make(op, std::clamp(value, lo, hi)); }
} // namespace

Command Command::channel(int n) { return makeClamped('C', n, 0, 8); }
Command Command::volume(int n) { return makeClamped('V', n, 0, 100); }
Command Command::frequency(int hz) { return make('F', hz); }
Command Command::testMode(bool enabled) { return Command{ enabled ? "M1" : "M0" }; }
Command Command::start() { return Command{ "1" }; }
Command Command::stop() { return Command{ "0" }; }

Command Command::duration(int ms) { return makeClamped('D', ms, 1, 65535); }
Command Command::cyclePeriod(int ms) { return makeClamped('Y', ms, 1, 65535); }
Command Command::pauseCyclePeriod(int n) { return makeClamped('P', n, 0, 100); }
Command Command::pausedCycles(int n) { return makeClamped('Q', n, 0, 100); }
Command Command::jitter(int n) { return makeClamped('J', n, 0, 1000); }
