/* @file SweepDomain.cpp
 * @brief value sets for every swept dimension
 *
 * © 2025 Milo Medical — MIT-licensed.
 */

// VibroSweep headers
#include "core/Errors.hpp"
#include "core/SweepDomain.hpp"

using namespace vsweep::core;

std::vector<int> vsweep::core::rangeValues(const SweepRange& range) {
  if (range.step <= 0)
    throw ConfigurationError("sweep step must be > 0");
  if (range.end < range.start)
    throw ConfigurationError("sweep end must be >= start");

  std::vector<int> values;
  // long long: both the span and the running value may exceed int
  const long long span = static_cast<long long>(range.end) - range.start;
  values.reserve(static_cast<std::size_t>(span / range.step) + 1);
  for (long long v = range.start; v <= range.end; v += range.step)
    values.push_back(static_cast<int>(v));
  return values;
}

SweepDomain::SweepDomain(const MeasurementProtocol& protocol)
    : channels_(rangeValues(protocol.channel)), frequencies_(rangeValues(protocol.frequency)),
      volumes_(rangeValues(protocol.volume)) {}

std::size_t SweepDomain::totalSteps(int cycles) const {
  if (cycles < 0)
    throw ConfigurationError("cycle count must not be negative");
  return size() * static_cast<std::size_t>(cycles);
}
