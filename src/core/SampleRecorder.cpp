/* @file SampleRecorder.cpp
 * @brief marker-tagged recording loop
 *
 * © 2025 Milo Medical — MIT-licensed.
 */

// STL headers
#include <algorithm>
#include <iterator>

// 3rd-party headers
#include <spdlog/fmt/fmt.h>
#include <spdlog/spdlog.h>

// VibroSweep headers
#include "acq/AcquisitionSource.hpp"
#include "core/Errors.hpp"
#include "core/SampleRecorder.hpp"
#include "io/FileLogger.hpp"

using namespace vsweep::core;

SampleRecorder::SampleRecorder(std::size_t channelCount, std::chrono::milliseconds pollTimeout)
    : channelCount_(channelCount), pollTimeout_(pollTimeout) {}

bool SampleRecorder::record(acq::AcquisitionSource& source, std::chrono::duration<double> duration,
                            io::FileLogger& sink, std::optional<int> marker) const {
  using Clock = std::chrono::steady_clock;
  const auto start = Clock::now();

  bool markerWritten = false;
  std::size_t rows = 0;

  while (Clock::now() - start < duration) {
    if (cancel_ && cancel_->load())
      throw RunCancelled();

    const acq::Chunk chunk = source.pullChunk(pollTimeout_);
    for (const auto& sample : chunk) {
      std::string label;
      if (marker && !markerWritten) {
        label = std::to_string(*marker);
        markerWritten = true;
      }
      sink.write(formatRow(sample, label));
      ++rows;
    }
  }

  if (!sink.flush())
    throw RecordingIOError("[SampleRecorder] flush failed: " + sink.path());

  if (marker && !markerWritten)
    spdlog::warn("No samples within {:.2f}s, marker {} not written", duration.count(), *marker);
  spdlog::trace("[SampleRecorder] {} rows in {:.2f}s", rows, duration.count());
  return markerWritten;
}

std::string SampleRecorder::formatRow(const acq::Sample& sample, const std::string& marker) const {
  const std::size_t n = std::min(channelCount_, sample.values.size());

  std::string row = fmt::format("{}", sample.timestamp);
  for (std::size_t i = 0; i < n; ++i)
    fmt::format_to(std::back_inserter(row), ",{}", sample.values[i]);
  row += ',';
  row += marker;
  row += '\n';
  return row;
}
