#pragma once
/** @file  SweepDomain.hpp
 *  @brief Cartesian product channel × frequency × volume, iterated lazily.
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

// STL headers
#include <cstddef>
#include <vector>

// VibroSweep headers
#include "core/SweepConfig.hpp"

namespace vsweep {
  namespace core {

    /// Values of one dimension, ascending; `end` is only included when reached exactly.
    std::vector<int> rangeValues(const SweepRange& range);

    struct SweepPoint {
      int channel{ 0 };
      int frequency{ 0 };
      int volume{ 0 };

      bool operator==(const SweepPoint&) const = default;
    };

    /**
 * @class SweepDomain
 * @brief Channel-outermost, frequency-middle, volume-innermost iteration.
 *
 *  * Points are produced on demand by `forEach`, never stored.
 */
    class SweepDomain {
    public:
      explicit SweepDomain(const MeasurementProtocol& protocol);

      const std::vector<int>& channels() const { return channels_; }
      const std::vector<int>& frequencies() const { return frequencies_; }
      const std::vector<int>& volumes() const { return volumes_; }

      /// Number of distinct sweep points.
      std::size_t size() const { return channels_.size() * frequencies_.size() * volumes_.size(); }

      /// Stimulation cycles in the whole sweep (`size() * cycles`).
      std::size_t totalSteps(int cycles) const;

      template <typename Fn> void forEach(Fn&& fn) const {
        for (int ch : channels_)
          for (int freq : frequencies_)
            for (int vol : volumes_)
              fn(SweepPoint{ ch, freq, vol });
      }

    private:
      std::vector<int> channels_;
      std::vector<int> frequencies_;
      std::vector<int> volumes_;
    };

  } // namespace core
} // namespace vsweep
