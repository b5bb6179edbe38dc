#pragma once
/** @file  FakeChunkOutlet.hpp
 *  @brief Capturing ChunkOutlet for the stream bridge tests.
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

#include <atomic>
#include <optional>
#include <vector>

#include "acq/ChunkOutlet.hpp"
#include "core/Errors.hpp"

namespace vsweep {
  namespace test {

    /**
 * @class FakeChunkOutlet
 * @brief Keeps every pushed chunk; can raise a stop flag after N chunks or
 *        fail on the Nth push.
 */
    class FakeChunkOutlet : public vsweep::acq::ChunkOutlet {
    public:
      std::vector<vsweep::acq::Chunk> pushed;
      std::atomic<bool>* stopFlag = nullptr;
      std::optional<std::size_t> stopAfterChunks;
      std::optional<std::size_t> failOnChunk;

      void pushChunk(const vsweep::acq::Chunk& chunk) override {
        if (failOnChunk && pushed.size() + 1 == *failOnChunk)
          throw vsweep::core::TransportError("fake outlet closed");
        pushed.push_back(chunk);
        if (stopFlag && stopAfterChunks && pushed.size() >= *stopAfterChunks)
          stopFlag->store(true);
      }

      std::size_t samples() const {
        std::size_t n = 0;
        for (const auto& c : pushed)
          n += c.size();
        return n;
      }
    };

  } // namespace test
} // namespace vsweep
