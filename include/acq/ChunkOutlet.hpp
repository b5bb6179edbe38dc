#pragma once
/** @file  ChunkOutlet.hpp
 *  @brief Destination for forwarded sample chunks (network stream outlet).
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

// VibroSweep headers
#include "acq/AcquisitionSource.hpp"

namespace vsweep::acq {

  /**
 * @class ChunkOutlet
 * @brief Publishes chunks in arrival order; a failed push throws.
 */
  class ChunkOutlet {
  public:
    virtual ~ChunkOutlet() = default;

    virtual void pushChunk(const Chunk& chunk) = 0;
  };

} // namespace vsweep::acq
