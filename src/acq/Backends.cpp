/* @file Backends.cpp
 * @brief registers the acquisition SDKs found at configure time
 *
 * © 2025 Milo Medical — MIT-licensed.
 */

// STL headers
#include <memory>

// VibroSweep headers
#include "core/SourceRegistry.hpp"
#include "core/SweepConfig.hpp"

#ifdef VSWEEP_HAS_LSL
#include "acq/LslSource.hpp"
#endif
#ifdef VSWEEP_HAS_BRAINFLOW
#include "acq/BrainFlowSource.hpp"
#endif

void vsweep::core::registerBuiltinSources(SourceRegistry& registry) {
#ifdef VSWEEP_HAS_LSL
  registry.registerSource("lsl", [](const BoardConfig& board) {
    acq::LslSourceConfig cfg;
    cfg.streamName = board.streamName.value_or(cfg.streamName);
    return std::make_unique<acq::LslSource>(cfg);
  });
#endif

#ifdef VSWEEP_HAS_BRAINFLOW
  registry.registerSource("brainflow", [](const BoardConfig& board) {
    return std::make_unique<acq::BrainFlowSource>(acq::makeBrainFlowConfig(board));
  });
#endif

#if !defined(VSWEEP_HAS_LSL) && !defined(VSWEEP_HAS_BRAINFLOW)
  (void)registry; // no acquisition SDK found at configure time
#endif
}
