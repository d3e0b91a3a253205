#pragma once

#include "BundleError.h"
#include "Pack/BundleContext.h"

namespace SnAPI::GraphBundle::Graph
{

  // True if the graph's edges contain a directed cycle (self-loops included)
  bool HasEdgeCycle(const Detail::GraphRecord& Record);

  // Every graph on a composition cycle (node or edge-payload references leading back to itself)
  // must carry the has-cycles flag. Requires all graphs to be hydrated.
  BundleResult<void> CheckCompositionCycles(const Detail::BundleContext& Context);

} // namespace SnAPI::GraphBundle::Graph
