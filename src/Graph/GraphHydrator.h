#pragma once

#include <memory>

#include "BundleError.h"
#include "GraphView.h"
#include "Core/WorkerPool.h"
#include "Pack/BundleContext.h"

namespace SnAPI::GraphBundle::Detail
{

  // Creates views over hydrated records
  struct ViewFactory
  {
      static BundleResult<GraphView> MakeGraph(const std::shared_ptr<const BundleContext>& Context, ChunkIndex Chunk, uint32_t Depth);
  };

} // namespace SnAPI::GraphBundle::Detail

namespace SnAPI::GraphBundle::Graph
{

  // Validates the string-pool graph and builds the id -> text table and key index
  BundleResult<void> BuildStringPool(Detail::BundleContext& Context);

  // Validates one Graph chunk and fills its record. Each chunk is claimed atomically,
  // so concurrent calls for the same chunk hydrate it once.
  BundleResult<void> HydrateGraph(Detail::BundleContext& Context, ChunkIndex Index);

  // String pool, then every Graph chunk in parallel, then cycle policy
  BundleResult<void> HydrateAll(Detail::BundleContext& Context, WorkerPool& Pool, CancellationToken& Token);

} // namespace SnAPI::GraphBundle::Graph
