#pragma once

#include <cstdint>
#include <functional>
#include <span>
#include <vector>

#include "BundleError.h"
#include "BundleTypes.h"
#include "Core/WorkerPool.h"

namespace SnAPI::GraphBundle::Hashing
{

  // Shape of a validated Merkle tree
  struct HashTreeLayout
  {
      ChunkIndex Root = kNoChunk;
      std::vector<ChunkIndex> Leaves;
      // BranchLevels[h - 1] holds every branch of height h; leaves have height 0
      std::vector<std::vector<ChunkIndex>> BranchLevels;
      uint32_t Depth = 0;
      uint32_t CoveredChunks = 0;
  };

  // Structural validation of the tree rooted at Root: node encodings, single parent per node,
  // no orphans, depth ceiling, leaf targets and (optionally) full coverage of non-hash chunks.
  // Hash chunks are never compressed, so their stored bytes are read straight from File.
  BundleResult<HashTreeLayout> AnalyzeHashTree(std::span<const uint8_t> File, const std::vector<ChunkInfo>& Chunks, ChunkIndex Root,
                                               uint32_t MaxDepth, bool bRequireFullCoverage);

  // Returns the logical (decompressed) bytes of a non-hash chunk
  using LogicalBytesFn = std::function<std::span<const uint8_t>(ChunkIndex)>;

  // Recomputes every digest (leaves first, then branches one height at a time) and compares
  // each with its stored digest, then the root with ExpectedRoot.
  BundleResult<void> VerifyHashTree(const HashTreeLayout& Layout, std::span<const uint8_t> File, const std::vector<ChunkInfo>& Chunks,
                                    const LogicalBytesFn& LogicalBytes, const Digest256& ExpectedRoot, WorkerPool& Pool,
                                    CancellationToken& Token);

} // namespace SnAPI::GraphBundle::Hashing
