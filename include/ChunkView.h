#pragma once

#include <span>
#include <variant>
#include <vector>

#include "BundleTypes.h"
#include "GraphView.h"

namespace SnAPI::GraphBundle
{

struct BlobView
{
    ChunkIndex Index = kNoChunk;
    std::span<const uint8_t> Bytes; // logical bytes
};

struct HashLeafView
{
    ChunkIndex Index = kNoChunk;
    ChunkIndex Target = kNoChunk;
    Digest256 Digest{};
};

struct HashBranchView
{
    ChunkIndex Index = kNoChunk;
    std::vector<ChunkIndex> Children; // stored order
    Digest256 Digest{};
};

// Typed view of any chunk, discriminated by its kind
using ChunkView = std::variant<BlobView, GraphView, HashLeafView, HashBranchView>;

} // namespace SnAPI::GraphBundle
