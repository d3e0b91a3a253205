#pragma once

#include <array>
#include <cstdint>

#include "Export.h"

namespace SnAPI::GraphBundle
{

using ChunkIndex = uint32_t;
using StringId = uint32_t;

// Sentinel for "no chunk" (edge without payload, chunk without dictionary)
constexpr ChunkIndex kNoChunk = 0xFFFFFFFF;

using Digest256 = std::array<uint8_t, 32>;

// Chunk kinds are fixed by the on-disk format
enum class EChunkKind : uint8_t
{
    Blob = 0,
    Graph = 1,
    HashLeaf = 2,
    HashBranch = 3,
};

// Compression codec stored per chunk
enum class EChunkCodec : uint8_t
{
    None = 0,
    Zstd = 1,
    LZ4 = 2,
};

// Bundle lifecycle. Transitions only move forward; Failed and Closed are terminal.
enum class EBundleState : uint8_t
{
    Unopened,
    HeaderValidated,
    ChunkTableValidated,
    CrcVerified,
    HashVerified,
    Hydrated,
    Closed,
    Failed,
};

// Descriptor of a chunk as read from the chunk table
struct SNAPI_GRAPHBUNDLE_API ChunkInfo
{
    ChunkIndex Index = kNoChunk;
    EChunkKind Kind = EChunkKind::Blob;
    uint64_t Offset = 0;
    uint64_t StoredSize = 0;
    uint64_t LogicalSize = 0; // equal to StoredSize unless compressed
    EChunkCodec Codec = EChunkCodec::None;
    bool bCompressed = false;
    bool bEncrypted = false;
    uint32_t Crc32 = 0;
    ChunkIndex Dictionary = kNoChunk;
};

// Counters collected while opening a bundle
struct SNAPI_GRAPHBUNDLE_API BundleStats
{
    uint32_t ChunkCount = 0;
    uint32_t GraphCount = 0;
    uint32_t CompressedChunkCount = 0;
    uint32_t HydratedChunkCount = 0;
    uint32_t HashNodeCount = 0;
    // Levels in the Merkle tree and the chunks its leaves cover; zero unless verified in Full mode
    uint32_t HashTreeDepth = 0;
    uint32_t HashCoveredChunkCount = 0;
    uint32_t StringCount = 0;
    uint64_t DecompressedBytes = 0;
    // Payload bytes that live outside the mapped region (decompressed chunks)
    uint64_t CopiedPayloadBytes = 0;
};

SNAPI_GRAPHBUNDLE_API const char* ToString(EChunkKind Kind);
SNAPI_GRAPHBUNDLE_API const char* ToString(EBundleState State);

} // namespace SnAPI::GraphBundle
