#pragma once

#include <cstdint>

// All structs are byte-packed, little-endian
#pragma pack(push, 1)

namespace SnAPI::GraphBundle::Pack
{

  // File magic: "SNBND\0\0\0" (8 bytes)
  constexpr uint8_t kSnBndMagic[8] = {'S', 'N', 'B', 'N', 'D', 0, 0, 0};
  constexpr uint32_t kSnBndVersion = 1;

  // Only little-endian bundles exist on disk
  constexpr uint8_t kEndianLittle = 1;

  // Chunk payloads and graph tables start on 8-byte boundaries
  constexpr uint64_t kChunkAlignment = 8;
  constexpr uint64_t kGraphTableAlignment = 8;

  constexpr uint8_t kHashAlgorithmBlake3 = 1;

  // Domain separation prefixes for Merkle digests
  constexpr uint8_t kLeafDigestPrefix = 0x00;
  constexpr uint8_t kBranchDigestPrefix = 0x01;

  // Header flags (informational, written by the builder)
  enum ESnBndFlags : uint32_t
  {
    SnBndFlag_None = 0,
    SnBndFlag_HasCyclicGraphs = 1 << 0,
    SnBndFlag_HasCompressedChunks = 1 << 1,

    SnBndFlag_KnownMask = SnBndFlag_HasCyclicGraphs | SnBndFlag_HasCompressedChunks,
  };

  // Chunk table entry flags
  enum ESnBndChunkFlags : uint8_t
  {
    ChunkFlag_None = 0,
    ChunkFlag_Compressed = 1 << 0,
    ChunkFlag_Encrypted = 1 << 1,

    ChunkFlag_KnownMask = ChunkFlag_Compressed | ChunkFlag_Encrypted,
  };

  // Graph sub-header flags
  enum ESnBndGraphFlags : uint32_t
  {
    GraphFlag_None = 0,
    GraphFlag_HasCycles = 1 << 0,
    GraphFlag_ParallelGroup = 1 << 1,

    GraphFlag_KnownMask = GraphFlag_HasCycles | GraphFlag_ParallelGroup,
  };

  struct SnBndHeaderV1
  {
      uint8_t Magic[8];    // "SNBND\0\0\0"
      uint32_t Version;    // 1
      uint32_t HeaderSize; // sizeof(SnBndHeaderV1)

      uint8_t Endianness; // kEndianLittle
      uint8_t Reserved0[3];

      uint64_t FileSize; // total bytes

      uint32_t RootChunk;       // Graph
      uint32_t StringPoolChunk; // Graph whose nodes are string blobs
      uint32_t IntegrityChunk;  // HashLeaf or HashBranch at the top of the Merkle tree

      uint32_t Flags;
      uint32_t ChunkCount;

      // CRC32 of this header (with TableCrc32 zeroed) followed by the chunk table
      uint32_t TableCrc32;

      // Root digest of the Merkle tree
      uint8_t FileDigest[32];

      uint8_t Reserved[44]; // must be zero
  };

  static_assert(sizeof(SnBndHeaderV1) == 128, "SnBndHeaderV1 size mismatch");

  struct SnBndChunkEntryV1
  {
      uint64_t Offset; // from start of file
      uint64_t Size;   // stored bytes

      uint8_t Kind;  // EChunkKind
      uint8_t Flags; // ESnBndChunkFlags
      uint8_t Codec; // EChunkCodec, None unless ChunkFlag_Compressed
      uint8_t Reserved0;

      uint32_t Crc32; // of the stored bytes

      uint32_t DictionaryChunk; // kNoChunk if none
      uint32_t Reserved1;
  };

  static_assert(sizeof(SnBndChunkEntryV1) == 32, "SnBndChunkEntryV1 size mismatch");

  struct SnBndGraphHeaderV1
  {
      uint32_t NodeCount;
      uint32_t EdgeCount;
      uint32_t PropCount;
      uint32_t Flags; // ESnBndGraphFlags

      // Relative to the start of the (decompressed) chunk
      uint64_t NodesOffset;
      uint64_t EdgesOffset;
      uint64_t PropsOffset;
  };

  static_assert(sizeof(SnBndGraphHeaderV1) == 40, "SnBndGraphHeaderV1 size mismatch");

  struct SnBndNodeEntryV1
  {
      uint32_t Chunk; // Blob or Graph
  };

  static_assert(sizeof(SnBndNodeEntryV1) == 4, "SnBndNodeEntryV1 size mismatch");

  struct SnBndEdgeEntryV1
  {
      uint32_t FromNode;
      uint32_t ToNode;
      uint32_t PayloadChunk; // Graph, or kNoChunk
  };

  static_assert(sizeof(SnBndEdgeEntryV1) == 12, "SnBndEdgeEntryV1 size mismatch");

  struct SnBndPropertyEntryV1
  {
      uint32_t KeyString;
      uint32_t ValueString;
  };

  static_assert(sizeof(SnBndPropertyEntryV1) == 8, "SnBndPropertyEntryV1 size mismatch");

  struct SnBndHashLeafV1
  {
      uint8_t Algorithm; // kHashAlgorithmBlake3
      uint8_t Reserved0[3];
      uint32_t TargetChunk;
      uint8_t Digest[32];
  };

  static_assert(sizeof(SnBndHashLeafV1) == 40, "SnBndHashLeafV1 size mismatch");

  // Followed by ChildCount uint32_t chunk indices, in digest order
  struct SnBndHashBranchHeaderV1
  {
      uint32_t ChildCount;
      uint32_t Reserved0;
      uint8_t Digest[32];
  };

  static_assert(sizeof(SnBndHashBranchHeaderV1) == 40, "SnBndHashBranchHeaderV1 size mismatch");

  // Prefix of an LZ4 compressed chunk; block formats do not record their output size
  struct SnBndLz4BlockHeaderV1
  {
      uint64_t UncompressedSize;
  };

  static_assert(sizeof(SnBndLz4BlockHeaderV1) == 8, "SnBndLz4BlockHeaderV1 size mismatch");

} // namespace SnAPI::GraphBundle::Pack

#pragma pack(pop)

namespace SnAPI::GraphBundle::Pack
{

  constexpr uint64_t AlignUp(const uint64_t Value, const uint64_t Alignment)
  {
    return (Value + Alignment - 1) / Alignment * Alignment;
  }

  // Offset of the first chunk payload byte for a table of ChunkCount entries
  constexpr uint64_t ChunkDataStart(const uint64_t ChunkCount)
  {
    return AlignUp(sizeof(SnBndHeaderV1) + ChunkCount * sizeof(SnBndChunkEntryV1), kChunkAlignment);
  }

  inline bool IsZero(const uint8_t* Bytes, const size_t Size)
  {
    for (size_t i = 0; i < Size; ++i)
    {
      if (Bytes[i] != 0)
        return false;
    }
    return true;
  }

} // namespace SnAPI::GraphBundle::Pack
