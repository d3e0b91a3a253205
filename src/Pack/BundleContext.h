#pragma once

#include <atomic>
#include <cstdint>
#include <memory>
#include <span>
#include <string_view>
#include <unordered_map>
#include <vector>

#include "BundleConfig.h"
#include "BundleTypes.h"
#include "MemoryMappedFile.h"
#include "SnBndFormat.h"

namespace SnAPI::GraphBundle::Detail
{

  enum class EHydrationState : uint8_t
  {
    Empty,
    Claimed,
    Ready,
  };

  // Index layer over one Graph chunk. Table pointers alias the chunk's logical bytes.
  struct GraphRecord
  {
      std::atomic<EHydrationState> State{EHydrationState::Empty};

      uint32_t NodeCount = 0;
      uint32_t EdgeCount = 0;
      uint32_t PropCount = 0;
      uint32_t Flags = 0;

      const Pack::SnBndNodeEntryV1* Nodes = nullptr;
      const Pack::SnBndEdgeEntryV1* Edges = nullptr;
      const Pack::SnBndPropertyEntryV1* Props = nullptr;

      bool IsReady() const { return State.load(std::memory_order_acquire) == EHydrationState::Ready; }
  };

  // Everything an open bundle owns. Views hold a weak reference, so closing the bundle
  // invalidates them instead of leaving them dangling.
  struct BundleContext
  {
      BundleLoadConfig Config;

      MemoryMappedFile File; // unused for OpenFromMemory
      std::span<const uint8_t> Bytes;

      Pack::SnBndHeaderV1 Header{};
      std::vector<ChunkInfo> Chunks;

      // Owned output of compressed chunks, indexed by chunk; empty for uncompressed chunks
      std::vector<std::vector<uint8_t>> Decompressed;

      // One record per chunk; only Graph chunks use theirs
      std::unique_ptr<GraphRecord[]> Graphs;

      // String id -> UTF-8 bytes, plus XXH3 hash -> ids for key lookup
      std::vector<std::string_view> Strings;
      std::unordered_multimap<uint64_t, StringId> StringIndex;

      std::span<const uint8_t> StoredBytes(ChunkIndex Index) const
      {
        const ChunkInfo& Info = Chunks[Index];
        return Bytes.subspan(static_cast<size_t>(Info.Offset), static_cast<size_t>(Info.StoredSize));
      }

      std::span<const uint8_t> LogicalBytes(ChunkIndex Index) const
      {
        if (Chunks[Index].bCompressed)
        {
          return Decompressed[Index];
        }
        return StoredBytes(Index);
      }

      // StringId lookup by key bytes; kNoChunk if absent
      StringId FindString(std::string_view Text) const;
  };

} // namespace SnAPI::GraphBundle::Detail
