#include "HashTree.h"
#include "Hashing.h"

#include "Pack/SnBndFormat.h"

#include <algorithm>
#include <cstring>
#include <string>

namespace SnAPI::GraphBundle::Hashing
{

  using namespace Pack;

  namespace
  {
    bool IsHashKind(EChunkKind Kind)
    {
      return Kind == EChunkKind::HashLeaf || Kind == EChunkKind::HashBranch;
    }

    std::string NodeName(ChunkIndex Index)
    {
      return "hash node " + std::to_string(Index);
    }

    SnBndHashLeafV1 ReadLeaf(std::span<const uint8_t> File, const ChunkInfo& Info)
    {
      SnBndHashLeafV1 Leaf;
      std::memcpy(&Leaf, File.data() + Info.Offset, sizeof(Leaf));
      return Leaf;
    }

    SnBndHashBranchHeaderV1 ReadBranch(std::span<const uint8_t> File, const ChunkInfo& Info)
    {
      SnBndHashBranchHeaderV1 Branch;
      std::memcpy(&Branch, File.data() + Info.Offset, sizeof(Branch));
      return Branch;
    }

    ChunkIndex ReadBranchChild(std::span<const uint8_t> File, const ChunkInfo& Info, uint32_t Slot)
    {
      ChunkIndex Child;
      std::memcpy(&Child, File.data() + Info.Offset + sizeof(SnBndHashBranchHeaderV1) + static_cast<size_t>(Slot) * sizeof(uint32_t),
                  sizeof(Child));
      return Child;
    }

    BundleResult<void> CheckEncoding(std::span<const uint8_t> File, const ChunkInfo& Info)
    {
      if (Info.Kind == EChunkKind::HashLeaf)
      {
        if (Info.StoredSize != sizeof(SnBndHashLeafV1))
        {
          return MakeError(EBundleErrorCode::MalformedHashTree, NodeName(Info.Index) + ": leaf has size " + std::to_string(Info.StoredSize));
        }
        const SnBndHashLeafV1 Leaf = ReadLeaf(File, Info);
        if (Leaf.Algorithm != kHashAlgorithmBlake3)
        {
          return MakeError(EBundleErrorCode::UnsupportedFeature,
                           NodeName(Info.Index) + ": unknown hash algorithm " + std::to_string(Leaf.Algorithm));
        }
        if (!IsZero(Leaf.Reserved0, sizeof(Leaf.Reserved0)))
        {
          return MakeError(EBundleErrorCode::MalformedHashTree, NodeName(Info.Index) + ": reserved bytes are not zero");
        }
        return {};
      }

      if (Info.StoredSize < sizeof(SnBndHashBranchHeaderV1))
      {
        return MakeError(EBundleErrorCode::MalformedHashTree, NodeName(Info.Index) + ": branch too small");
      }
      const SnBndHashBranchHeaderV1 Branch = ReadBranch(File, Info);
      if (Branch.Reserved0 != 0)
      {
        return MakeError(EBundleErrorCode::MalformedHashTree, NodeName(Info.Index) + ": reserved bytes are not zero");
      }
      if (Branch.ChildCount == 0)
      {
        return MakeError(EBundleErrorCode::MalformedHashTree, NodeName(Info.Index) + ": branch has no children");
      }
      const uint64_t Expected = sizeof(SnBndHashBranchHeaderV1) + static_cast<uint64_t>(Branch.ChildCount) * sizeof(uint32_t);
      if (Info.StoredSize != Expected)
      {
        return MakeError(EBundleErrorCode::MalformedHashTree, NodeName(Info.Index) + ": branch size " + std::to_string(Info.StoredSize) +
                                                                 " does not match " + std::to_string(Branch.ChildCount) + " children");
      }
      return {};
    }
  } // namespace

  BundleResult<HashTreeLayout> AnalyzeHashTree(std::span<const uint8_t> File, const std::vector<ChunkInfo>& Chunks, ChunkIndex Root,
                                               uint32_t MaxDepth, bool bRequireFullCoverage)
  {
    if (Root >= Chunks.size() || !IsHashKind(Chunks[Root].Kind))
    {
      return MakeError(EBundleErrorCode::KindMismatch, "Integrity root " + std::to_string(Root) + " is not a hash node");
    }

    for (const ChunkInfo& Info : Chunks)
    {
      if (IsHashKind(Info.Kind))
      {
        if (auto Result = CheckEncoding(File, Info); !Result)
        {
          return std::unexpected(Result.error());
        }
      }
    }

    HashTreeLayout Layout;
    Layout.Root = Root;

    // Iterative DFS; a node reached twice has two parents or sits on a cycle
    std::vector<uint8_t> Reached(Chunks.size(), 0);
    std::vector<ChunkIndex> PreOrder;
    std::vector<std::pair<ChunkIndex, uint32_t>> Stack;
    Stack.emplace_back(Root, 1);
    Reached[Root] = 1;

    while (!Stack.empty())
    {
      const auto [Index, Depth] = Stack.back();
      Stack.pop_back();

      if (Depth > MaxDepth)
      {
        return MakeError(EBundleErrorCode::DepthExceeded,
                         "Hash tree depth exceeds limit " + std::to_string(MaxDepth) + " at " + NodeName(Index));
      }
      Layout.Depth = std::max(Layout.Depth, Depth);
      PreOrder.push_back(Index);

      const ChunkInfo& Info = Chunks[Index];
      if (Info.Kind == EChunkKind::HashLeaf)
      {
        Layout.Leaves.push_back(Index);
        continue;
      }

      const uint32_t ChildCount = ReadBranch(File, Info).ChildCount;
      for (uint32_t Slot = 0; Slot < ChildCount; ++Slot)
      {
        const ChunkIndex Child = ReadBranchChild(File, Info, Slot);
        if (Child >= Chunks.size())
        {
          return MakeError(EBundleErrorCode::MalformedHashTree, NodeName(Index) + ": child " + std::to_string(Child) + " out of range");
        }
        if (!IsHashKind(Chunks[Child].Kind))
        {
          return MakeError(EBundleErrorCode::KindMismatch,
                           NodeName(Index) + ": child chunk " + std::to_string(Child) + " is a " + ToString(Chunks[Child].Kind));
        }
        if (Reached[Child])
        {
          return MakeError(EBundleErrorCode::MalformedHashTree, NodeName(Child) + " has more than one parent");
        }
        Reached[Child] = 1;
        Stack.emplace_back(Child, Depth + 1);
      }
    }

    for (const ChunkInfo& Info : Chunks)
    {
      if (IsHashKind(Info.Kind) && !Reached[Info.Index])
      {
        return MakeError(EBundleErrorCode::MalformedHashTree, NodeName(Info.Index) + " is not reachable from the integrity root");
      }
    }

    // Leaf targets: data chunks, each covered at most once
    std::vector<uint8_t> Covered(Chunks.size(), 0);
    for (ChunkIndex LeafIndex : Layout.Leaves)
    {
      const ChunkIndex Target = ReadLeaf(File, Chunks[LeafIndex]).TargetChunk;
      if (Target >= Chunks.size())
      {
        return MakeError(EBundleErrorCode::MalformedHashTree, NodeName(LeafIndex) + ": target " + std::to_string(Target) + " out of range");
      }
      if (IsHashKind(Chunks[Target].Kind))
      {
        return MakeError(EBundleErrorCode::KindMismatch, NodeName(LeafIndex) + ": target " + std::to_string(Target) + " is a hash node");
      }
      if (Covered[Target])
      {
        return MakeError(EBundleErrorCode::MalformedHashTree, "Chunk " + std::to_string(Target) + " is covered by more than one leaf");
      }
      Covered[Target] = 1;
      ++Layout.CoveredChunks;
    }

    if (bRequireFullCoverage)
    {
      for (const ChunkInfo& Info : Chunks)
      {
        if (!IsHashKind(Info.Kind) && !Covered[Info.Index])
        {
          return MakeError(EBundleErrorCode::CoverageGap, "Chunk " + std::to_string(Info.Index) + " is not covered by the hash tree");
        }
      }
    }

    // Heights bottom-up: in reverse pre-order every child precedes its parent
    std::vector<uint32_t> Height(Chunks.size(), 0);
    for (auto It = PreOrder.rbegin(); It != PreOrder.rend(); ++It)
    {
      const ChunkInfo& Info = Chunks[*It];
      if (Info.Kind != EChunkKind::HashBranch)
      {
        continue;
      }
      uint32_t MaxChild = 0;
      const uint32_t ChildCount = ReadBranch(File, Info).ChildCount;
      for (uint32_t Slot = 0; Slot < ChildCount; ++Slot)
      {
        MaxChild = std::max(MaxChild, Height[ReadBranchChild(File, Info, Slot)]);
      }
      Height[*It] = MaxChild + 1;
      if (Layout.BranchLevels.size() < Height[*It])
      {
        Layout.BranchLevels.resize(Height[*It]);
      }
      Layout.BranchLevels[Height[*It] - 1].push_back(*It);
    }

    return Layout;
  }

  BundleResult<void> VerifyHashTree(const HashTreeLayout& Layout, std::span<const uint8_t> File, const std::vector<ChunkInfo>& Chunks,
                                    const LogicalBytesFn& LogicalBytes, const Digest256& ExpectedRoot, WorkerPool& Pool,
                                    CancellationToken& Token)
  {
    // Each slot is written by exactly one unit
    std::vector<Digest256> Computed(Chunks.size());

    auto LeafResult = Pool.ParallelFor(
        Layout.Leaves.size(),
        [&](size_t Unit) -> BundleResult<void> {
          const ChunkIndex LeafIndex = Layout.Leaves[Unit];
          const SnBndHashLeafV1 Leaf = ReadLeaf(File, Chunks[LeafIndex]);

          const Digest256 Digest = LeafDigest(LogicalBytes(Leaf.TargetChunk));
          if (std::memcmp(Digest.data(), Leaf.Digest, Digest.size()) != 0)
          {
            return MakeError(EBundleErrorCode::HashMismatch,
                             "Digest mismatch for chunk " + std::to_string(Leaf.TargetChunk) + " (" + NodeName(LeafIndex) + ")");
          }
          Computed[LeafIndex] = Digest;
          return {};
        },
        Token);
    if (!LeafResult)
    {
      return LeafResult;
    }

    for (const auto& Level : Layout.BranchLevels)
    {
      auto LevelResult = Pool.ParallelFor(
          Level.size(),
          [&](size_t Unit) -> BundleResult<void> {
            const ChunkIndex BranchIndex = Level[Unit];
            const ChunkInfo& Info = Chunks[BranchIndex];
            const SnBndHashBranchHeaderV1 Branch = ReadBranch(File, Info);

            BranchHasher Hasher;
            for (uint32_t Slot = 0; Slot < Branch.ChildCount; ++Slot)
            {
              Hasher.AddChild(Computed[ReadBranchChild(File, Info, Slot)].data());
            }
            const Digest256 Digest = Hasher.Finish();
            if (std::memcmp(Digest.data(), Branch.Digest, Digest.size()) != 0)
            {
              return MakeError(EBundleErrorCode::HashMismatch, "Digest mismatch for " + NodeName(BranchIndex));
            }
            Computed[BranchIndex] = Digest;
            return {};
          },
          Token);
      if (!LevelResult)
      {
        return LevelResult;
      }
    }

    if (Computed[Layout.Root] != ExpectedRoot)
    {
      return MakeError(EBundleErrorCode::RootDigestMismatch, "Root digest does not match the header file digest");
    }

    return {};
  }

} // namespace SnAPI::GraphBundle::Hashing
