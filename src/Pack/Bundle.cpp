#include "Bundle.h"

#include "BundleContext.h"
#include "ChunkTable.h"
#include "Compression.h"
#include "Core/WorkerPool.h"
#include "Graph/GraphHydrator.h"
#include "Hashing/HashTree.h"
#include "Hashing/Hashing.h"

#include <algorithm>
#include <cstring>

namespace SnAPI::GraphBundle
{

  using Detail::BundleContext;
  using Detail::ViewFactory;

  struct Bundle::Impl
  {
      EBundleState State = EBundleState::Unopened;
      std::optional<BundleError> LastError;
      std::vector<BundleError> Warnings;
      BundleStats Stats;

      // Shape of the verified Merkle tree, zero unless Full verification ran
      uint32_t HashTreeDepth = 0;
      uint32_t HashCoveredChunks = 0;

      std::shared_ptr<BundleContext> Context;
      std::shared_ptr<IBundleLogger> Logger;

      BundleResult<void> BeginOpen(const BundleLoadConfig& Config)
      {
        switch (State)
        {
          case EBundleState::Unopened:
            break;
          case EBundleState::Closed:
            return MakeError(EBundleErrorCode::BundleClosed, "Bundle was closed and cannot be reopened");
          case EBundleState::Failed:
            return MakeError(EBundleErrorCode::BundleFailed, "Bundle failed to load and cannot be reopened");
          default:
            return MakeError(EBundleErrorCode::InvalidState, "Bundle is already open");
        }
        Logger = Config.Logger;
        return {};
      }

      std::unexpected<BundleError> Fail(BundleError Error)
      {
        Context.reset();
        Warnings.clear();
        State = EBundleState::Failed;
        LastError = Error;
        if (Logger)
        {
          Logger->LogError("Bundle load failed: %s", Error.ToString().c_str());
        }
        return std::unexpected(std::move(Error));
      }

      BundleResult<std::shared_ptr<const BundleContext>> Require() const
      {
        switch (State)
        {
          case EBundleState::Hydrated:
            return std::shared_ptr<const BundleContext>(Context);
          case EBundleState::Closed:
            return MakeError(EBundleErrorCode::BundleClosed, "Bundle is closed");
          case EBundleState::Failed:
            return MakeError(EBundleErrorCode::BundleFailed, "Bundle failed to load: " + (LastError ? LastError->ToString() : std::string()));
          default:
            return MakeError(EBundleErrorCode::InvalidState, "Bundle is not open");
        }
      }

      BundleResult<void> VerifyCrcs(BundleContext& Ctx, WorkerPool& Pool, CancellationToken& Token)
      {
        const bool bDowngrade = Ctx.Config.Verification == EVerificationMode::Quick;
        std::vector<uint8_t> Mismatched(Ctx.Chunks.size(), 0);

        auto Result = Pool.ParallelFor(
            Ctx.Chunks.size(),
            [&](size_t Unit) -> BundleResult<void> {
              const auto Stored = Ctx.StoredBytes(static_cast<ChunkIndex>(Unit));
              if (Hashing::Crc32(Stored.data(), Stored.size()) == Ctx.Chunks[Unit].Crc32)
              {
                return {};
              }
              if (bDowngrade)
              {
                Mismatched[Unit] = 1;
                return {};
              }
              return MakeError(EBundleErrorCode::CrcMismatch, "CRC mismatch in chunk " + std::to_string(Unit));
            },
            Token);
        if (!Result)
        {
          return Result;
        }

        for (size_t i = 0; i < Mismatched.size(); ++i)
        {
          if (!Mismatched[i])
            continue;

          BundleError Warning(EBundleErrorCode::CrcMismatch, "CRC mismatch in chunk " + std::to_string(i));
          if (Logger)
          {
            Logger->LogWarn("%s (ignored by quick verification)", Warning.Message.c_str());
          }
          Warnings.push_back(std::move(Warning));
        }
        return {};
      }

      BundleResult<void> DecompressChunks(BundleContext& Ctx, WorkerPool& Pool, CancellationToken& Token)
      {
        Pack::DecompressionLimits Limits;
        Limits.MaxOutputSize = Ctx.Config.MaxDecompressedChunkSize;
        Limits.MaxRatio = Ctx.Config.MaxCompressionRatio;

        // Dictionaries never use a dictionary themselves, so they all land in the first wave
        std::vector<ChunkIndex> Waves[2];
        for (const ChunkInfo& Info : Ctx.Chunks)
        {
          if (Info.bCompressed)
          {
            Waves[Info.Dictionary == kNoChunk ? 0 : 1].push_back(Info.Index);
          }
        }

        for (const auto& Wave : Waves)
        {
          auto Result = Pool.ParallelFor(
              Wave.size(),
              [&](size_t Unit) -> BundleResult<void> {
                const ChunkIndex Index = Wave[Unit];
                ChunkInfo& Info = Ctx.Chunks[Index];

                std::span<const uint8_t> Dictionary;
                if (Info.Dictionary != kNoChunk)
                {
                  Dictionary = Ctx.LogicalBytes(Info.Dictionary);
                }

                auto Output = Pack::Decompress(Ctx.StoredBytes(Index), Info.Codec, Dictionary, Limits);
                if (!Output)
                {
                  return std::unexpected(std::move(Output.error().Prepend("Chunk " + std::to_string(Index))));
                }

                Info.LogicalSize = Output->size();
                Ctx.Decompressed[Index] = std::move(*Output);
                return {};
              },
              Token);
          if (!Result)
          {
            return Result;
          }
        }
        return {};
      }

      BundleResult<void> VerifyHashes(BundleContext& Ctx, WorkerPool& Pool, CancellationToken& Token)
      {
        auto Layout = Hashing::AnalyzeHashTree(Ctx.Bytes, Ctx.Chunks, Ctx.Header.IntegrityChunk, Ctx.Config.MaxHashTreeDepth,
                                               Ctx.Config.bRequireFullHashCoverage);
        if (!Layout)
        {
          return std::unexpected(Layout.error());
        }

        Digest256 Expected;
        std::memcpy(Expected.data(), Ctx.Header.FileDigest, Expected.size());

        auto Result = Hashing::VerifyHashTree(*Layout, Ctx.Bytes, Ctx.Chunks,
                                              [&Ctx](ChunkIndex Index) { return Ctx.LogicalBytes(Index); }, Expected, Pool, Token);
        if (Result)
        {
          HashTreeDepth = Layout->Depth;
          HashCoveredChunks = Layout->CoveredChunks;
        }
        return Result;
      }

      void CollectStats(const BundleContext& Ctx)
      {
        Stats = {};
        Stats.ChunkCount = static_cast<uint32_t>(Ctx.Chunks.size());
        Stats.StringCount = static_cast<uint32_t>(Ctx.Strings.size());
        Stats.HashTreeDepth = HashTreeDepth;
        Stats.HashCoveredChunkCount = HashCoveredChunks;
        for (const ChunkInfo& Info : Ctx.Chunks)
        {
          switch (Info.Kind)
          {
            case EChunkKind::Graph:
              ++Stats.GraphCount;
              if (Ctx.Graphs[Info.Index].IsReady())
                ++Stats.HydratedChunkCount;
              break;
            case EChunkKind::HashLeaf:
            case EChunkKind::HashBranch:
              ++Stats.HashNodeCount;
              break;
            default:
              break;
          }
          if (Info.bCompressed)
          {
            ++Stats.CompressedChunkCount;
            Stats.DecompressedBytes += Info.LogicalSize;
          }
        }
        // Decompressed buffers are the only payload bytes held outside the image
        Stats.CopiedPayloadBytes = Stats.DecompressedBytes;
      }

      BundleResult<void> Load(std::shared_ptr<BundleContext> Ctx)
      {
        const BundleLoadConfig& Config = Ctx->Config;

        auto Header = Pack::ParseHeader(Ctx->Bytes, Config);
        if (!Header)
          return Fail(Header.error());
        Ctx->Header = *Header;
        State = EBundleState::HeaderValidated;

        auto Chunks = Pack::ParseChunkTable(Ctx->Bytes, Ctx->Header, Config);
        if (!Chunks)
          return Fail(Chunks.error());
        Ctx->Chunks = std::move(*Chunks);
        State = EBundleState::ChunkTableValidated;

        try
        {
          Ctx->Decompressed.resize(Ctx->Chunks.size());
          Ctx->Graphs = std::make_unique<Detail::GraphRecord[]>(Ctx->Chunks.size());
        }
        catch (const std::bad_alloc&)
        {
          return Fail(BundleError(EBundleErrorCode::AllocationFailed, "Out of memory allocating chunk records"));
        }

        WorkerPool Pool(Config.WorkerThreads);
        CancellationToken Token;

        if (auto Result = VerifyCrcs(*Ctx, Pool, Token); !Result)
          return Fail(Result.error());
        State = EBundleState::CrcVerified;

        if (auto Result = DecompressChunks(*Ctx, Pool, Token); !Result)
          return Fail(Result.error());

        if (Config.Verification == EVerificationMode::Full)
        {
          if (auto Result = VerifyHashes(*Ctx, Pool, Token); !Result)
            return Fail(Result.error());
          State = EBundleState::HashVerified;
        }

        if (auto Result = Graph::HydrateAll(*Ctx, Pool, Token); !Result)
          return Fail(Result.error());

        CollectStats(*Ctx);
        Context = std::move(Ctx);
        State = EBundleState::Hydrated;

        if (Logger)
        {
          Logger->LogInfo("Opened bundle: %u chunks, %u graphs, %u strings, %llu bytes decompressed", Stats.ChunkCount, Stats.GraphCount,
                          Stats.StringCount, static_cast<unsigned long long>(Stats.DecompressedBytes));
        }
        return {};
      }
  };

  Bundle::Bundle() : m_Impl(std::make_unique<Impl>()) {}

  Bundle::~Bundle() = default;

  Bundle::Bundle(Bundle&&) noexcept = default;
  Bundle& Bundle::operator=(Bundle&&) noexcept = default;

  BundleResult<std::shared_ptr<const BundleContext>> Bundle::Require() const
  {
    if (!m_Impl)
    {
      return MakeError(EBundleErrorCode::InvalidState, "Bundle was moved from");
    }
    return m_Impl->Require();
  }

  BundleResult<void> Bundle::Open(const std::string& Path, const BundleLoadConfig& Config)
  {
    if (!m_Impl)
    {
      return MakeError(EBundleErrorCode::InvalidState, "Bundle was moved from");
    }
    if (auto Result = m_Impl->BeginOpen(Config); !Result)
    {
      return Result;
    }

    auto Ctx = std::make_shared<BundleContext>();
    Ctx->Config = Config;

    if (auto Result = Ctx->File.Open(Path); !Result)
    {
      return m_Impl->Fail(Result.error());
    }
    Ctx->Bytes = Ctx->File.GetSpan();

    if (Config.bPrefetch)
    {
      if (auto Result = Ctx->File.Prefetch(0, Ctx->File.GetSize()); !Result)
      {
        return m_Impl->Fail(Result.error());
      }
    }

    if (m_Impl->Logger)
    {
      m_Impl->Logger->LogInfo("Opening bundle: %s (%zu bytes)", Path.c_str(), Ctx->File.GetSize());
    }
    return m_Impl->Load(std::move(Ctx));
  }

  BundleResult<void> Bundle::OpenFromMemory(std::span<const uint8_t> Bytes, const BundleLoadConfig& Config)
  {
    if (!m_Impl)
    {
      return MakeError(EBundleErrorCode::InvalidState, "Bundle was moved from");
    }
    if (auto Result = m_Impl->BeginOpen(Config); !Result)
    {
      return Result;
    }

    auto Ctx = std::make_shared<BundleContext>();
    Ctx->Config = Config;
    Ctx->Bytes = Bytes;
    return m_Impl->Load(std::move(Ctx));
  }

  void Bundle::Close()
  {
    if (!m_Impl)
      return;
    m_Impl->Context.reset();
    m_Impl->Warnings.clear();
    if (m_Impl->State != EBundleState::Failed)
    {
      m_Impl->State = EBundleState::Closed;
    }
  }

  EBundleState Bundle::GetState() const
  {
    return m_Impl ? m_Impl->State : EBundleState::Closed;
  }

  std::optional<BundleError> Bundle::GetLastError() const
  {
    return m_Impl ? m_Impl->LastError : std::nullopt;
  }

  std::vector<BundleError> Bundle::GetWarnings() const
  {
    return m_Impl ? m_Impl->Warnings : std::vector<BundleError>{};
  }

  BundleResult<GraphView> Bundle::GetRootGraph() const
  {
    auto Ctx = Require();
    if (!Ctx)
      return std::unexpected(Ctx.error());
    return ViewFactory::MakeGraph(*Ctx, (*Ctx)->Header.RootChunk, 0);
  }

  BundleResult<GraphView> Bundle::GetGraph(ChunkIndex Index) const
  {
    auto Ctx = Require();
    if (!Ctx)
      return std::unexpected(Ctx.error());
    return ViewFactory::MakeGraph(*Ctx, Index, 0);
  }

  BundleResult<GraphView> Bundle::GetStringPool() const
  {
    auto Ctx = Require();
    if (!Ctx)
      return std::unexpected(Ctx.error());
    return ViewFactory::MakeGraph(*Ctx, (*Ctx)->Header.StringPoolChunk, 0);
  }

  BundleResult<std::string_view> Bundle::ResolveString(StringId Id) const
  {
    auto Ctx = Require();
    if (!Ctx)
      return std::unexpected(Ctx.error());

    if (Id >= (*Ctx)->Strings.size())
    {
      return MakeError(EBundleErrorCode::NotFound, "String id " + std::to_string(Id) + " out of range");
    }
    return (*Ctx)->Strings[Id];
  }

  BundleResult<uint32_t> Bundle::GetChunkCount() const
  {
    auto Ctx = Require();
    if (!Ctx)
      return std::unexpected(Ctx.error());
    return static_cast<uint32_t>((*Ctx)->Chunks.size());
  }

  BundleResult<ChunkInfo> Bundle::GetChunkInfo(ChunkIndex Index) const
  {
    auto Ctx = Require();
    if (!Ctx)
      return std::unexpected(Ctx.error());

    if (Index >= (*Ctx)->Chunks.size())
    {
      return MakeError(EBundleErrorCode::InvalidArgument, "Chunk index " + std::to_string(Index) + " out of range");
    }
    return (*Ctx)->Chunks[Index];
  }

  BundleResult<ChunkView> Bundle::GetChunk(ChunkIndex Index) const
  {
    auto Info = GetChunkInfo(Index);
    if (!Info)
      return std::unexpected(Info.error());

    auto Ctx = Require();
    if (!Ctx)
      return std::unexpected(Ctx.error());
    const BundleContext& C = **Ctx;

    switch (Info->Kind)
    {
      case EChunkKind::Blob:
        return BlobView{Index, C.LogicalBytes(Index)};

      case EChunkKind::Graph:
      {
        auto View = ViewFactory::MakeGraph(*Ctx, Index, 0);
        if (!View)
          return std::unexpected(View.error());
        return *View;
      }

      case EChunkKind::HashLeaf:
      {
        // Hash chunks are only structurally validated under full verification
        const auto Bytes = C.StoredBytes(Index);
        if (Bytes.size() != sizeof(Pack::SnBndHashLeafV1))
        {
          return MakeError(EBundleErrorCode::MalformedHashTree, "Hash leaf " + std::to_string(Index) + " has the wrong size");
        }
        Pack::SnBndHashLeafV1 Leaf;
        std::memcpy(&Leaf, Bytes.data(), sizeof(Leaf));

        HashLeafView View;
        View.Index = Index;
        View.Target = Leaf.TargetChunk;
        std::memcpy(View.Digest.data(), Leaf.Digest, View.Digest.size());
        return View;
      }

      case EChunkKind::HashBranch:
      {
        const auto Bytes = C.StoredBytes(Index);
        if (Bytes.size() < sizeof(Pack::SnBndHashBranchHeaderV1))
        {
          return MakeError(EBundleErrorCode::MalformedHashTree, "Hash branch " + std::to_string(Index) + " is too small");
        }
        Pack::SnBndHashBranchHeaderV1 Branch;
        std::memcpy(&Branch, Bytes.data(), sizeof(Branch));
        if (Bytes.size() != sizeof(Branch) + static_cast<uint64_t>(Branch.ChildCount) * sizeof(uint32_t))
        {
          return MakeError(EBundleErrorCode::MalformedHashTree, "Hash branch " + std::to_string(Index) + " has the wrong size");
        }

        HashBranchView View;
        View.Index = Index;
        View.Children.resize(Branch.ChildCount);
        std::memcpy(View.Children.data(), Bytes.data() + sizeof(Branch), View.Children.size() * sizeof(ChunkIndex));
        std::memcpy(View.Digest.data(), Branch.Digest, View.Digest.size());
        return View;
      }
    }

    return MakeError(EBundleErrorCode::KindMismatch, "Unknown chunk kind");
  }

  BundleResult<std::span<const uint8_t>> Bundle::GetBlob(ChunkIndex Index) const
  {
    auto Info = GetChunkInfo(Index);
    if (!Info)
      return std::unexpected(Info.error());

    if (Info->Kind != EChunkKind::Blob)
    {
      return MakeError(EBundleErrorCode::KindMismatch, "Chunk " + std::to_string(Index) + " is a " + ToString(Info->Kind));
    }
    return m_Impl->Context->LogicalBytes(Index);
  }

  BundleResult<Digest256> Bundle::GetFileDigest() const
  {
    auto Ctx = Require();
    if (!Ctx)
      return std::unexpected(Ctx.error());

    Digest256 Digest;
    std::memcpy(Digest.data(), (*Ctx)->Header.FileDigest, Digest.size());
    return Digest;
  }

  BundleResult<void> Bundle::Traverse(const TraverseFn& Visitor) const
  {
    auto Ctx = Require();
    if (!Ctx)
      return std::unexpected(Ctx.error());

    auto Root = ViewFactory::MakeGraph(*Ctx, (*Ctx)->Header.RootChunk, 0);
    if (!Root)
      return std::unexpected(Root.error());

    std::vector<uint8_t> Visited((*Ctx)->Chunks.size(), 0);
    std::vector<GraphView> Stack;
    std::vector<ChunkIndex> Children;

    Visited[Root->GetChunkIndex()] = 1;
    Stack.push_back(*Root);

    while (!Stack.empty())
    {
      const GraphView View = Stack.back();
      Stack.pop_back();

      const ETraverseAction Action = Visitor(View, View.GetDepth());
      if (Action == ETraverseAction::Stop)
      {
        return {};
      }
      if (Action == ETraverseAction::SkipChildren)
      {
        continue;
      }

      Children.clear();
      for (uint32_t n = 0; n < View.GetNodeCount(); ++n)
      {
        auto Kind = View.GetNodeKind(n);
        if (!Kind)
          return std::unexpected(Kind.error());
        if (*Kind == EChunkKind::Graph)
          Children.push_back(*View.GetNodeChunk(n));
      }
      for (uint32_t e = 0; e < View.GetEdgeCount(); ++e)
      {
        auto Edge = View.GetEdge(e);
        if (!Edge)
          return std::unexpected(Edge.error());
        if (Edge->HasPayload())
          Children.push_back(Edge->Payload);
      }

      // Reverse so the first child is visited first
      for (auto It = Children.rbegin(); It != Children.rend(); ++It)
      {
        if (Visited[*It])
          continue;

        auto Child = ViewFactory::MakeGraph(*Ctx, *It, View.GetDepth() + 1);
        if (!Child)
          return std::unexpected(Child.error());

        Visited[*It] = 1;
        Stack.push_back(*Child);
      }
    }

    return {};
  }

  BundleResult<std::vector<ChunkIndex>> Bundle::RescanChunkCrcs() const
  {
    auto Ctx = Require();
    if (!Ctx)
      return std::unexpected(Ctx.error());

    std::vector<ChunkIndex> Changed;
    for (const ChunkInfo& Info : (*Ctx)->Chunks)
    {
      const auto Stored = (*Ctx)->StoredBytes(Info.Index);
      if (Hashing::Crc32(Stored.data(), Stored.size()) != Info.Crc32)
      {
        Changed.push_back(Info.Index);
      }
    }
    return Changed;
  }

  BundleResult<BundleStats> Bundle::GetStats() const
  {
    auto Ctx = Require();
    if (!Ctx)
      return std::unexpected(Ctx.error());
    return m_Impl->Stats;
  }

  BundleResult<std::span<const uint8_t>> Bundle::GetMappedSpan() const
  {
    auto Ctx = Require();
    if (!Ctx)
      return std::unexpected(Ctx.error());
    return (*Ctx)->Bytes;
  }

} // namespace SnAPI::GraphBundle
