#include "GraphHydrator.h"
#include "GraphCycles.h"

#include "Hashing/Hashing.h"

#include <cstring>
#include <string>
#include <vector>

namespace SnAPI::GraphBundle::Detail
{

  BundleResult<GraphView> ViewFactory::MakeGraph(const std::shared_ptr<const BundleContext>& Context, ChunkIndex Chunk, uint32_t Depth)
  {
    if (Chunk >= Context->Chunks.size())
    {
      return MakeError(EBundleErrorCode::InvalidArgument, "Chunk index " + std::to_string(Chunk) + " out of range");
    }
    if (Context->Chunks[Chunk].Kind != EChunkKind::Graph)
    {
      return MakeError(EBundleErrorCode::KindMismatch, "Chunk " + std::to_string(Chunk) + " is a " + ToString(Context->Chunks[Chunk].Kind));
    }
    if (Depth > Context->Config.MaxRecursionDepth)
    {
      return MakeError(EBundleErrorCode::DepthExceeded, "Graph depth exceeds limit " + std::to_string(Context->Config.MaxRecursionDepth));
    }

    const GraphRecord& Record = Context->Graphs[Chunk];
    if (!Record.IsReady())
    {
      return MakeError(EBundleErrorCode::InvalidState, "Graph chunk " + std::to_string(Chunk) + " is not hydrated");
    }

    GraphView View(Context, &Record, Chunk, Depth);
    return View;
  }

  StringId BundleContext::FindString(std::string_view Text) const
  {
    StringId Found = kNoChunk;
    const auto [Begin, End] = StringIndex.equal_range(Hashing::Hash64(Text.data(), Text.size()));
    for (auto It = Begin; It != End; ++It)
    {
      if (It->second < Found && Strings[It->second] == Text)
      {
        Found = It->second;
      }
    }
    return Found;
  }

} // namespace SnAPI::GraphBundle::Detail

namespace SnAPI::GraphBundle::Graph
{

  using namespace Pack;
  using Detail::BundleContext;
  using Detail::EHydrationState;
  using Detail::GraphRecord;

  namespace
  {
    std::string GraphName(ChunkIndex Index)
    {
      return "graph chunk " + std::to_string(Index);
    }

    struct TableRange
    {
        uint64_t Begin = 0;
        uint64_t End = 0;
    };

    BundleResult<TableRange> CheckTable(ChunkIndex Index, uint64_t ChunkSize, uint64_t Offset, uint32_t Count, size_t EntrySize,
                                        const char* What)
    {
      if (Count == 0)
      {
        return TableRange{};
      }
      if (Offset % kGraphTableAlignment != 0)
      {
        return MakeError(EBundleErrorCode::MalformedGraph, GraphName(Index) + ": " + What + " table is misaligned");
      }
      const uint64_t Bytes = static_cast<uint64_t>(Count) * EntrySize;
      if (Offset < sizeof(SnBndGraphHeaderV1) || Offset > ChunkSize || Bytes > ChunkSize - Offset)
      {
        return MakeError(EBundleErrorCode::MalformedGraph, GraphName(Index) + ": " + What + " table is out of bounds");
      }
      return TableRange{Offset, Offset + Bytes};
    }

    bool Overlaps(const TableRange& A, const TableRange& B)
    {
      return A.Begin < B.End && B.Begin < A.End;
    }
  } // namespace

  BundleResult<void> HydrateGraph(BundleContext& Context, ChunkIndex Index)
  {
    GraphRecord& Record = Context.Graphs[Index];

    EHydrationState Expected = EHydrationState::Empty;
    if (!Record.State.compare_exchange_strong(Expected, EHydrationState::Claimed, std::memory_order_acq_rel))
    {
      return {};
    }

    const std::span<const uint8_t> Bytes = Context.LogicalBytes(Index);
    if (Bytes.size() < sizeof(SnBndGraphHeaderV1))
    {
      return MakeError(EBundleErrorCode::MalformedGraph, GraphName(Index) + ": too small for a graph header");
    }

    SnBndGraphHeaderV1 Header;
    std::memcpy(&Header, Bytes.data(), sizeof(Header));

    if ((Header.Flags & ~static_cast<uint32_t>(GraphFlag_KnownMask)) != 0)
    {
      return MakeError(EBundleErrorCode::MalformedGraph, GraphName(Index) + ": unknown flags " + std::to_string(Header.Flags));
    }

    auto NodeRange = CheckTable(Index, Bytes.size(), Header.NodesOffset, Header.NodeCount, sizeof(SnBndNodeEntryV1), "node");
    if (!NodeRange)
      return std::unexpected(NodeRange.error());
    auto EdgeRange = CheckTable(Index, Bytes.size(), Header.EdgesOffset, Header.EdgeCount, sizeof(SnBndEdgeEntryV1), "edge");
    if (!EdgeRange)
      return std::unexpected(EdgeRange.error());
    auto PropRange = CheckTable(Index, Bytes.size(), Header.PropsOffset, Header.PropCount, sizeof(SnBndPropertyEntryV1), "property");
    if (!PropRange)
      return std::unexpected(PropRange.error());

    if (Overlaps(*NodeRange, *EdgeRange) || Overlaps(*NodeRange, *PropRange) || Overlaps(*EdgeRange, *PropRange))
    {
      return MakeError(EBundleErrorCode::MalformedGraph, GraphName(Index) + ": tables overlap");
    }

    const auto* Nodes = reinterpret_cast<const SnBndNodeEntryV1*>(Bytes.data() + NodeRange->Begin);
    const auto* Edges = reinterpret_cast<const SnBndEdgeEntryV1*>(Bytes.data() + EdgeRange->Begin);
    const auto* Props = reinterpret_cast<const SnBndPropertyEntryV1*>(Bytes.data() + PropRange->Begin);

    const auto ChunkCount = static_cast<uint32_t>(Context.Chunks.size());

    for (uint32_t n = 0; n < Header.NodeCount; ++n)
    {
      const ChunkIndex Target = Nodes[n].Chunk;
      if (Target >= ChunkCount)
      {
        return MakeError(EBundleErrorCode::MalformedGraph,
                         GraphName(Index) + ": node " + std::to_string(n) + " references missing chunk " + std::to_string(Target));
      }
      const EChunkKind Kind = Context.Chunks[Target].Kind;
      if (Kind != EChunkKind::Blob && Kind != EChunkKind::Graph)
      {
        return MakeError(EBundleErrorCode::KindMismatch,
                         GraphName(Index) + ": node " + std::to_string(n) + " references a " + ToString(Kind) + " chunk");
      }
    }

    for (uint32_t e = 0; e < Header.EdgeCount; ++e)
    {
      const SnBndEdgeEntryV1& Edge = Edges[e];
      if (Edge.FromNode >= Header.NodeCount || Edge.ToNode >= Header.NodeCount)
      {
        return MakeError(EBundleErrorCode::MalformedGraph, GraphName(Index) + ": edge " + std::to_string(e) + " has an invalid endpoint");
      }
      if (Edge.PayloadChunk == kNoChunk)
      {
        continue;
      }
      if (Edge.PayloadChunk >= ChunkCount)
      {
        return MakeError(EBundleErrorCode::MalformedGraph,
                         GraphName(Index) + ": edge " + std::to_string(e) + " payload references missing chunk " +
                             std::to_string(Edge.PayloadChunk));
      }
      if (Context.Chunks[Edge.PayloadChunk].Kind != EChunkKind::Graph)
      {
        return MakeError(EBundleErrorCode::KindMismatch, GraphName(Index) + ": edge " + std::to_string(e) + " payload is not a graph");
      }
    }

    const auto StringCount = static_cast<uint32_t>(Context.Strings.size());
    for (uint32_t p = 0; p < Header.PropCount; ++p)
    {
      if (Props[p].KeyString >= StringCount || Props[p].ValueString >= StringCount)
      {
        return MakeError(EBundleErrorCode::MalformedGraph, GraphName(Index) + ": property " + std::to_string(p) + " has an invalid string id");
      }
    }

    Record.NodeCount = Header.NodeCount;
    Record.EdgeCount = Header.EdgeCount;
    Record.PropCount = Header.PropCount;
    Record.Flags = Header.Flags;
    Record.Nodes = Nodes;
    Record.Edges = Edges;
    Record.Props = Props;

    if ((Header.Flags & GraphFlag_HasCycles) == 0 && HasEdgeCycle(Record))
    {
      return MakeError(EBundleErrorCode::StructuralCycle, GraphName(Index) + ": edge cycle in a graph not flagged has-cycles");
    }

    Record.State.store(EHydrationState::Ready, std::memory_order_release);
    return {};
  }

  BundleResult<void> BuildStringPool(BundleContext& Context)
  {
    const ChunkIndex PoolIndex = Context.Header.StringPoolChunk;
    const std::span<const uint8_t> Bytes = Context.LogicalBytes(PoolIndex);
    if (Bytes.size() < sizeof(SnBndGraphHeaderV1))
    {
      return MakeError(EBundleErrorCode::MalformedGraph, "String pool: too small for a graph header");
    }

    // The pool's own properties may reference its strings, so size the table before hydrating
    SnBndGraphHeaderV1 Header;
    std::memcpy(&Header, Bytes.data(), sizeof(Header));
    Context.Strings.assign(Header.NodeCount, std::string_view{});

    if (auto Result = HydrateGraph(Context, PoolIndex); !Result)
    {
      return Result;
    }

    const GraphRecord& Pool = Context.Graphs[PoolIndex];
    Context.StringIndex.reserve(Pool.NodeCount);
    for (uint32_t i = 0; i < Pool.NodeCount; ++i)
    {
      const ChunkIndex Target = Pool.Nodes[i].Chunk;
      if (Context.Chunks[Target].Kind != EChunkKind::Blob)
      {
        return MakeError(EBundleErrorCode::KindMismatch, "String pool: string " + std::to_string(i) + " is not a Blob chunk");
      }
      const std::span<const uint8_t> Text = Context.LogicalBytes(Target);
      Context.Strings[i] = std::string_view(reinterpret_cast<const char*>(Text.data()), Text.size());
      Context.StringIndex.emplace(Hashing::Hash64(Text.data(), Text.size()), i);
    }

    return {};
  }

  BundleResult<void> HydrateAll(BundleContext& Context, WorkerPool& Pool, CancellationToken& Token)
  {
    if (auto Result = BuildStringPool(Context); !Result)
    {
      return Result;
    }

    std::vector<ChunkIndex> GraphChunks;
    for (const ChunkInfo& Info : Context.Chunks)
    {
      if (Info.Kind == EChunkKind::Graph)
      {
        GraphChunks.push_back(Info.Index);
      }
    }

    auto Result = Pool.ParallelFor(
        GraphChunks.size(), [&](size_t Unit) { return HydrateGraph(Context, GraphChunks[Unit]); }, Token);
    if (!Result)
    {
      return Result;
    }

    bool bAnyCyclic = false;
    for (ChunkIndex Index : GraphChunks)
    {
      bAnyCyclic |= (Context.Graphs[Index].Flags & GraphFlag_HasCycles) != 0;
    }
    if (bAnyCyclic != ((Context.Header.Flags & SnBndFlag_HasCyclicGraphs) != 0))
    {
      return MakeError(EBundleErrorCode::BadHeader, "Cyclic-graphs flag does not match the graphs");
    }

    return CheckCompositionCycles(Context);
  }

} // namespace SnAPI::GraphBundle::Graph
