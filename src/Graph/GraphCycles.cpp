#include "GraphCycles.h"

#include <algorithm>
#include <limits>
#include <string>
#include <vector>

namespace SnAPI::GraphBundle::Graph
{

  using namespace Pack;

  bool HasEdgeCycle(const Detail::GraphRecord& Record)
  {
    const uint32_t NodeCount = Record.NodeCount;
    if (Record.EdgeCount == 0 || NodeCount == 0)
    {
      return false;
    }

    // Kahn's algorithm over a CSR adjacency
    std::vector<uint32_t> InDegree(NodeCount, 0);
    std::vector<uint32_t> Offsets(static_cast<size_t>(NodeCount) + 1, 0);
    for (uint32_t i = 0; i < Record.EdgeCount; ++i)
    {
      ++Offsets[Record.Edges[i].FromNode + 1];
      ++InDegree[Record.Edges[i].ToNode];
    }
    for (uint32_t n = 0; n < NodeCount; ++n)
    {
      Offsets[n + 1] += Offsets[n];
    }

    std::vector<uint32_t> Targets(Record.EdgeCount);
    std::vector<uint32_t> Cursor(Offsets.begin(), Offsets.end() - 1);
    for (uint32_t i = 0; i < Record.EdgeCount; ++i)
    {
      Targets[Cursor[Record.Edges[i].FromNode]++] = Record.Edges[i].ToNode;
    }

    std::vector<uint32_t> Ready;
    Ready.reserve(NodeCount);
    for (uint32_t n = 0; n < NodeCount; ++n)
    {
      if (InDegree[n] == 0)
      {
        Ready.push_back(n);
      }
    }

    uint32_t Processed = 0;
    while (!Ready.empty())
    {
      const uint32_t Node = Ready.back();
      Ready.pop_back();
      ++Processed;

      for (uint32_t e = Offsets[Node]; e < Offsets[Node + 1]; ++e)
      {
        if (--InDegree[Targets[e]] == 0)
        {
          Ready.push_back(Targets[e]);
        }
      }
    }

    return Processed < NodeCount;
  }

  namespace
  {
    constexpr uint32_t kUnvisited = std::numeric_limits<uint32_t>::max();

    // Successor at a reference slot: nodes first, then edge payloads. kNoChunk if the slot is not a graph reference.
    ChunkIndex SuccessorAt(const Detail::BundleContext& Context, const Detail::GraphRecord& Record, uint32_t Slot)
    {
      if (Slot < Record.NodeCount)
      {
        const ChunkIndex Target = Record.Nodes[Slot].Chunk;
        return Context.Chunks[Target].Kind == EChunkKind::Graph ? Target : kNoChunk;
      }
      return Record.Edges[Slot - Record.NodeCount].PayloadChunk;
    }

    struct Frame
    {
        ChunkIndex Node;
        uint32_t Slot;
    };
  } // namespace

  BundleResult<void> CheckCompositionCycles(const Detail::BundleContext& Context)
  {
    const size_t ChunkCount = Context.Chunks.size();

    // Iterative Tarjan SCC
    std::vector<uint32_t> Order(ChunkCount, kUnvisited);
    std::vector<uint32_t> LowLink(ChunkCount, 0);
    std::vector<uint8_t> OnStack(ChunkCount, 0);
    std::vector<uint8_t> SelfLoop(ChunkCount, 0);
    std::vector<ChunkIndex> SccStack;
    std::vector<Frame> CallStack;
    uint32_t Counter = 0;

    ChunkIndex FirstUnflagged = kNoChunk;

    for (const ChunkInfo& Start : Context.Chunks)
    {
      if (Start.Kind != EChunkKind::Graph || Order[Start.Index] != kUnvisited)
      {
        continue;
      }

      Order[Start.Index] = LowLink[Start.Index] = Counter++;
      SccStack.push_back(Start.Index);
      OnStack[Start.Index] = 1;
      CallStack.push_back({Start.Index, 0});

      while (!CallStack.empty())
      {
        const ChunkIndex Node = CallStack.back().Node;
        const Detail::GraphRecord& Record = Context.Graphs[Node];
        const uint32_t SlotCount = Record.NodeCount + Record.EdgeCount;

        if (CallStack.back().Slot < SlotCount)
        {
          const ChunkIndex Next = SuccessorAt(Context, Record, CallStack.back().Slot++);
          if (Next == kNoChunk)
          {
            continue;
          }
          if (Next == Node)
          {
            SelfLoop[Node] = 1;
          }
          if (Order[Next] == kUnvisited)
          {
            Order[Next] = LowLink[Next] = Counter++;
            SccStack.push_back(Next);
            OnStack[Next] = 1;
            CallStack.push_back({Next, 0});
          }
          else if (OnStack[Next])
          {
            LowLink[Node] = std::min(LowLink[Node], Order[Next]);
          }
          continue;
        }

        CallStack.pop_back();
        if (!CallStack.empty())
        {
          const ChunkIndex Parent = CallStack.back().Node;
          LowLink[Parent] = std::min(LowLink[Parent], LowLink[Node]);
        }

        if (LowLink[Node] != Order[Node])
        {
          continue;
        }

        // Node is the root of an SCC
        std::vector<ChunkIndex> Component;
        ChunkIndex Member;
        do
        {
          Member = SccStack.back();
          SccStack.pop_back();
          OnStack[Member] = 0;
          Component.push_back(Member);
        } while (Member != Node);

        if (Component.size() == 1 && !SelfLoop[Node])
        {
          continue;
        }
        for (ChunkIndex Graph : Component)
        {
          if ((Context.Graphs[Graph].Flags & GraphFlag_HasCycles) == 0)
          {
            FirstUnflagged = std::min(FirstUnflagged, Graph);
          }
        }
      }
    }

    if (FirstUnflagged != kNoChunk)
    {
      return MakeError(EBundleErrorCode::StructuralCycle,
                       "Graph chunk " + std::to_string(FirstUnflagged) + " is on a composition cycle but is not flagged has-cycles");
    }
    return {};
  }

} // namespace SnAPI::GraphBundle::Graph
