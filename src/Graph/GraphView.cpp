#include "GraphView.h"

#include "GraphHydrator.h"
#include "Pack/BundleContext.h"

#include <string>

namespace SnAPI::GraphBundle
{

  using namespace Pack;

  GraphView::GraphView(std::weak_ptr<const Detail::BundleContext> Context, const Detail::GraphRecord* Record, ChunkIndex Chunk,
                       uint32_t Depth)
      : m_Context(std::move(Context)), m_Record(Record), m_Chunk(Chunk), m_Depth(Depth), m_NodeCount(Record->NodeCount),
        m_EdgeCount(Record->EdgeCount), m_PropCount(Record->PropCount), m_Flags(Record->Flags)
  {
  }

  bool GraphView::HasCycles() const
  {
    return (m_Flags & GraphFlag_HasCycles) != 0;
  }

  bool GraphView::IsParallelGroup() const
  {
    return (m_Flags & GraphFlag_ParallelGroup) != 0;
  }

  BundleResult<std::shared_ptr<const Detail::BundleContext>> GraphView::Lock() const
  {
    if (!m_Record)
    {
      return MakeError(EBundleErrorCode::InvalidState, "Empty graph view");
    }
    auto Context = m_Context.lock();
    if (!Context)
    {
      return MakeError(EBundleErrorCode::BundleClosed, "Bundle was closed");
    }
    return Context;
  }

  BundleResult<GraphView> GraphView::MakeChild(const std::shared_ptr<const Detail::BundleContext>& Context, ChunkIndex Chunk) const
  {
    return Detail::ViewFactory::MakeGraph(Context, Chunk, m_Depth + 1);
  }

  BundleResult<ChunkIndex> GraphView::GetNodeChunk(uint32_t NodeIndex) const
  {
    auto Context = Lock();
    if (!Context)
      return std::unexpected(Context.error());

    if (NodeIndex >= m_NodeCount)
    {
      return MakeError(EBundleErrorCode::InvalidArgument,
                       "Node index " + std::to_string(NodeIndex) + " out of range (" + std::to_string(m_NodeCount) + " nodes)");
    }
    return m_Record->Nodes[NodeIndex].Chunk;
  }

  BundleResult<EChunkKind> GraphView::GetNodeKind(uint32_t NodeIndex) const
  {
    auto Context = Lock();
    if (!Context)
      return std::unexpected(Context.error());

    auto Chunk = GetNodeChunk(NodeIndex);
    if (!Chunk)
      return std::unexpected(Chunk.error());

    return (*Context)->Chunks[*Chunk].Kind;
  }

  BundleResult<GraphView> GraphView::GetChildGraph(uint32_t NodeIndex) const
  {
    auto Context = Lock();
    if (!Context)
      return std::unexpected(Context.error());

    auto Chunk = GetNodeChunk(NodeIndex);
    if (!Chunk)
      return std::unexpected(Chunk.error());

    return MakeChild(*Context, *Chunk);
  }

  BundleResult<std::span<const uint8_t>> GraphView::GetNodeBlob(uint32_t NodeIndex) const
  {
    auto Context = Lock();
    if (!Context)
      return std::unexpected(Context.error());

    auto Chunk = GetNodeChunk(NodeIndex);
    if (!Chunk)
      return std::unexpected(Chunk.error());

    if ((*Context)->Chunks[*Chunk].Kind != EChunkKind::Blob)
    {
      return MakeError(EBundleErrorCode::KindMismatch, "Node " + std::to_string(NodeIndex) + " is not a Blob");
    }
    return (*Context)->LogicalBytes(*Chunk);
  }

  BundleResult<EdgeView> GraphView::GetEdge(uint32_t EdgeIndex) const
  {
    auto Context = Lock();
    if (!Context)
      return std::unexpected(Context.error());

    if (EdgeIndex >= m_EdgeCount)
    {
      return MakeError(EBundleErrorCode::InvalidArgument,
                       "Edge index " + std::to_string(EdgeIndex) + " out of range (" + std::to_string(m_EdgeCount) + " edges)");
    }

    const SnBndEdgeEntryV1& Entry = m_Record->Edges[EdgeIndex];
    EdgeView Edge;
    Edge.FromNode = Entry.FromNode;
    Edge.ToNode = Entry.ToNode;
    Edge.Payload = Entry.PayloadChunk;
    return Edge;
  }

  BundleResult<GraphView> GraphView::GetEdgePayload(uint32_t EdgeIndex) const
  {
    auto Edge = GetEdge(EdgeIndex);
    if (!Edge)
      return std::unexpected(Edge.error());

    if (!Edge->HasPayload())
    {
      return MakeError(EBundleErrorCode::NotFound, "Edge " + std::to_string(EdgeIndex) + " has no payload");
    }

    auto Context = Lock();
    if (!Context)
      return std::unexpected(Context.error());

    return MakeChild(*Context, Edge->Payload);
  }

  BundleResult<PropertyView> GraphView::GetProperty(uint32_t PropertyIndex) const
  {
    auto Context = Lock();
    if (!Context)
      return std::unexpected(Context.error());

    if (PropertyIndex >= m_PropCount)
    {
      return MakeError(EBundleErrorCode::InvalidArgument,
                       "Property index " + std::to_string(PropertyIndex) + " out of range (" + std::to_string(m_PropCount) + " properties)");
    }

    const SnBndPropertyEntryV1& Entry = m_Record->Props[PropertyIndex];
    PropertyView Property;
    Property.KeyId = Entry.KeyString;
    Property.ValueId = Entry.ValueString;
    Property.Key = (*Context)->Strings[Entry.KeyString];
    Property.Value = (*Context)->Strings[Entry.ValueString];
    return Property;
  }

  BundleResult<void> GraphView::ForEachProperty(const std::function<void(std::string_view Key, std::string_view Value)>& Fn) const
  {
    auto Context = Lock();
    if (!Context)
      return std::unexpected(Context.error());

    const auto& Strings = (*Context)->Strings;
    for (uint32_t p = 0; p < m_PropCount; ++p)
    {
      Fn(Strings[m_Record->Props[p].KeyString], Strings[m_Record->Props[p].ValueString]);
    }
    return {};
  }

  BundleResult<std::string_view> GraphView::FindProperty(std::string_view Key) const
  {
    auto Context = Lock();
    if (!Context)
      return std::unexpected(Context.error());

    // Keys are compared by string id, so a key absent from the pool cannot match
    const StringId KeyId = (*Context)->FindString(Key);
    if (KeyId != kNoChunk)
    {
      for (uint32_t p = 0; p < m_PropCount; ++p)
      {
        if (m_Record->Props[p].KeyString == KeyId)
        {
          return (*Context)->Strings[m_Record->Props[p].ValueString];
        }
      }
    }
    return MakeError(EBundleErrorCode::NotFound, "No property '" + std::string(Key) + "' on graph chunk " + std::to_string(m_Chunk));
  }

} // namespace SnAPI::GraphBundle
