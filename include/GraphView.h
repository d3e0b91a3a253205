#pragma once

#include <cstdint>
#include <functional>
#include <memory>
#include <span>
#include <string_view>

#include "BundleError.h"
#include "BundleTypes.h"
#include "Export.h"

namespace SnAPI::GraphBundle
{

namespace Detail
{
struct BundleContext;
struct GraphRecord;
struct ViewFactory;
} // namespace Detail

struct SNAPI_GRAPHBUNDLE_API EdgeView
{
    uint32_t FromNode = 0;
    uint32_t ToNode = 0;
    ChunkIndex Payload = kNoChunk; // Graph chunk, or kNoChunk

    bool HasPayload() const { return Payload != kNoChunk; }
};

struct SNAPI_GRAPHBUNDLE_API PropertyView
{
    StringId KeyId = 0;
    StringId ValueId = 0;
    std::string_view Key;
    std::string_view Value;
};

// Read-only handle to a hydrated Graph chunk.
// Cheap to copy. Returned spans and string views point into the bundle and stay valid until it is closed;
// after that every accessor returns BundleClosed.
class SNAPI_GRAPHBUNDLE_API GraphView
{
public:
    GraphView() = default;

    bool IsValid() const { return m_Record != nullptr; }

    ChunkIndex GetChunkIndex() const { return m_Chunk; }

    // Composition depth from the view this one was reached from (root = 0)
    uint32_t GetDepth() const { return m_Depth; }

    uint32_t GetNodeCount() const { return m_NodeCount; }
    uint32_t GetEdgeCount() const { return m_EdgeCount; }
    uint32_t GetPropertyCount() const { return m_PropCount; }

    bool HasCycles() const;
    bool IsParallelGroup() const;

    BundleResult<ChunkIndex> GetNodeChunk(uint32_t NodeIndex) const;
    BundleResult<EChunkKind> GetNodeKind(uint32_t NodeIndex) const;

    // Sub-graph at a node. Fails with DepthExceeded past MaxRecursionDepth.
    BundleResult<GraphView> GetChildGraph(uint32_t NodeIndex) const;

    // Asset bytes at a Blob node
    BundleResult<std::span<const uint8_t>> GetNodeBlob(uint32_t NodeIndex) const;

    BundleResult<EdgeView> GetEdge(uint32_t EdgeIndex) const;

    // Graph carried by an edge; NotFound when the edge has no payload
    BundleResult<GraphView> GetEdgePayload(uint32_t EdgeIndex) const;

    BundleResult<PropertyView> GetProperty(uint32_t PropertyIndex) const;

    BundleResult<void> ForEachProperty(const std::function<void(std::string_view Key, std::string_view Value)>& Fn) const;

    // Value of the first property whose key matches; NotFound otherwise
    BundleResult<std::string_view> FindProperty(std::string_view Key) const;

private:
    friend struct Detail::ViewFactory;

    GraphView(std::weak_ptr<const Detail::BundleContext> Context, const Detail::GraphRecord* Record, ChunkIndex Chunk, uint32_t Depth);

    BundleResult<std::shared_ptr<const Detail::BundleContext>> Lock() const;
    BundleResult<GraphView> MakeChild(const std::shared_ptr<const Detail::BundleContext>& Context, ChunkIndex Chunk) const;

    std::weak_ptr<const Detail::BundleContext> m_Context;
    const Detail::GraphRecord* m_Record = nullptr;
    ChunkIndex m_Chunk = kNoChunk;
    uint32_t m_Depth = 0;
    uint32_t m_NodeCount = 0;
    uint32_t m_EdgeCount = 0;
    uint32_t m_PropCount = 0;
    uint32_t m_Flags = 0;
};

} // namespace SnAPI::GraphBundle
