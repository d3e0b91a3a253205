#pragma once

#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

#include "BundleConfig.h"
#include "BundleError.h"
#include "BundleTypes.h"
#include "ChunkView.h"
#include "Export.h"
#include "GraphView.h"

namespace SnAPI::GraphBundle
{

enum class ETraverseAction
{
    Continue,     // descend into this graph's sub-graphs and edge payloads
    SkipChildren, // keep walking, but not below this graph
    Stop,         // end the traversal
};

// A sealed, read-only .snbnd bundle.
// Open runs the whole load pipeline (header, chunk table, CRC, decompression, hash tree, hydration);
// a bundle is either fully loaded or Failed with all of its resources released.
// Single-use: once closed or failed it cannot be opened again.
class SNAPI_GRAPHBUNDLE_API Bundle
{
public:
    using TraverseFn = std::function<ETraverseAction(const GraphView& Graph, uint32_t Depth)>;

    Bundle();
    ~Bundle();

    // Memory-map and load a .snbnd file
    BundleResult<void> Open(const std::string& Path, const BundleLoadConfig& Config = {});

    // Load from caller-owned bytes, which must outlive the bundle
    BundleResult<void> OpenFromMemory(std::span<const uint8_t> Bytes, const BundleLoadConfig& Config = {});

    // Release the mapping, decompressed buffers and hydration records
    void Close();

    EBundleState GetState() const;

    // Terminal error of a Failed bundle
    std::optional<BundleError> GetLastError() const;

    // Downgraded integrity findings (Quick verification)
    std::vector<BundleError> GetWarnings() const;

    BundleResult<GraphView> GetRootGraph() const;

    BundleResult<GraphView> GetGraph(ChunkIndex Index) const;

    BundleResult<GraphView> GetStringPool() const;

    BundleResult<std::string_view> ResolveString(StringId Id) const;

    BundleResult<uint32_t> GetChunkCount() const;

    BundleResult<ChunkInfo> GetChunkInfo(ChunkIndex Index) const;

    BundleResult<ChunkView> GetChunk(ChunkIndex Index) const;

    // Logical bytes of a Blob chunk
    BundleResult<std::span<const uint8_t>> GetBlob(ChunkIndex Index) const;

    // Root digest recorded in the header
    BundleResult<Digest256> GetFileDigest() const;

    // Depth-first walk from the root over sub-graph nodes and edge payloads.
    // Each graph is visited once; depth is bounded by MaxRecursionDepth.
    BundleResult<void> Traverse(const TraverseFn& Visitor) const;

    // Recompute every chunk CRC over the mapped bytes; returns the chunks that no longer match
    BundleResult<std::vector<ChunkIndex>> RescanChunkCrcs() const;

    BundleResult<BundleStats> GetStats() const;

    // Whole bundle image (file mapping or caller bytes)
    BundleResult<std::span<const uint8_t>> GetMappedSpan() const;

    // Non-copyable
    Bundle(const Bundle&) = delete;
    Bundle& operator=(const Bundle&) = delete;

    // Movable. A moved-from bundle reports Closed and rejects every operation with InvalidState.
    Bundle(Bundle&&) noexcept;
    Bundle& operator=(Bundle&&) noexcept;

private:
    struct Impl;
    std::unique_ptr<Impl> m_Impl;

    BundleResult<std::shared_ptr<const Detail::BundleContext>> Require() const;
};

} // namespace SnAPI::GraphBundle
