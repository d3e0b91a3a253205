#pragma once

#include <cstdint>
#include <memory>
#include <span>
#include <string>
#include <string_view>
#include <vector>

#include "BundleConfig.h"
#include "BundleError.h"
#include "BundleTypes.h"
#include "Export.h"

namespace SnAPI::GraphBundle
{

// Append-only arena that produces one sealed .snbnd image.
// Chunk indices are assigned in call order; chunk 0 is the string pool. Graphs reserve their
// index when created, so recursive and cyclic references can be expressed before the graph is filled.
// Single-writer. After a successful finalize every mutating call returns BuilderSealed.
class SNAPI_GRAPHBUNDLE_API BundleBuilder
{
public:
    BundleBuilder();
    explicit BundleBuilder(const BundleWriteConfig& Config);
    ~BundleBuilder();

    BundleResult<void> SetConfig(const BundleWriteConfig& Config) const;

    // Set compression mode (default: None)
    BundleResult<void> SetCompression(EBundleCompression Mode) const;

    // Set compression level (default: Default)
    BundleResult<void> SetCompressionLevel(EBundleCompressionLevel Level) const;

    // Add an asset blob. bCompress = false keeps it stored raw whatever the compression mode.
    BundleResult<ChunkIndex> AddBlob(std::span<const uint8_t> Bytes, bool bCompress = true) const;

    // Use a blob as the shared dictionary of every other compressed blob
    BundleResult<void> SetDictionary(ChunkIndex DictionaryBlob) const;

    BundleResult<ChunkIndex> CreateGraph() const;

    // Append a node referencing a blob or graph; returns the node index
    BundleResult<uint32_t> AddNode(ChunkIndex Graph, ChunkIndex Target) const;

    // Append an edge between two existing nodes, optionally carrying a payload graph; returns the edge index
    BundleResult<uint32_t> AddEdge(ChunkIndex Graph, uint32_t FromNode, uint32_t ToNode, ChunkIndex PayloadGraph = kNoChunk) const;

    // Set or replace a key/value property; both strings go to the string pool
    BundleResult<void> SetProperty(ChunkIndex Graph, std::string_view Key, std::string_view Value) const;

    // Graph flags. The builder never infers has-cycles; finalize rejects unflagged cycles.
    BundleResult<void> SetHasCycles(ChunkIndex Graph, bool bHasCycles) const;
    BundleResult<void> SetParallelGroup(ChunkIndex Graph, bool bParallelGroup) const;

    BundleResult<void> SetRoot(ChunkIndex Graph) const;

    // Build the image, verify it with the reader (bVerifyOnFinalize) and seal the builder
    BundleResult<std::vector<uint8_t>> FinalizeToMemory() const;

    // As FinalizeToMemory, then write the file (atomic: writes to temp file then renames)
    BundleResult<void> Finalize(const std::string& OutputPath) const;

    bool IsSealed() const;

    // Chunks added so far, string pool included
    uint32_t GetPendingChunkCount() const;

    // Non-copyable
    BundleBuilder(const BundleBuilder&) = delete;
    BundleBuilder& operator=(const BundleBuilder&) = delete;

    // Movable. A moved-from builder rejects every operation with InvalidState.
    BundleBuilder(BundleBuilder&&) noexcept;
    BundleBuilder& operator=(BundleBuilder&&) noexcept;

private:
    struct Impl;
    std::unique_ptr<Impl> m_Impl;

    // Moved-from or sealed builders accept no more input
    BundleResult<void> CheckOpen() const;
};

} // namespace SnAPI::GraphBundle
