#pragma once

#include <cstdint>
#include <expected>
#include <string>

#include "Export.h"

namespace SnAPI::GraphBundle
{

// Broad failure class, used by callers to decide how to react
enum class EBundleErrorCategory : uint8_t
{
    Io,
    Format,
    Integrity,
    Resource,
    Compression,
    State,
};

enum class EBundleErrorCode : uint16_t
{
    // Io
    FileOpenFailed,
    FileReadFailed,
    FileWriteFailed,

    // Format
    BadMagic,
    UnsupportedVersion,
    BadHeader,
    MalformedChunkTable,
    ChunkOutOfBounds,
    ChunkOverlap,
    ChunkMisaligned,
    KindMismatch,
    MalformedGraph,
    MalformedHashTree,
    UnsupportedFeature,
    DepthExceeded,
    StructuralCycle,

    // Integrity
    TableCrcMismatch,
    CrcMismatch,
    HashMismatch,
    RootDigestMismatch,
    CoverageGap,

    // Resource
    LimitExceeded,
    AllocationFailed,
    PrefetchFailed,

    // Compression
    DecompressionFailed,
    CompressionFailed,
    SizeLimitExceeded,

    // State
    BundleClosed,
    BundleFailed,
    InvalidState,
    BuilderSealed,
    InvalidArgument,
    NotFound,
};

struct SNAPI_GRAPHBUNDLE_API BundleError
{
    EBundleErrorCategory Category = EBundleErrorCategory::State;
    EBundleErrorCode Code = EBundleErrorCode::InvalidState;
    std::string Message;

    BundleError() = default;
    BundleError(EBundleErrorCode InCode, std::string InMessage);

    // "Format/ChunkOverlap: chunk 3 overlaps chunk 4"
    std::string ToString() const;

    // Prefix the message with context, keeping category and code
    BundleError& Prepend(const std::string& Context);
};

// Category an error code belongs to
SNAPI_GRAPHBUNDLE_API EBundleErrorCategory CategoryOf(EBundleErrorCode Code);

SNAPI_GRAPHBUNDLE_API const char* ToString(EBundleErrorCategory Category);
SNAPI_GRAPHBUNDLE_API const char* ToString(EBundleErrorCode Code);

template <typename T>
using BundleResult = std::expected<T, BundleError>;

inline std::unexpected<BundleError> MakeError(EBundleErrorCode Code, std::string Message)
{
    return std::unexpected(BundleError(Code, std::move(Message)));
}

} // namespace SnAPI::GraphBundle
