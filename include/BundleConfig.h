#pragma once

#include <cstdint>
#include <memory>

#include "Export.h"
#include "IBundleLogger.h"

namespace SnAPI::GraphBundle
{

// How much of the integrity stack runs on open
enum class EVerificationMode
{
    Full,    // CRC32 + BLAKE3 hash tree, both fatal
    CrcOnly, // CRC32 only, fatal
    Quick,   // CRC32 only, mismatches logged as warnings
};

// Compression mode for writing bundles
enum class EBundleCompression
{
    None,
    LZ4,
    LZ4HC,
    Zstd,
    ZstdFast,
};

enum class EBundleCompressionLevel
{
    Default,
    Fast,
    High,
    Max,
};

struct SNAPI_GRAPHBUNDLE_API BundleLoadConfig
{
    EVerificationMode Verification = EVerificationMode::Full;

    // Number of worker threads (0 = auto, 1 = run every stage on the calling thread)
    uint32_t WorkerThreads = 0;

    // Ceilings against corrupted or hostile files
    uint32_t MaxChunkCount = 10'000'000;
    uint64_t MaxChunkSize = 1'000'000'000;           // stored bytes, 1 GB
    uint64_t MaxDecompressedChunkSize = 1'000'000'000; // 1 GB
    uint32_t MaxCompressionRatio = 256;
    uint32_t MaxRecursionDepth = 256;
    uint32_t MaxHashTreeDepth = 64;

    // Every non-hash chunk must be covered by exactly one hash leaf
    bool bRequireFullHashCoverage = true;

    // Ask the OS to read the mapping ahead (madvise / page touch)
    bool bPrefetch = true;

    std::shared_ptr<IBundleLogger> Logger;
};

struct SNAPI_GRAPHBUNDLE_API BundleWriteConfig
{
    EBundleCompression Compression = EBundleCompression::None;
    EBundleCompressionLevel CompressionLevel = EBundleCompressionLevel::Default;

    // Blobs smaller than this are stored uncompressed
    uint64_t MinCompressSize = 64;

    // Chunks that would expand past this ratio are stored uncompressed, so readers with the default
    // MaxCompressionRatio accept them
    uint32_t MaxCompressionRatio = 256;

    // Maximum children per hash branch
    uint32_t HashFanout = 16;

    // Re-open the finished image with the reader's Full pipeline before returning it
    bool bVerifyOnFinalize = true;

    std::shared_ptr<IBundleLogger> Logger;
};

} // namespace SnAPI::GraphBundle
