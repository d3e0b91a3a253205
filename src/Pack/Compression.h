#pragma once

#include <cstdint>
#include <span>
#include <vector>

#include "BundleConfig.h"
#include "BundleError.h"
#include "BundleTypes.h"

namespace SnAPI::GraphBundle::Pack
{

  // Ceilings applied while a chunk expands
  struct DecompressionLimits
  {
      uint64_t MaxOutputSize = 0;
      uint32_t MaxRatio = 0;

      // min(MaxOutputSize, MaxRatio * CompressedSize) without overflow
      uint64_t CeilingFor(uint64_t CompressedSize) const;
  };

  // Stored bytes a chunk's ratio is measured against. Excludes the LZ4 size prefix.
  uint64_t RatioBasis(std::span<const uint8_t> Stored, EChunkCodec Codec);

  // Codec tag stored in the chunk table for a write-side mode
  EChunkCodec CodecFor(EBundleCompression Mode);

  // Write path. Throws std::runtime_error on failure.
  std::vector<uint8_t> Compress(const uint8_t* Data, size_t Size, EBundleCompression Mode, EBundleCompressionLevel Level,
                                std::span<const uint8_t> Dictionary = {});

  // Read path. Aborts with SizeLimitExceeded as soon as the output would cross the ceiling.
  BundleResult<std::vector<uint8_t>> Decompress(std::span<const uint8_t> Stored, EChunkCodec Codec, std::span<const uint8_t> Dictionary,
                                                const DecompressionLimits& Limits);

} // namespace SnAPI::GraphBundle::Pack
