#pragma once

#include <cstdint>
#include <span>
#include <vector>

#include "BundleConfig.h"
#include "BundleError.h"
#include "BundleTypes.h"
#include "SnBndFormat.h"

namespace SnAPI::GraphBundle::Pack
{

  // CRC32 over the header with TableCrc32 zeroed, then the descriptor array
  uint32_t ComputeTableCrc(const SnBndHeaderV1& Header, const uint8_t* Table, size_t TableSize);

  // Validates the fixed header against the mapped bytes, including the table CRC
  BundleResult<SnBndHeaderV1> ParseHeader(std::span<const uint8_t> File, const BundleLoadConfig& Config);

  // Validates every chunk descriptor and the header's chunk references.
  // LogicalSize of compressed chunks is left at 0 until they are decompressed.
  BundleResult<std::vector<ChunkInfo>> ParseChunkTable(std::span<const uint8_t> File, const SnBndHeaderV1& Header,
                                                       const BundleLoadConfig& Config);

} // namespace SnAPI::GraphBundle::Pack
