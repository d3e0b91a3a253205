#pragma once

#include <cstddef>
#include <cstdint>
#include <memory>
#include <span>

#include "BundleTypes.h"

namespace SnAPI::GraphBundle::Hashing
{

  // CRC32 (zlib polynomial) of the stored bytes of a chunk
  uint32_t Crc32(const uint8_t* Data, size_t Size);

  // Continues a running CRC32 over more bytes
  uint32_t Crc32(uint32_t Crc, const uint8_t* Data, size_t Size);

  // 64-bit non-cryptographic hash used for string lookup
  uint64_t Hash64(const void* Data, std::size_t Size);

  // Merkle leaf: BLAKE3(0x00 || Bytes)
  Digest256 LeafDigest(std::span<const uint8_t> Bytes);

  // Merkle branch: BLAKE3(0x01 || Children[0] || Children[1] || ...)
  Digest256 BranchDigest(std::span<const Digest256> Children);

  // Incremental form of BranchDigest, for children that are not contiguous in memory
  class BranchHasher
  {
    public:
      BranchHasher();
      ~BranchHasher();

      void AddChild(const uint8_t* ChildDigest);
      Digest256 Finish();

      BranchHasher(const BranchHasher&) = delete;
      BranchHasher& operator=(const BranchHasher&) = delete;

    private:
      struct State;
      std::unique_ptr<State> m_State;
  };

} // namespace SnAPI::GraphBundle::Hashing
