#include "Hashing.h"
#include "Pack/SnBndFormat.h"

#define XXH_INLINE_ALL
#include <xxhash.h>

#include <blake3.h>
#include <zlib.h>

#include <algorithm>
#include <limits>

namespace SnAPI::GraphBundle::Hashing
{

  uint32_t Crc32(const uint8_t* Data, size_t Size)
  {
    return Crc32(static_cast<uint32_t>(crc32(0L, Z_NULL, 0)), Data, Size);
  }

  uint32_t Crc32(const uint32_t Seed, const uint8_t* Data, size_t Size)
  {
    uLong Crc = Seed;

    // zlib takes a uInt length; feed large chunks in slices
    constexpr size_t kSlice = 1u << 30;
    while (Size > 0)
    {
      const size_t Step = std::min(Size, kSlice);
      Crc = crc32(Crc, Data, static_cast<uInt>(Step));
      Data += Step;
      Size -= Step;
    }
    return static_cast<uint32_t>(Crc);
  }

  uint64_t Hash64(const void* Data, std::size_t Size)
  {
    return XXH3_64bits(Data, Size);
  }

  Digest256 LeafDigest(std::span<const uint8_t> Bytes)
  {
    blake3_hasher Hasher;
    blake3_hasher_init(&Hasher);
    const uint8_t Prefix = Pack::kLeafDigestPrefix;
    blake3_hasher_update(&Hasher, &Prefix, 1);
    blake3_hasher_update(&Hasher, Bytes.data(), Bytes.size());

    Digest256 Out;
    blake3_hasher_finalize(&Hasher, Out.data(), Out.size());
    return Out;
  }

  Digest256 BranchDigest(std::span<const Digest256> Children)
  {
    BranchHasher Hasher;
    for (const auto& Child : Children)
    {
      Hasher.AddChild(Child.data());
    }
    return Hasher.Finish();
  }

  struct BranchHasher::State
  {
      blake3_hasher Hasher;
  };

  BranchHasher::BranchHasher() : m_State(std::make_unique<State>())
  {
    blake3_hasher_init(&m_State->Hasher);
    const uint8_t Prefix = Pack::kBranchDigestPrefix;
    blake3_hasher_update(&m_State->Hasher, &Prefix, 1);
  }

  BranchHasher::~BranchHasher() = default;

  void BranchHasher::AddChild(const uint8_t* ChildDigest)
  {
    blake3_hasher_update(&m_State->Hasher, ChildDigest, 32);
  }

  Digest256 BranchHasher::Finish()
  {
    Digest256 Out;
    blake3_hasher_finalize(&m_State->Hasher, Out.data(), Out.size());
    return Out;
  }

} // namespace SnAPI::GraphBundle::Hashing
