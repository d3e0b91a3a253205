#include "ChunkTable.h"

#include "Hashing/Hashing.h"

#include <algorithm>
#include <cstring>
#include <string>

namespace SnAPI::GraphBundle::Pack
{

  namespace
  {
    std::string ChunkName(uint32_t Index)
    {
      return "chunk " + std::to_string(Index);
    }

    BundleResult<void> CheckReference(const std::vector<ChunkInfo>& Chunks, uint32_t Index, const char* What,
                                      std::initializer_list<EChunkKind> Allowed)
    {
      if (Index >= Chunks.size())
      {
        return MakeError(EBundleErrorCode::BadHeader,
                         std::string(What) + " index " + std::to_string(Index) + " is outside the chunk table");
      }
      const EChunkKind Kind = Chunks[Index].Kind;
      if (std::find(Allowed.begin(), Allowed.end(), Kind) == Allowed.end())
      {
        return MakeError(EBundleErrorCode::KindMismatch,
                         std::string(What) + " " + ChunkName(Index) + " has kind " + ToString(Kind));
      }
      return {};
    }
  } // namespace

  uint32_t ComputeTableCrc(const SnBndHeaderV1& Header, const uint8_t* Table, const size_t TableSize)
  {
    SnBndHeaderV1 Sealed = Header;
    Sealed.TableCrc32 = 0;
    const uint32_t Crc = Hashing::Crc32(reinterpret_cast<const uint8_t*>(&Sealed), sizeof(Sealed));
    return Hashing::Crc32(Crc, Table, TableSize);
  }

  BundleResult<SnBndHeaderV1> ParseHeader(std::span<const uint8_t> File, const BundleLoadConfig& Config)
  {
    if (File.size() < sizeof(SnBndHeaderV1))
    {
      return MakeError(EBundleErrorCode::BadHeader, "File too small for header (" + std::to_string(File.size()) + " bytes)");
    }

    SnBndHeaderV1 Header;
    std::memcpy(&Header, File.data(), sizeof(Header));

    if (std::memcmp(Header.Magic, kSnBndMagic, sizeof(kSnBndMagic)) != 0)
    {
      return MakeError(EBundleErrorCode::BadMagic, "Invalid magic (not an .snbnd file)");
    }

    if (Header.Version != kSnBndVersion)
    {
      return MakeError(EBundleErrorCode::UnsupportedVersion, "Unsupported version: " + std::to_string(Header.Version));
    }

    if (Header.HeaderSize != sizeof(SnBndHeaderV1))
    {
      return MakeError(EBundleErrorCode::BadHeader, "Invalid header size: " + std::to_string(Header.HeaderSize));
    }

    if (Header.Endianness != kEndianLittle)
    {
      return MakeError(EBundleErrorCode::UnsupportedFeature, "Unsupported endianness: " + std::to_string(Header.Endianness));
    }

    if (!IsZero(Header.Reserved0, sizeof(Header.Reserved0)) || !IsZero(Header.Reserved, sizeof(Header.Reserved)))
    {
      return MakeError(EBundleErrorCode::BadHeader, "Reserved header bytes are not zero");
    }

    if (Header.FileSize != File.size())
    {
      return MakeError(EBundleErrorCode::BadHeader, "File size mismatch: header says " + std::to_string(Header.FileSize) + ", actual " +
                                                        std::to_string(File.size()));
    }

    if ((Header.Flags & ~static_cast<uint32_t>(SnBndFlag_KnownMask)) != 0)
    {
      return MakeError(EBundleErrorCode::BadHeader, "Unknown header flags: " + std::to_string(Header.Flags));
    }

    if (Header.ChunkCount == 0)
    {
      return MakeError(EBundleErrorCode::MalformedChunkTable, "Bundle has no chunks");
    }

    if (Header.ChunkCount > Config.MaxChunkCount)
    {
      return MakeError(EBundleErrorCode::LimitExceeded, "Chunk count " + std::to_string(Header.ChunkCount) + " exceeds limit " +
                                                            std::to_string(Config.MaxChunkCount));
    }

    const uint64_t TableSize = static_cast<uint64_t>(Header.ChunkCount) * sizeof(SnBndChunkEntryV1);
    if (TableSize > File.size() - sizeof(SnBndHeaderV1))
    {
      return MakeError(EBundleErrorCode::MalformedChunkTable, "Chunk table extends beyond file size");
    }

    const uint32_t TableCrc = ComputeTableCrc(Header, File.data() + sizeof(SnBndHeaderV1), static_cast<size_t>(TableSize));
    if (TableCrc != Header.TableCrc32)
    {
      return MakeError(EBundleErrorCode::TableCrcMismatch, "Header or chunk table CRC mismatch");
    }

    return Header;
  }

  BundleResult<std::vector<ChunkInfo>> ParseChunkTable(std::span<const uint8_t> File, const SnBndHeaderV1& Header,
                                                       const BundleLoadConfig& Config)
  {
    const uint64_t FileSize = File.size();
    const uint64_t DataStart = sizeof(SnBndHeaderV1) + static_cast<uint64_t>(Header.ChunkCount) * sizeof(SnBndChunkEntryV1);
    const uint8_t* TablePtr = File.data() + sizeof(SnBndHeaderV1);

    std::vector<ChunkInfo> Chunks(Header.ChunkCount);
    std::vector<uint32_t> RawDictionaries(Header.ChunkCount, kNoChunk);

    for (uint32_t i = 0; i < Header.ChunkCount; ++i)
    {
      SnBndChunkEntryV1 Entry;
      std::memcpy(&Entry, TablePtr + static_cast<size_t>(i) * sizeof(SnBndChunkEntryV1), sizeof(Entry));

      if (Entry.Reserved0 != 0 || Entry.Reserved1 != 0)
      {
        return MakeError(EBundleErrorCode::MalformedChunkTable, ChunkName(i) + ": reserved fields are not zero");
      }

      if (Entry.Kind > static_cast<uint8_t>(EChunkKind::HashBranch))
      {
        return MakeError(EBundleErrorCode::MalformedChunkTable, ChunkName(i) + ": unknown kind " + std::to_string(Entry.Kind));
      }

      if ((Entry.Flags & ~static_cast<uint8_t>(ChunkFlag_KnownMask)) != 0)
      {
        return MakeError(EBundleErrorCode::MalformedChunkTable, ChunkName(i) + ": unknown flags " + std::to_string(Entry.Flags));
      }

      if (Entry.Flags & ChunkFlag_Encrypted)
      {
        return MakeError(EBundleErrorCode::UnsupportedFeature, ChunkName(i) + ": encrypted chunks are not supported");
      }

      const bool bCompressed = (Entry.Flags & ChunkFlag_Compressed) != 0;
      if (bCompressed)
      {
        if (Entry.Codec != static_cast<uint8_t>(EChunkCodec::Zstd) && Entry.Codec != static_cast<uint8_t>(EChunkCodec::LZ4))
        {
          return MakeError(EBundleErrorCode::MalformedChunkTable, ChunkName(i) + ": unknown codec " + std::to_string(Entry.Codec));
        }
      }
      else if (Entry.Codec != static_cast<uint8_t>(EChunkCodec::None))
      {
        return MakeError(EBundleErrorCode::MalformedChunkTable, ChunkName(i) + ": codec set on an uncompressed chunk");
      }

      const auto Kind = static_cast<EChunkKind>(Entry.Kind);
      if (bCompressed && (Kind == EChunkKind::HashLeaf || Kind == EChunkKind::HashBranch))
      {
        return MakeError(EBundleErrorCode::MalformedChunkTable, ChunkName(i) + ": hash chunks cannot be compressed");
      }

      // Overflow-safe bounds check
      if (Entry.Size > FileSize || Entry.Offset > FileSize - Entry.Size)
      {
        return MakeError(EBundleErrorCode::ChunkOutOfBounds, ChunkName(i) + ": extends beyond file size");
      }

      if (Entry.Offset < DataStart)
      {
        return MakeError(EBundleErrorCode::ChunkOverlap, ChunkName(i) + ": overlaps header or chunk table");
      }

      if (Entry.Offset % kChunkAlignment != 0)
      {
        return MakeError(EBundleErrorCode::ChunkMisaligned, ChunkName(i) + ": offset " + std::to_string(Entry.Offset) +
                                                               " is not " + std::to_string(kChunkAlignment) + "-byte aligned");
      }

      if (Entry.Size > Config.MaxChunkSize)
      {
        return MakeError(EBundleErrorCode::LimitExceeded, ChunkName(i) + ": size " + std::to_string(Entry.Size) + " exceeds limit " +
                                                             std::to_string(Config.MaxChunkSize));
      }

      ChunkInfo& Info = Chunks[i];
      Info.Index = i;
      Info.Kind = Kind;
      Info.Offset = Entry.Offset;
      Info.StoredSize = Entry.Size;
      Info.LogicalSize = bCompressed ? 0 : Entry.Size;
      Info.Codec = static_cast<EChunkCodec>(Entry.Codec);
      Info.bCompressed = bCompressed;
      Info.bEncrypted = false;
      Info.Crc32 = Entry.Crc32;
      Info.Dictionary = Entry.DictionaryChunk;
    }

    // Dictionary references need every entry parsed
    for (const ChunkInfo& Info : Chunks)
    {
      if (Info.Dictionary == kNoChunk)
      {
        continue;
      }
      if (!Info.bCompressed)
      {
        return MakeError(EBundleErrorCode::MalformedChunkTable, ChunkName(Info.Index) + ": dictionary set on an uncompressed chunk");
      }
      if (Info.Dictionary >= Chunks.size() || Info.Dictionary == Info.Index)
      {
        return MakeError(EBundleErrorCode::MalformedChunkTable,
                         ChunkName(Info.Index) + ": invalid dictionary reference " + std::to_string(Info.Dictionary));
      }
      const ChunkInfo& Dict = Chunks[Info.Dictionary];
      if (Dict.Kind != EChunkKind::Blob)
      {
        return MakeError(EBundleErrorCode::KindMismatch, ChunkName(Info.Index) + ": dictionary " + ChunkName(Dict.Index) + " is not a Blob");
      }
      if (Dict.Dictionary != kNoChunk)
      {
        return MakeError(EBundleErrorCode::MalformedChunkTable,
                         ChunkName(Info.Index) + ": dictionary " + ChunkName(Dict.Index) + " itself uses a dictionary");
      }
    }

    // Pairwise overlap via a sweep over offsets
    std::vector<uint32_t> Order(Chunks.size());
    for (uint32_t i = 0; i < Order.size(); ++i)
    {
      Order[i] = i;
    }
    std::sort(Order.begin(), Order.end(), [&Chunks](uint32_t A, uint32_t B) {
      if (Chunks[A].Offset != Chunks[B].Offset)
        return Chunks[A].Offset < Chunks[B].Offset;
      return Chunks[A].StoredSize < Chunks[B].StoredSize;
    });

    uint64_t FurthestEnd = DataStart;
    uint32_t FurthestChunk = kNoChunk;
    for (uint32_t Index : Order)
    {
      const ChunkInfo& Info = Chunks[Index];
      if (Info.StoredSize != 0 && Info.Offset < FurthestEnd && FurthestChunk != kNoChunk)
      {
        return MakeError(EBundleErrorCode::ChunkOverlap, ChunkName(Index) + " overlaps " + ChunkName(FurthestChunk));
      }
      if (Info.Offset > FurthestEnd && !IsZero(File.data() + FurthestEnd, static_cast<size_t>(Info.Offset - FurthestEnd)))
      {
        return MakeError(EBundleErrorCode::MalformedChunkTable, "Non-zero padding before " + ChunkName(Index));
      }
      const uint64_t End = Info.Offset + Info.StoredSize;
      if (End > FurthestEnd || FurthestChunk == kNoChunk)
      {
        FurthestEnd = std::max(FurthestEnd, End);
        FurthestChunk = Index;
      }
    }
    if (FurthestEnd < FileSize && !IsZero(File.data() + FurthestEnd, static_cast<size_t>(FileSize - FurthestEnd)))
    {
      return MakeError(EBundleErrorCode::MalformedChunkTable, "Non-zero bytes after the last chunk");
    }

    const bool bAnyCompressed = std::any_of(Chunks.begin(), Chunks.end(), [](const ChunkInfo& Info) { return Info.bCompressed; });
    if (bAnyCompressed != ((Header.Flags & SnBndFlag_HasCompressedChunks) != 0))
    {
      return MakeError(EBundleErrorCode::BadHeader, "Compressed-chunks flag does not match the chunk table");
    }

    if (auto Result = CheckReference(Chunks, Header.RootChunk, "Root graph", {EChunkKind::Graph}); !Result)
    {
      return std::unexpected(Result.error());
    }
    if (auto Result = CheckReference(Chunks, Header.StringPoolChunk, "String pool", {EChunkKind::Graph}); !Result)
    {
      return std::unexpected(Result.error());
    }
    if (auto Result = CheckReference(Chunks, Header.IntegrityChunk, "Integrity root", {EChunkKind::HashLeaf, EChunkKind::HashBranch});
        !Result)
    {
      return std::unexpected(Result.error());
    }

    return Chunks;
  }

} // namespace SnAPI::GraphBundle::Pack
