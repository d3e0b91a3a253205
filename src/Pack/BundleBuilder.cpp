#include "BundleBuilder.h"

#include "Bundle.h"
#include "ChunkTable.h"
#include "Compression.h"
#include "SnBndFormat.h"
#include "Hashing/Hashing.h"

#include <algorithm>
#include <cstring>
#include <filesystem>
#include <fstream>
#include <limits>
#include <stdexcept>
#include <unordered_map>

namespace SnAPI::GraphBundle
{

  namespace
  {
    struct PendingGraph
    {
        std::vector<ChunkIndex> Nodes;
        std::vector<Pack::SnBndEdgeEntryV1> Edges;
        std::vector<Pack::SnBndPropertyEntryV1> Props;
        uint32_t Flags = Pack::GraphFlag_None;
    };

    struct PendingChunk
    {
        EChunkKind Kind = EChunkKind::Blob;
        std::vector<uint8_t> Bytes; // Blob payload
        bool bCompress = true;
        PendingGraph Graph;
    };

    // A chunk ready for layout
    struct StoredChunk
    {
        EChunkKind Kind = EChunkKind::Blob;
        std::vector<uint8_t> Logical;
        std::vector<uint8_t> Stored; // empty when Logical is stored as is
        EChunkCodec Codec = EChunkCodec::None;
        ChunkIndex Dictionary = kNoChunk;

        const std::vector<uint8_t>& StoredBytes() const { return Codec == EChunkCodec::None ? Logical : Stored; }
    };

    template <typename T>
    void AppendPod(std::vector<uint8_t>& Out, const T& Value)
    {
      const auto* Bytes = reinterpret_cast<const uint8_t*>(&Value);
      Out.insert(Out.end(), Bytes, Bytes + sizeof(T));
    }

    std::vector<uint8_t> SerializeGraph(const PendingGraph& Graph)
    {
      Pack::SnBndGraphHeaderV1 Header = {};
      Header.NodeCount = static_cast<uint32_t>(Graph.Nodes.size());
      Header.EdgeCount = static_cast<uint32_t>(Graph.Edges.size());
      Header.PropCount = static_cast<uint32_t>(Graph.Props.size());
      Header.Flags = Graph.Flags;
      Header.NodesOffset = Pack::AlignUp(sizeof(Header), Pack::kGraphTableAlignment);
      Header.EdgesOffset =
          Pack::AlignUp(Header.NodesOffset + Graph.Nodes.size() * sizeof(Pack::SnBndNodeEntryV1), Pack::kGraphTableAlignment);
      Header.PropsOffset =
          Pack::AlignUp(Header.EdgesOffset + Graph.Edges.size() * sizeof(Pack::SnBndEdgeEntryV1), Pack::kGraphTableAlignment);

      std::vector<uint8_t> Out;
      Out.reserve(Header.PropsOffset + Graph.Props.size() * sizeof(Pack::SnBndPropertyEntryV1));
      AppendPod(Out, Header);

      Out.resize(Header.NodesOffset, 0);
      for (ChunkIndex Node : Graph.Nodes)
      {
        AppendPod(Out, Pack::SnBndNodeEntryV1{Node});
      }
      Out.resize(Header.EdgesOffset, 0);
      for (const auto& Edge : Graph.Edges)
      {
        AppendPod(Out, Edge);
      }
      Out.resize(Header.PropsOffset, 0);
      for (const auto& Prop : Graph.Props)
      {
        AppendPod(Out, Prop);
      }
      return Out;
    }
  } // namespace

  struct BundleBuilder::Impl
  {
      BundleWriteConfig Config;
      bool bSealed = false;

      std::vector<PendingChunk> Chunks;
      ChunkIndex Root = kNoChunk;
      ChunkIndex DictionaryChunk = kNoChunk;

      std::vector<std::string> Strings;
      std::unordered_map<std::string, StringId> StringToId;

      Impl()
      {
        // Chunk 0: string pool graph, filled at finalize
        PendingChunk Pool;
        Pool.Kind = EChunkKind::Graph;
        Chunks.push_back(std::move(Pool));
      }

      BundleResult<void> CheckOpen() const
      {
        if (bSealed)
        {
          return MakeError(EBundleErrorCode::BuilderSealed, "Builder is sealed");
        }
        return {};
      }

      // Graph created by the caller (the string pool is not addressable)
      BundleResult<PendingGraph*> UserGraph(ChunkIndex Index)
      {
        if (auto Result = CheckOpen(); !Result)
          return std::unexpected(Result.error());

        if (Index == 0 || Index >= Chunks.size())
        {
          return MakeError(EBundleErrorCode::InvalidArgument, "Unknown graph " + std::to_string(Index));
        }
        if (Chunks[Index].Kind != EChunkKind::Graph)
        {
          return MakeError(EBundleErrorCode::KindMismatch, "Chunk " + std::to_string(Index) + " is not a graph");
        }
        return &Chunks[Index].Graph;
      }

      StringId Intern(std::string_view Text)
      {
        std::string Key(Text);
        auto It = StringToId.find(Key);
        if (It != StringToId.end())
        {
          return It->second;
        }
        const auto Id = static_cast<StringId>(Strings.size());
        Strings.push_back(Key);
        StringToId.emplace(std::move(Key), Id);
        return Id;
      }

      // Compress a blob when worthwhile; throws std::runtime_error from the codec
      void CompressChunk(StoredChunk& Chunk, std::span<const uint8_t> Dictionary) const
      {
        if (Chunk.Logical.size() < Config.MinCompressSize)
        {
          return;
        }

        std::vector<uint8_t> Compressed =
            Pack::Compress(Chunk.Logical.data(), Chunk.Logical.size(), Config.Compression, Config.CompressionLevel, Dictionary);

        // Keep raw when compression does not pay off or when readers would treat it as a bomb
        const EChunkCodec Codec = Pack::CodecFor(Config.Compression);
        Pack::DecompressionLimits Limits;
        Limits.MaxOutputSize = std::numeric_limits<uint64_t>::max();
        Limits.MaxRatio = Config.MaxCompressionRatio;
        const uint64_t Ceiling = Limits.CeilingFor(Pack::RatioBasis(Compressed, Codec));
        if (Compressed.size() >= Chunk.Logical.size() || Ceiling < Chunk.Logical.size())
        {
          return;
        }

        Chunk.Stored = std::move(Compressed);
        Chunk.Codec = Codec;
        Chunk.Dictionary = Dictionary.empty() ? kNoChunk : DictionaryChunk;
      }

      BundleResult<std::vector<uint8_t>> BuildImage() const;

      // BuildImage plus the reader's Full pipeline over the result
      BundleResult<std::vector<uint8_t>> BuildVerifiedImage() const;

      void Seal(size_t ImageSize);
  };

  BundleResult<std::vector<uint8_t>> BundleBuilder::Impl::BuildImage() const
  {
    if (Root == kNoChunk)
    {
      return MakeError(EBundleErrorCode::InvalidState, "No root graph set");
    }

    // Assemble logical chunks: caller chunks, then one blob per string
    std::vector<StoredChunk> Out;
    Out.reserve(Chunks.size() + Strings.size());

    PendingGraph PoolGraph;
    for (const PendingChunk& Pending : Chunks)
    {
      StoredChunk Chunk;
      Chunk.Kind = Pending.Kind;
      if (Pending.Kind == EChunkKind::Blob)
      {
        Chunk.Logical = Pending.Bytes;
      }
      Out.push_back(std::move(Chunk));
    }
    for (const std::string& Text : Strings)
    {
      PoolGraph.Nodes.push_back(static_cast<ChunkIndex>(Out.size()));
      StoredChunk Chunk;
      Chunk.Kind = EChunkKind::Blob;
      Chunk.Logical.assign(Text.begin(), Text.end());
      Out.push_back(std::move(Chunk));
    }

    Out[0].Logical = SerializeGraph(PoolGraph);
    for (size_t i = 1; i < Chunks.size(); ++i)
    {
      if (Chunks[i].Kind == EChunkKind::Graph)
      {
        Out[i].Logical = SerializeGraph(Chunks[i].Graph);
      }
    }

    // Compress caller blobs; graphs and strings stay raw so their tables are read in place
    bool bAnyCompressed = false;
    if (Config.Compression != EBundleCompression::None)
    {
      std::span<const uint8_t> Dictionary;
      if (DictionaryChunk != kNoChunk)
      {
        Dictionary = Chunks[DictionaryChunk].Bytes;
      }

      try
      {
        for (size_t i = 1; i < Chunks.size(); ++i)
        {
          if (Chunks[i].Kind != EChunkKind::Blob || !Chunks[i].bCompress)
            continue;

          CompressChunk(Out[i], i == DictionaryChunk ? std::span<const uint8_t>{} : Dictionary);
          bAnyCompressed |= Out[i].Codec != EChunkCodec::None;
        }
      }
      catch (const std::exception& E)
      {
        return MakeError(EBundleErrorCode::CompressionFailed, E.what());
      }
    }

    // Merkle tree, strictly bottom-up: a leaf per data chunk in index order, then branches
    const size_t DataChunkCount = Out.size();
    std::vector<Digest256> Digests;
    std::vector<ChunkIndex> Level;
    Digests.reserve(DataChunkCount * 2);

    for (size_t i = 0; i < DataChunkCount; ++i)
    {
      Pack::SnBndHashLeafV1 Leaf = {};
      Leaf.Algorithm = Pack::kHashAlgorithmBlake3;
      Leaf.TargetChunk = static_cast<ChunkIndex>(i);
      const Digest256 Digest = Hashing::LeafDigest(Out[i].Logical);
      std::memcpy(Leaf.Digest, Digest.data(), Digest.size());

      StoredChunk Chunk;
      Chunk.Kind = EChunkKind::HashLeaf;
      AppendPod(Chunk.Logical, Leaf);

      Level.push_back(static_cast<ChunkIndex>(Out.size()));
      Out.push_back(std::move(Chunk));
      Digests.push_back(Digest);
    }

    const size_t Fanout = std::max<uint32_t>(Config.HashFanout, 2);
    auto DigestOf = [&](ChunkIndex Index) -> const Digest256& { return Digests[Index - DataChunkCount]; };

    while (Level.size() > 1)
    {
      std::vector<ChunkIndex> NextLevel;
      for (size_t Begin = 0; Begin < Level.size(); Begin += Fanout)
      {
        const size_t End = std::min(Begin + Fanout, Level.size());

        Hashing::BranchHasher Hasher;
        for (size_t c = Begin; c < End; ++c)
        {
          Hasher.AddChild(DigestOf(Level[c]).data());
        }
        const Digest256 Digest = Hasher.Finish();

        Pack::SnBndHashBranchHeaderV1 Branch = {};
        Branch.ChildCount = static_cast<uint32_t>(End - Begin);
        std::memcpy(Branch.Digest, Digest.data(), Digest.size());

        StoredChunk Chunk;
        Chunk.Kind = EChunkKind::HashBranch;
        AppendPod(Chunk.Logical, Branch);
        for (size_t c = Begin; c < End; ++c)
        {
          AppendPod(Chunk.Logical, Level[c]);
        }

        NextLevel.push_back(static_cast<ChunkIndex>(Out.size()));
        Out.push_back(std::move(Chunk));
        Digests.push_back(Digest);
      }
      Level = std::move(NextLevel);
    }

    const ChunkIndex IntegrityRoot = Level.front();

    // Layout
    const auto ChunkCount = static_cast<uint32_t>(Out.size());
    std::vector<Pack::SnBndChunkEntryV1> Table(ChunkCount);
    uint64_t Offset = Pack::ChunkDataStart(ChunkCount);

    for (uint32_t i = 0; i < ChunkCount; ++i)
    {
      const StoredChunk& Chunk = Out[i];
      const std::vector<uint8_t>& Stored = Chunk.StoredBytes();

      Pack::SnBndChunkEntryV1& Entry = Table[i];
      Entry = {};
      Entry.Offset = Offset;
      Entry.Size = Stored.size();
      Entry.Kind = static_cast<uint8_t>(Chunk.Kind);
      Entry.Flags = Chunk.Codec != EChunkCodec::None ? Pack::ChunkFlag_Compressed : Pack::ChunkFlag_None;
      Entry.Codec = static_cast<uint8_t>(Chunk.Codec);
      Entry.Crc32 = Hashing::Crc32(Stored.data(), Stored.size());
      Entry.DictionaryChunk = Chunk.Dictionary;

      Offset = Pack::AlignUp(Offset + Stored.size(), Pack::kChunkAlignment);
    }

    Pack::SnBndHeaderV1 Header = {};
    std::memcpy(Header.Magic, Pack::kSnBndMagic, sizeof(Pack::kSnBndMagic));
    Header.Version = Pack::kSnBndVersion;
    Header.HeaderSize = sizeof(Pack::SnBndHeaderV1);
    Header.Endianness = Pack::kEndianLittle;
    Header.FileSize = Offset;
    Header.RootChunk = Root;
    Header.StringPoolChunk = 0;
    Header.IntegrityChunk = IntegrityRoot;
    Header.ChunkCount = ChunkCount;
    std::memcpy(Header.FileDigest, DigestOf(IntegrityRoot).data(), sizeof(Header.FileDigest));

    if (bAnyCompressed)
    {
      Header.Flags |= Pack::SnBndFlag_HasCompressedChunks;
    }
    for (const PendingChunk& Pending : Chunks)
    {
      if (Pending.Kind == EChunkKind::Graph && (Pending.Graph.Flags & Pack::GraphFlag_HasCycles))
      {
        Header.Flags |= Pack::SnBndFlag_HasCyclicGraphs;
      }
    }
    Header.TableCrc32 =
        Pack::ComputeTableCrc(Header, reinterpret_cast<const uint8_t*>(Table.data()), Table.size() * sizeof(Pack::SnBndChunkEntryV1));

    std::vector<uint8_t> Image;
    try
    {
      Image.assign(Header.FileSize, 0);
    }
    catch (const std::bad_alloc&)
    {
      return MakeError(EBundleErrorCode::AllocationFailed, "Out of memory allocating a " + std::to_string(Header.FileSize) + " byte image");
    }

    std::memcpy(Image.data(), &Header, sizeof(Header));
    std::memcpy(Image.data() + sizeof(Header), Table.data(), Table.size() * sizeof(Pack::SnBndChunkEntryV1));
    for (uint32_t i = 0; i < ChunkCount; ++i)
    {
      const std::vector<uint8_t>& Stored = Out[i].StoredBytes();
      if (!Stored.empty())
      {
        std::memcpy(Image.data() + Table[i].Offset, Stored.data(), Stored.size());
      }
    }

    return Image;
  }

  BundleBuilder::BundleBuilder() : m_Impl(std::make_unique<Impl>()) {}

  BundleBuilder::BundleBuilder(const BundleWriteConfig& Config) : m_Impl(std::make_unique<Impl>())
  {
    m_Impl->Config = Config;
  }

  BundleBuilder::~BundleBuilder() = default;

  BundleBuilder::BundleBuilder(BundleBuilder&&) noexcept = default;
  BundleBuilder& BundleBuilder::operator=(BundleBuilder&&) noexcept = default;

  BundleResult<void> BundleBuilder::CheckOpen() const
  {
    if (!m_Impl)
    {
      return MakeError(EBundleErrorCode::InvalidState, "Builder was moved from");
    }
    return m_Impl->CheckOpen();
  }

  BundleResult<void> BundleBuilder::SetConfig(const BundleWriteConfig& Config) const
  {
    if (auto Result = CheckOpen(); !Result)
      return Result;
    m_Impl->Config = Config;
    return {};
  }

  BundleResult<void> BundleBuilder::SetCompression(EBundleCompression Mode) const
  {
    if (auto Result = CheckOpen(); !Result)
      return Result;
    m_Impl->Config.Compression = Mode;
    return {};
  }

  BundleResult<void> BundleBuilder::SetCompressionLevel(EBundleCompressionLevel Level) const
  {
    if (auto Result = CheckOpen(); !Result)
      return Result;
    m_Impl->Config.CompressionLevel = Level;
    return {};
  }

  BundleResult<ChunkIndex> BundleBuilder::AddBlob(std::span<const uint8_t> Bytes, bool bCompress) const
  {
    if (auto Result = CheckOpen(); !Result)
      return std::unexpected(Result.error());

    PendingChunk Chunk;
    Chunk.Kind = EChunkKind::Blob;
    Chunk.Bytes.assign(Bytes.begin(), Bytes.end());
    Chunk.bCompress = bCompress;

    const auto Index = static_cast<ChunkIndex>(m_Impl->Chunks.size());
    m_Impl->Chunks.push_back(std::move(Chunk));
    return Index;
  }

  BundleResult<void> BundleBuilder::SetDictionary(ChunkIndex DictionaryBlob) const
  {
    if (auto Result = CheckOpen(); !Result)
      return Result;

    if (DictionaryBlob >= m_Impl->Chunks.size() || m_Impl->Chunks[DictionaryBlob].Kind != EChunkKind::Blob)
    {
      return MakeError(EBundleErrorCode::InvalidArgument, "Dictionary must be an existing blob");
    }
    m_Impl->DictionaryChunk = DictionaryBlob;
    return {};
  }

  BundleResult<ChunkIndex> BundleBuilder::CreateGraph() const
  {
    if (auto Result = CheckOpen(); !Result)
      return std::unexpected(Result.error());

    PendingChunk Chunk;
    Chunk.Kind = EChunkKind::Graph;

    const auto Index = static_cast<ChunkIndex>(m_Impl->Chunks.size());
    m_Impl->Chunks.push_back(std::move(Chunk));
    return Index;
  }

  BundleResult<uint32_t> BundleBuilder::AddNode(ChunkIndex Graph, ChunkIndex Target) const
  {
    if (auto Result = CheckOpen(); !Result)
      return std::unexpected(Result.error());
    auto Pending = m_Impl->UserGraph(Graph);
    if (!Pending)
      return std::unexpected(Pending.error());

    if (Target == 0 || Target >= m_Impl->Chunks.size())
    {
      return MakeError(EBundleErrorCode::InvalidArgument, "Node target " + std::to_string(Target) + " is not a blob or graph");
    }

    auto& Nodes = (*Pending)->Nodes;
    Nodes.push_back(Target);
    return static_cast<uint32_t>(Nodes.size() - 1);
  }

  BundleResult<uint32_t> BundleBuilder::AddEdge(ChunkIndex Graph, uint32_t FromNode, uint32_t ToNode, ChunkIndex PayloadGraph) const
  {
    if (auto Result = CheckOpen(); !Result)
      return std::unexpected(Result.error());
    auto Pending = m_Impl->UserGraph(Graph);
    if (!Pending)
      return std::unexpected(Pending.error());

    const size_t NodeCount = (*Pending)->Nodes.size();
    if (FromNode >= NodeCount || ToNode >= NodeCount)
    {
      return MakeError(EBundleErrorCode::InvalidArgument, "Edge endpoint out of range (" + std::to_string(NodeCount) + " nodes)");
    }

    if (PayloadGraph != kNoChunk)
    {
      if (PayloadGraph == 0 || PayloadGraph >= m_Impl->Chunks.size() || m_Impl->Chunks[PayloadGraph].Kind != EChunkKind::Graph)
      {
        return MakeError(EBundleErrorCode::InvalidArgument, "Edge payload " + std::to_string(PayloadGraph) + " is not a graph");
      }
    }

    auto& Edges = (*Pending)->Edges;
    Edges.push_back(Pack::SnBndEdgeEntryV1{FromNode, ToNode, PayloadGraph});
    return static_cast<uint32_t>(Edges.size() - 1);
  }

  BundleResult<void> BundleBuilder::SetProperty(ChunkIndex Graph, std::string_view Key, std::string_view Value) const
  {
    if (auto Result = CheckOpen(); !Result)
      return std::unexpected(Result.error());
    auto Pending = m_Impl->UserGraph(Graph);
    if (!Pending)
      return std::unexpected(Pending.error());

    const StringId KeyId = m_Impl->Intern(Key);
    const StringId ValueId = m_Impl->Intern(Value);

    auto& Props = (*Pending)->Props;
    for (auto& Prop : Props)
    {
      if (Prop.KeyString == KeyId)
      {
        Prop.ValueString = ValueId;
        return {};
      }
    }
    Props.push_back(Pack::SnBndPropertyEntryV1{KeyId, ValueId});
    return {};
  }

  BundleResult<void> BundleBuilder::SetHasCycles(ChunkIndex Graph, bool bHasCycles) const
  {
    if (auto Result = CheckOpen(); !Result)
      return std::unexpected(Result.error());
    auto Pending = m_Impl->UserGraph(Graph);
    if (!Pending)
      return std::unexpected(Pending.error());

    if (bHasCycles)
      (*Pending)->Flags |= Pack::GraphFlag_HasCycles;
    else
      (*Pending)->Flags &= ~static_cast<uint32_t>(Pack::GraphFlag_HasCycles);
    return {};
  }

  BundleResult<void> BundleBuilder::SetParallelGroup(ChunkIndex Graph, bool bParallelGroup) const
  {
    if (auto Result = CheckOpen(); !Result)
      return std::unexpected(Result.error());
    auto Pending = m_Impl->UserGraph(Graph);
    if (!Pending)
      return std::unexpected(Pending.error());

    if (bParallelGroup)
      (*Pending)->Flags |= Pack::GraphFlag_ParallelGroup;
    else
      (*Pending)->Flags &= ~static_cast<uint32_t>(Pack::GraphFlag_ParallelGroup);
    return {};
  }

  BundleResult<void> BundleBuilder::SetRoot(ChunkIndex Graph) const
  {
    if (auto Result = CheckOpen(); !Result)
      return std::unexpected(Result.error());
    auto Pending = m_Impl->UserGraph(Graph);
    if (!Pending)
      return std::unexpected(Pending.error());

    m_Impl->Root = Graph;
    return {};
  }

  BundleResult<std::vector<uint8_t>> BundleBuilder::Impl::BuildVerifiedImage() const
  {
    if (auto Result = CheckOpen(); !Result)
      return std::unexpected(Result.error());

    auto Image = BuildImage();
    if (!Image)
    {
      return Image;
    }

    if (Config.bVerifyOnFinalize)
    {
      BundleLoadConfig Verify;
      Verify.Verification = EVerificationMode::Full;
      Verify.MaxCompressionRatio = Config.MaxCompressionRatio;
      Verify.bPrefetch = false;
      Verify.Logger = Config.Logger;

      Bundle Check;
      if (auto Result = Check.OpenFromMemory(*Image, Verify); !Result)
      {
        return std::unexpected(std::move(Result.error().Prepend("Writer-side verification failed")));
      }
    }

    return Image;
  }

  void BundleBuilder::Impl::Seal(size_t ImageSize)
  {
    bSealed = true;
    if (Config.Logger)
    {
      Config.Logger->LogInfo("Finalized bundle: %zu chunks, %zu strings, %zu bytes", Chunks.size(), Strings.size(), ImageSize);
    }
  }

  BundleResult<std::vector<uint8_t>> BundleBuilder::FinalizeToMemory() const
  {
    if (auto Result = CheckOpen(); !Result)
      return std::unexpected(Result.error());
    auto Image = m_Impl->BuildVerifiedImage();
    if (!Image)
    {
      return Image;
    }

    m_Impl->Seal(Image->size());
    return Image;
  }

  BundleResult<void> BundleBuilder::Finalize(const std::string& OutputPath) const
  {
    if (auto Result = CheckOpen(); !Result)
      return std::unexpected(Result.error());
    auto Image = m_Impl->BuildVerifiedImage();
    if (!Image)
    {
      return std::unexpected(Image.error());
    }

    std::string TempPath = OutputPath + ".tmp";

    {
      std::ofstream File(TempPath, std::ios::binary | std::ios::trunc);
      if (!File.is_open())
      {
        return MakeError(EBundleErrorCode::FileWriteFailed, "Failed to open output file: " + TempPath);
      }
      File.write(reinterpret_cast<const char*>(Image->data()), static_cast<std::streamsize>(Image->size()));
      File.close();
      if (File.fail())
      {
        std::error_code Ignored;
        std::filesystem::remove(TempPath, Ignored);
        return MakeError(EBundleErrorCode::FileWriteFailed, "Failed to write output file: " + TempPath);
      }
    }

    // Atomic rename
    std::error_code Error;
    std::filesystem::rename(TempPath, OutputPath, Error);
    if (Error)
    {
      std::error_code Ignored;
      std::filesystem::remove(TempPath, Ignored);
      return MakeError(EBundleErrorCode::FileWriteFailed, "Failed to rename temp file: " + Error.message());
    }

    m_Impl->Seal(Image->size());
    return {};
  }

  bool BundleBuilder::IsSealed() const
  {
    return m_Impl && m_Impl->bSealed;
  }

  uint32_t BundleBuilder::GetPendingChunkCount() const
  {
    return m_Impl ? static_cast<uint32_t>(m_Impl->Chunks.size()) : 0;
  }

} // namespace SnAPI::GraphBundle
