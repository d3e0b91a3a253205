#include "Compression.h"
#include "SnBndFormat.h"

#include <lz4.h>
#include <lz4hc.h>
#include <zstd.h>

#include <algorithm>
#include <climits>
#include <cstring>
#include <limits>
#include <memory>
#include <new>
#include <stdexcept>
#include <string>

namespace SnAPI::GraphBundle::Pack
{

  namespace
  {
    constexpr size_t kMinOutputStep = 64 * 1024;

    int ClampInt(const int Value, const int MinValue, const int MaxValue)
    {
      if (Value < MinValue)
      {
        return MinValue;
      }
      if (Value > MaxValue)
      {
        return MaxValue;
      }
      return Value;
    }

    int LZ4AccelerationForLevel(const EBundleCompressionLevel Level)
    {
      switch (Level)
      {
      case EBundleCompressionLevel::Fast:
        return 8;
      case EBundleCompressionLevel::High:
      case EBundleCompressionLevel::Max:
      case EBundleCompressionLevel::Default:
      default:
        return 1;
      }
    }

    int LZ4HCLevelForLevel(const EBundleCompressionLevel Level)
    {
      switch (Level)
      {
      case EBundleCompressionLevel::Fast:
        return LZ4HC_CLEVEL_MIN;
      case EBundleCompressionLevel::High:
        return ClampInt(LZ4HC_CLEVEL_DEFAULT + 2, LZ4HC_CLEVEL_MIN, LZ4HC_CLEVEL_MAX);
      case EBundleCompressionLevel::Max:
        return LZ4HC_CLEVEL_MAX;
      case EBundleCompressionLevel::Default:
      default:
        return LZ4HC_CLEVEL_DEFAULT;
      }
    }

    int ZstdLevelForMode(EBundleCompression Mode, EBundleCompressionLevel Level)
    {
      int Target = ZSTD_defaultCLevel();

      if (Mode == EBundleCompression::ZstdFast)
      {
        // Negative levels select zstd's fast strategies
        const int MinFast = -ZSTD_maxCLevel();
        constexpr int MaxFast = -1;

        switch (Level)
        {
          case EBundleCompressionLevel::Fast:    Target = -5; break;
          case EBundleCompressionLevel::High:    Target = -2; break;
          case EBundleCompressionLevel::Max:     Target = -1; break;
          case EBundleCompressionLevel::Default: Target = -3; break;
        }
        return ClampInt(Target, MinFast, MaxFast);
      }

      const int Min = ZSTD_minCLevel();
      const int Max = ZSTD_maxCLevel();
      switch (Level)
      {
        case EBundleCompressionLevel::Fast:    Target = 1; break;
        case EBundleCompressionLevel::High:    Target = ZSTD_defaultCLevel() + 5; break;
        case EBundleCompressionLevel::Max:     Target = Max; break;
        case EBundleCompressionLevel::Default: Target = ZSTD_defaultCLevel(); break;
      }
      return ClampInt(Target, Min, Max);
    }

    struct ZstdContext
    {
      ZSTD_CCtx* CompressCtx = ZSTD_createCCtx();
      ZSTD_DCtx* DecompressCtx = ZSTD_createDCtx();

      ZstdContext() = default;
      ZstdContext(const ZstdContext&) = delete;
      ZstdContext& operator=(const ZstdContext&) = delete;

      ~ZstdContext()
      {
        if (CompressCtx)
        {
          ZSTD_freeCCtx(CompressCtx);
        }
        if (DecompressCtx)
        {
          ZSTD_freeDCtx(DecompressCtx);
        }
      }
    };

    ZstdContext& GetZstdContext()
    {
      static thread_local ZstdContext Context;
      return Context;
    }

    struct LZ4StreamDeleter
    {
      void operator()(LZ4_stream_t* Stream) const { LZ4_freeStream(Stream); }
      void operator()(LZ4_streamHC_t* Stream) const { LZ4_freeStreamHC(Stream); }
    };

    std::vector<uint8_t> CompressLZ4(const uint8_t* Data, size_t Size, EBundleCompression Mode, EBundleCompressionLevel Level,
                                     std::span<const uint8_t> Dictionary)
    {
      if (Size > static_cast<size_t>(LZ4_MAX_INPUT_SIZE))
      {
        throw std::runtime_error("LZ4 input exceeds LZ4_MAX_INPUT_SIZE");
      }
      if (Dictionary.size() > static_cast<size_t>(INT_MAX))
      {
        throw std::runtime_error("LZ4 dictionary too large");
      }

      const int MaxCompressedSize = LZ4_compressBound(static_cast<int>(Size));
      std::vector<uint8_t> Result(sizeof(SnBndLz4BlockHeaderV1) + static_cast<size_t>(MaxCompressedSize));

      SnBndLz4BlockHeaderV1 BlockHeader = {};
      BlockHeader.UncompressedSize = Size;
      std::memcpy(Result.data(), &BlockHeader, sizeof(BlockHeader));

      const auto* Src = reinterpret_cast<const char*>(Data);
      auto* Dst = reinterpret_cast<char*>(Result.data() + sizeof(BlockHeader));
      const auto* Dict = reinterpret_cast<const char*>(Dictionary.data());
      const int DictSize = static_cast<int>(Dictionary.size());

      int CompressedSize = 0;
      if (Mode == EBundleCompression::LZ4HC)
      {
        std::unique_ptr<LZ4_streamHC_t, LZ4StreamDeleter> Stream(LZ4_createStreamHC());
        if (!Stream)
        {
          throw std::runtime_error("LZ4HC stream allocation failed");
        }
        LZ4_resetStreamHC_fast(Stream.get(), LZ4HCLevelForLevel(Level));
        if (DictSize > 0)
        {
          LZ4_loadDictHC(Stream.get(), Dict, DictSize);
        }
        CompressedSize = LZ4_compress_HC_continue(Stream.get(), Src, Dst, static_cast<int>(Size), MaxCompressedSize);
      }
      else
      {
        std::unique_ptr<LZ4_stream_t, LZ4StreamDeleter> Stream(LZ4_createStream());
        if (!Stream)
        {
          throw std::runtime_error("LZ4 stream allocation failed");
        }
        if (DictSize > 0)
        {
          LZ4_loadDict(Stream.get(), Dict, DictSize);
        }
        CompressedSize = LZ4_compress_fast_continue(Stream.get(), Src, Dst, static_cast<int>(Size), MaxCompressedSize,
                                                    LZ4AccelerationForLevel(Level));
      }

      if (CompressedSize <= 0 && Size > 0)
      {
        throw std::runtime_error(Mode == EBundleCompression::LZ4HC ? "LZ4HC compression failed" : "LZ4 compression failed");
      }

      Result.resize(sizeof(BlockHeader) + static_cast<size_t>(std::max(CompressedSize, 0)));
      return Result;
    }

    std::vector<uint8_t> CompressZstd(const uint8_t* Data, size_t Size, EBundleCompression Mode, EBundleCompressionLevel Level,
                                      std::span<const uint8_t> Dictionary)
    {
      std::vector<uint8_t> Result(ZSTD_compressBound(Size));

      const int LevelValue = ZstdLevelForMode(Mode, Level);
      auto& Context = GetZstdContext();
      if (!Context.CompressCtx)
      {
        throw std::runtime_error("Zstd compression context unavailable");
      }

      const size_t CompressedSize = ZSTD_compress_usingDict(Context.CompressCtx, Result.data(), Result.size(), Data, Size,
                                                            Dictionary.data(), Dictionary.size(), LevelValue);

      if (ZSTD_isError(CompressedSize))
      {
        throw std::runtime_error(std::string("Zstd compression failed: ") + ZSTD_getErrorName(CompressedSize));
      }

      Result.resize(CompressedSize);
      return Result;
    }

    BundleResult<void> GrowOutput(std::vector<uint8_t>& Output, const uint64_t Ceiling, const uint64_t Hint)
    {
      uint64_t NewSize = std::max<uint64_t>({Output.size() * 2, kMinOutputStep, Hint});
      NewSize = std::min(NewSize, Ceiling);
      try
      {
        Output.resize(static_cast<size_t>(NewSize));
      }
      catch (const std::bad_alloc&)
      {
        return MakeError(EBundleErrorCode::AllocationFailed, "Failed to allocate " + std::to_string(NewSize) + " bytes for decompression");
      }
      return {};
    }

    std::string CeilingMessage(const uint64_t Ceiling, const DecompressionLimits& Limits, const uint64_t CompressedSize)
    {
      const bool bRatioBound = Ceiling < Limits.MaxOutputSize;
      if (bRatioBound)
      {
        return "output exceeds compression ratio ceiling (" + std::to_string(Limits.MaxRatio) + ":1 over " + std::to_string(CompressedSize) +
               " compressed bytes)";
      }
      return "output exceeds decompressed size ceiling (" + std::to_string(Limits.MaxOutputSize) + " bytes)";
    }

    BundleResult<std::vector<uint8_t>> DecompressZstd(std::span<const uint8_t> Stored, std::span<const uint8_t> Dictionary,
                                                      const DecompressionLimits& Limits)
    {
      const uint64_t Ceiling = Limits.CeilingFor(Stored.size());

      // Reject a declared size over the ceiling before allocating anything
      const unsigned long long Declared = ZSTD_getFrameContentSize(Stored.data(), Stored.size());
      if (Declared == ZSTD_CONTENTSIZE_ERROR)
      {
        return MakeError(EBundleErrorCode::DecompressionFailed, "Zstd frame header is invalid");
      }
      if (Declared != ZSTD_CONTENTSIZE_UNKNOWN && Declared > Ceiling)
      {
        return MakeError(EBundleErrorCode::SizeLimitExceeded, "Zstd " + CeilingMessage(Ceiling, Limits, Stored.size()));
      }

      auto& Context = GetZstdContext();
      ZSTD_DCtx* Ctx = Context.DecompressCtx;
      if (!Ctx)
      {
        return MakeError(EBundleErrorCode::AllocationFailed, "Zstd decompression context unavailable");
      }

      ZSTD_DCtx_reset(Ctx, ZSTD_reset_session_and_parameters);
      if (!Dictionary.empty())
      {
        const size_t DictResult = ZSTD_DCtx_loadDictionary(Ctx, Dictionary.data(), Dictionary.size());
        if (ZSTD_isError(DictResult))
        {
          return MakeError(EBundleErrorCode::DecompressionFailed, std::string("Zstd dictionary load failed: ") + ZSTD_getErrorName(DictResult));
        }
      }

      std::vector<uint8_t> Output;
      size_t Produced = 0;
      ZSTD_inBuffer In = {Stored.data(), Stored.size(), 0};
      const uint64_t Hint = Declared != ZSTD_CONTENTSIZE_UNKNOWN ? Declared : Stored.size() * 4;

      while (true)
      {
        if (Produced == Output.size())
        {
          if (Output.size() >= Ceiling)
          {
            // Output is at the ceiling: any further byte is a violation
            uint8_t Probe = 0;
            ZSTD_outBuffer ProbeOut = {&Probe, 1, 0};
            const size_t InBefore = In.pos;
            const size_t ProbeResult = ZSTD_decompressStream(Ctx, &ProbeOut, &In);
            if (ZSTD_isError(ProbeResult))
            {
              return MakeError(EBundleErrorCode::DecompressionFailed, std::string("Zstd decompression failed: ") + ZSTD_getErrorName(ProbeResult));
            }
            if (ProbeOut.pos > 0)
            {
              return MakeError(EBundleErrorCode::SizeLimitExceeded, "Zstd " + CeilingMessage(Ceiling, Limits, Stored.size()));
            }
            if (ProbeResult == 0 && In.pos == In.size)
            {
              break;
            }
            if (In.pos == InBefore)
            {
              return MakeError(EBundleErrorCode::DecompressionFailed, "Zstd stream truncated");
            }
            continue;
          }

          if (auto Grown = GrowOutput(Output, Ceiling, Hint); !Grown.has_value())
          {
            return std::unexpected(Grown.error());
          }
        }

        ZSTD_outBuffer Out = {Output.data(), Output.size(), Produced};
        const size_t InBefore = In.pos;
        const size_t Result = ZSTD_decompressStream(Ctx, &Out, &In);
        if (ZSTD_isError(Result))
        {
          return MakeError(EBundleErrorCode::DecompressionFailed, std::string("Zstd decompression failed: ") + ZSTD_getErrorName(Result));
        }

        const bool bProgress = Out.pos != Produced || In.pos != InBefore;
        Produced = Out.pos;

        if (Result == 0 && In.pos == In.size)
        {
          break;
        }
        if (!bProgress && Out.pos < Out.size)
        {
          return MakeError(EBundleErrorCode::DecompressionFailed, "Zstd stream truncated");
        }
      }

      Output.resize(Produced);
      return Output;
    }

    BundleResult<std::vector<uint8_t>> DecompressLZ4(std::span<const uint8_t> Stored, std::span<const uint8_t> Dictionary,
                                                     const DecompressionLimits& Limits)
    {
      if (Stored.size() < sizeof(SnBndLz4BlockHeaderV1))
      {
        return MakeError(EBundleErrorCode::DecompressionFailed, "LZ4 chunk too small for block header");
      }

      SnBndLz4BlockHeaderV1 BlockHeader;
      std::memcpy(&BlockHeader, Stored.data(), sizeof(BlockHeader));
      const auto Block = Stored.subspan(sizeof(BlockHeader));

      const uint64_t Ceiling = Limits.CeilingFor(RatioBasis(Stored, EChunkCodec::LZ4));
      if (BlockHeader.UncompressedSize > Ceiling)
      {
        return MakeError(EBundleErrorCode::SizeLimitExceeded, "LZ4 " + CeilingMessage(Ceiling, Limits, Block.size()));
      }
      if (BlockHeader.UncompressedSize > static_cast<uint64_t>(LZ4_MAX_INPUT_SIZE) || Block.size() > static_cast<size_t>(INT_MAX) ||
          Dictionary.size() > static_cast<size_t>(INT_MAX))
      {
        return MakeError(EBundleErrorCode::DecompressionFailed, "LZ4 block exceeds format limits");
      }

      std::vector<uint8_t> Output;
      try
      {
        Output.resize(static_cast<size_t>(BlockHeader.UncompressedSize));
      }
      catch (const std::bad_alloc&)
      {
        return MakeError(EBundleErrorCode::AllocationFailed, "Failed to allocate " + std::to_string(BlockHeader.UncompressedSize) + " bytes for decompression");
      }

      // LZ4_decompress_safe never writes past the destination capacity
      const int DecompressedSize = LZ4_decompress_safe_usingDict(
          reinterpret_cast<const char*>(Block.data()), reinterpret_cast<char*>(Output.data()), static_cast<int>(Block.size()),
          static_cast<int>(Output.size()), reinterpret_cast<const char*>(Dictionary.data()), static_cast<int>(Dictionary.size()));

      if (DecompressedSize < 0 || static_cast<uint64_t>(DecompressedSize) != BlockHeader.UncompressedSize)
      {
        return MakeError(EBundleErrorCode::DecompressionFailed, "LZ4 decompression failed or size mismatch");
      }

      return Output;
    }

  } // namespace

  uint64_t DecompressionLimits::CeilingFor(const uint64_t CompressedSize) const
  {
    uint64_t RatioCeiling = std::numeric_limits<uint64_t>::max();
    if (CompressedSize == 0 || MaxRatio <= std::numeric_limits<uint64_t>::max() / CompressedSize)
    {
      RatioCeiling = CompressedSize * MaxRatio;
    }
    return std::min(MaxOutputSize, RatioCeiling);
  }

  uint64_t RatioBasis(std::span<const uint8_t> Stored, const EChunkCodec Codec)
  {
    if (Codec == EChunkCodec::LZ4)
    {
      return Stored.size() > sizeof(SnBndLz4BlockHeaderV1) ? Stored.size() - sizeof(SnBndLz4BlockHeaderV1) : 0;
    }
    return Stored.size();
  }

  EChunkCodec CodecFor(const EBundleCompression Mode)
  {
    switch (Mode)
    {
      case EBundleCompression::LZ4:
      case EBundleCompression::LZ4HC:
        return EChunkCodec::LZ4;
      case EBundleCompression::Zstd:
      case EBundleCompression::ZstdFast:
        return EChunkCodec::Zstd;
      case EBundleCompression::None:
      default:
        return EChunkCodec::None;
    }
  }

  std::vector<uint8_t> Compress(const uint8_t* Data, size_t Size, EBundleCompression Mode, EBundleCompressionLevel Level,
                                std::span<const uint8_t> Dictionary)
  {
    switch (Mode)
    {
      case EBundleCompression::None:
        return {Data, Data + Size};
      case EBundleCompression::LZ4:
      case EBundleCompression::LZ4HC:
        return CompressLZ4(Data, Size, Mode, Level, Dictionary);
      case EBundleCompression::Zstd:
      case EBundleCompression::ZstdFast:
        return CompressZstd(Data, Size, Mode, Level, Dictionary);
    }
    throw std::runtime_error("Unknown compression mode");
  }

  BundleResult<std::vector<uint8_t>> Decompress(std::span<const uint8_t> Stored, EChunkCodec Codec, std::span<const uint8_t> Dictionary,
                                                const DecompressionLimits& Limits)
  {
    switch (Codec)
    {
      case EChunkCodec::Zstd:
        return DecompressZstd(Stored, Dictionary, Limits);
      case EChunkCodec::LZ4:
        return DecompressLZ4(Stored, Dictionary, Limits);
      case EChunkCodec::None:
        break;
    }
    return MakeError(EBundleErrorCode::DecompressionFailed, "Unknown compression codec: " + std::to_string(static_cast<int>(Codec)));
  }

} // namespace SnAPI::GraphBundle::Pack
