#include <catch2/catch_test_macros.hpp>

#include "TestHelpers.h"

#include <cstring>
#include <limits>
#include <random>

using namespace SnAPI::GraphBundle;
using namespace SnAPI::GraphBundle::Pack;
using namespace SnAPI::GraphBundle::Tests;

namespace
{
    BundleResult<void> OpenImage(const std::vector<uint8_t>& Image, const BundleLoadConfig& Config = {})
    {
        Bundle B;
        return B.OpenFromMemory(Image, Config);
    }
} // namespace

TEST_CASE("Valid bundle opens from a file", "[corruption]")
{
    SampleBundle Sample = BuildSampleBundle();
    std::string Path = CreateTempBundle(Sample.Image);

    Bundle B;
    auto Result = B.Open(Path);

    REQUIRE(Result.has_value());
    REQUIRE(B.GetState() == EBundleState::Hydrated);

    B.Close();
    CleanupTempBundle(Path);
}

TEST_CASE("Corrupted magic fails to open", "[corruption]")
{
    SampleBundle Sample = BuildSampleBundle();
    Sample.Image[0] = 'X';

    auto Result = OpenImage(Sample.Image);

    REQUIRE_FALSE(Result.has_value());
    REQUIRE(Result.error().Code == EBundleErrorCode::BadMagic);
    REQUIRE(Result.error().Category == EBundleErrorCategory::Format);
}

TEST_CASE("Wrong version fails to open", "[corruption]")
{
    SampleBundle Sample = BuildSampleBundle();

    // Version is bytes 8-11
    Sample.Image[8] = 99;

    auto Result = OpenImage(Sample.Image);

    REQUIRE_FALSE(Result.has_value());
    REQUIRE(Result.error().Code == EBundleErrorCode::UnsupportedVersion);
}

TEST_CASE("Big-endian marker fails to open", "[corruption]")
{
    SampleBundle Sample = BuildSampleBundle();
    SnBndHeaderV1 Header = ReadHeader(Sample.Image);
    Header.Endianness = 2;
    WriteHeader(Sample.Image, Header);

    auto Result = OpenImage(Sample.Image);

    REQUIRE_FALSE(Result.has_value());
    REQUIRE(Result.error().Code == EBundleErrorCode::UnsupportedFeature);
}

TEST_CASE("Non-zero reserved header bytes fail to open", "[corruption]")
{
    SampleBundle Sample = BuildSampleBundle();
    SnBndHeaderV1 Header = ReadHeader(Sample.Image);
    Header.Reserved[10] = 1;
    WriteHeader(Sample.Image, Header);

    auto Result = OpenImage(Sample.Image);

    REQUIRE_FALSE(Result.has_value());
    REQUIRE(Result.error().Code == EBundleErrorCode::BadHeader);
}

TEST_CASE("Non-existent file fails to open", "[corruption]")
{
    Bundle B;
    auto Result = B.Open("/nonexistent/path/file.snbnd");

    REQUIRE_FALSE(Result.has_value());
    REQUIRE(Result.error().Category == EBundleErrorCategory::Io);
    REQUIRE(Result.error().Code == EBundleErrorCode::FileOpenFailed);
    REQUIRE(B.GetState() == EBundleState::Failed);
}

TEST_CASE("Empty file fails to open", "[corruption]")
{
    std::string Path = CreateTempBundle({});

    Bundle B;
    auto Result = B.Open(Path);

    REQUIRE_FALSE(Result.has_value());
    REQUIRE(Result.error().Code == EBundleErrorCode::BadHeader);

    CleanupTempBundle(Path);
}

TEST_CASE("Truncated header fails to open", "[corruption]")
{
    SampleBundle Sample = BuildSampleBundle();
    Sample.Image.resize(50);

    auto Result = OpenImage(Sample.Image);

    REQUIRE_FALSE(Result.has_value());
    REQUIRE(Result.error().Code == EBundleErrorCode::BadHeader);
}

TEST_CASE("Truncated file fails the declared size check", "[corruption]")
{
    SampleBundle Sample = BuildSampleBundle();
    Sample.Image.resize(Sample.Image.size() - 8);

    auto Result = OpenImage(Sample.Image);

    REQUIRE_FALSE(Result.has_value());
    REQUIRE(Result.error().Code == EBundleErrorCode::BadHeader);
}

TEST_CASE("Chunk count above the configured ceiling is a resource error", "[corruption]")
{
    SampleBundle Sample = BuildSampleBundle();

    BundleLoadConfig Config;
    Config.MaxChunkCount = 4;

    auto Result = OpenImage(Sample.Image, Config);

    REQUIRE_FALSE(Result.has_value());
    REQUIRE(Result.error().Category == EBundleErrorCategory::Resource);
    REQUIRE(Result.error().Code == EBundleErrorCode::LimitExceeded);
}

TEST_CASE("Chunk table edits without a CRC update fail the table CRC", "[corruption]")
{
    SampleBundle Sample = BuildSampleBundle();
    Sample.Image[EntryOffset(1) + 20] ^= 0x01;

    auto Result = OpenImage(Sample.Image);

    REQUIRE_FALSE(Result.has_value());
    REQUIRE(Result.error().Category == EBundleErrorCategory::Integrity);
    REQUIRE(Result.error().Code == EBundleErrorCode::TableCrcMismatch);
}

TEST_CASE("Chunk descriptor violations are format errors", "[corruption]")
{
    SampleBundle Sample = BuildSampleBundle();
    const uint32_t Target = Sample.BlobB;
    const SnBndChunkEntryV1 Original = ReadEntry(Sample.Image, Target);
    const SnBndHeaderV1 Header = ReadHeader(Sample.Image);

    auto Expect = [&](const SnBndChunkEntryV1& Entry, EBundleErrorCode Code) {
        std::vector<uint8_t> Image = Sample.Image;
        WriteEntry(Image, Target, Entry);
        auto Result = OpenImage(Image);
        REQUIRE_FALSE(Result.has_value());
        REQUIRE(Result.error().Code == Code);
    };

    SECTION("Offset beyond file size")
    {
        SnBndChunkEntryV1 Entry = Original;
        Entry.Offset = Header.FileSize + 8;
        Expect(Entry, EBundleErrorCode::ChunkOutOfBounds);
    }

    SECTION("Offset plus size overflows")
    {
        SnBndChunkEntryV1 Entry = Original;
        Entry.Offset = std::numeric_limits<uint64_t>::max() - 7;
        Entry.Size = 16;
        Expect(Entry, EBundleErrorCode::ChunkOutOfBounds);
    }

    SECTION("Overlaps the chunk table")
    {
        SnBndChunkEntryV1 Entry = Original;
        Entry.Offset = sizeof(SnBndHeaderV1);
        Expect(Entry, EBundleErrorCode::ChunkOverlap);
    }

    SECTION("Overlaps another chunk")
    {
        SnBndChunkEntryV1 Entry = Original;
        Entry.Offset = ReadEntry(Sample.Image, Sample.BlobA).Offset;
        Expect(Entry, EBundleErrorCode::ChunkOverlap);
    }

    SECTION("Misaligned offset")
    {
        SnBndChunkEntryV1 Entry = Original;
        Entry.Offset += 1;
        Entry.Size -= 1;
        Expect(Entry, EBundleErrorCode::ChunkMisaligned);
    }

    SECTION("Unknown kind")
    {
        SnBndChunkEntryV1 Entry = Original;
        Entry.Kind = 9;
        Expect(Entry, EBundleErrorCode::MalformedChunkTable);
    }

    SECTION("Unknown flag bits")
    {
        SnBndChunkEntryV1 Entry = Original;
        Entry.Flags = 0x80;
        Expect(Entry, EBundleErrorCode::MalformedChunkTable);
    }

    SECTION("Codec set without the compressed flag")
    {
        SnBndChunkEntryV1 Entry = Original;
        Entry.Codec = static_cast<uint8_t>(EChunkCodec::Zstd);
        Expect(Entry, EBundleErrorCode::MalformedChunkTable);
    }

    SECTION("Non-zero reserved field")
    {
        SnBndChunkEntryV1 Entry = Original;
        Entry.Reserved1 = 7;
        Expect(Entry, EBundleErrorCode::MalformedChunkTable);
    }

    SECTION("Dictionary on an uncompressed chunk")
    {
        SnBndChunkEntryV1 Entry = Original;
        Entry.DictionaryChunk = Sample.BlobA;
        Expect(Entry, EBundleErrorCode::MalformedChunkTable);
    }

    SECTION("Encrypted chunk")
    {
        SnBndChunkEntryV1 Entry = Original;
        Entry.Flags = ChunkFlag_Encrypted;
        Expect(Entry, EBundleErrorCode::UnsupportedFeature);
    }
}

TEST_CASE("Chunk size above the configured ceiling is a resource error", "[corruption]")
{
    SampleBundle Sample = BuildSampleBundle();

    BundleLoadConfig Config;
    Config.MaxChunkSize = 16;

    auto Result = OpenImage(Sample.Image, Config);

    REQUIRE_FALSE(Result.has_value());
    REQUIRE(Result.error().Code == EBundleErrorCode::LimitExceeded);
}

TEST_CASE("Root index naming a blob is a kind mismatch", "[corruption]")
{
    SampleBundle Sample = BuildSampleBundle();
    SnBndHeaderV1 Header = ReadHeader(Sample.Image);
    Header.RootChunk = Sample.BlobA;
    WriteHeader(Sample.Image, Header);

    auto Result = OpenImage(Sample.Image);

    REQUIRE_FALSE(Result.has_value());
    REQUIRE(Result.error().Code == EBundleErrorCode::KindMismatch);
}

TEST_CASE("Integrity index outside the table is a header error", "[corruption]")
{
    SampleBundle Sample = BuildSampleBundle();
    SnBndHeaderV1 Header = ReadHeader(Sample.Image);
    Header.IntegrityChunk = Header.ChunkCount;
    WriteHeader(Sample.Image, Header);

    auto Result = OpenImage(Sample.Image);

    REQUIRE_FALSE(Result.has_value());
    REQUIRE(Result.error().Code == EBundleErrorCode::BadHeader);
}

TEST_CASE("Header flags must match the content", "[corruption]")
{
    SampleBundle Sample = BuildSampleBundle();
    SnBndHeaderV1 Header = ReadHeader(Sample.Image);

    SECTION("Compressed-chunks flag without compressed chunks")
    {
        Header.Flags |= SnBndFlag_HasCompressedChunks;
    }
    SECTION("Cyclic-graphs flag without flagged graphs")
    {
        Header.Flags |= SnBndFlag_HasCyclicGraphs;
    }
    SECTION("Unknown flag")
    {
        Header.Flags |= 0x100;
    }

    WriteHeader(Sample.Image, Header);
    auto Result = OpenImage(Sample.Image);

    REQUIRE_FALSE(Result.has_value());
    REQUIRE(Result.error().Code == EBundleErrorCode::BadHeader);
}

TEST_CASE("Header fields are sealed by the table CRC", "[corruption]")
{
    SampleBundle Sample = BuildSampleBundle();
    SnBndHeaderV1 Header = ReadHeader(Sample.Image);

    SECTION("Root swapped for another graph")
    {
        Header.RootChunk = Sample.Sub;
    }
    SECTION("String pool swapped for another graph")
    {
        Header.StringPoolChunk = Sample.Payload;
    }
    SECTION("File digest edited")
    {
        Header.FileDigest[31] ^= 0x01;
    }

    WriteRawHeader(Sample.Image, Header);
    auto Result = OpenImage(Sample.Image);

    REQUIRE_FALSE(Result.has_value());
    REQUIRE(Result.error().Category == EBundleErrorCategory::Integrity);
    REQUIRE(Result.error().Code == EBundleErrorCode::TableCrcMismatch);
}

TEST_CASE("Every header byte is covered by a check", "[corruption]")
{
    SampleBundle Sample = BuildSampleBundle();

    for (size_t Offset = 0; Offset < sizeof(SnBndHeaderV1); ++Offset)
    {
        std::vector<uint8_t> Image = Sample.Image;
        Image[Offset] ^= 0x01;

        auto Result = OpenImage(Image, MakeLoadConfig(EVerificationMode::CrcOnly, 1));

        INFO("Flipped header byte at offset " << Offset);
        REQUIRE_FALSE(Result.has_value());
    }
}

TEST_CASE("Any flipped byte is detected", "[corruption]")
{
    SampleBundle Sample = BuildSampleBundle();
    REQUIRE(Sample.Image.size() > sizeof(SnBndHeaderV1));

    // Fixed seed: failures must be reproducible
    std::mt19937 Gen(1234);
    std::uniform_int_distribution<size_t> Dist(0, Sample.Image.size() - 1);

    for (int i = 0; i < 200; ++i)
    {
        std::vector<uint8_t> Image = Sample.Image;
        const size_t Offset = Dist(Gen);
        Image[Offset] ^= static_cast<uint8_t>(1u << (i % 8));

        auto Result = OpenImage(Image, MakeLoadConfig(EVerificationMode::Full, 1));

        INFO("Flipped byte at offset " << Offset);
        REQUIRE_FALSE(Result.has_value());
    }
}

TEST_CASE("Non-zero padding between chunks is rejected", "[corruption]")
{
    SampleBundle Sample = BuildSampleBundle();

    // BlobA is 17 bytes, so 7 bytes of padding follow it
    const SnBndChunkEntryV1 Entry = ReadEntry(Sample.Image, Sample.BlobA);
    REQUIRE(Entry.Size % 8 != 0);
    Sample.Image[Entry.Offset + Entry.Size] = 0xAA;

    auto Result = OpenImage(Sample.Image);

    REQUIRE_FALSE(Result.has_value());
    REQUIRE(Result.error().Code == EBundleErrorCode::MalformedChunkTable);
}
