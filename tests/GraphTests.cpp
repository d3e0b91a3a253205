#include <catch2/catch_test_macros.hpp>

#include "TestHelpers.h"

#include "Graph/GraphHydrator.h"
#include "Pack/ChunkTable.h"

#include <algorithm>
#include <atomic>
#include <memory>
#include <string>
#include <thread>
#include <variant>
#include <utility>
#include <vector>

using namespace SnAPI::GraphBundle;
using namespace SnAPI::GraphBundle::Pack;
using namespace SnAPI::GraphBundle::Tests;

namespace
{
    // Parsed tables and string pool over an image, with every graph record still empty
    std::unique_ptr<Detail::BundleContext> MakeUnhydratedContext(const std::vector<uint8_t>& Image)
    {
        auto Ctx = std::make_unique<Detail::BundleContext>();
        Ctx->Bytes = Image;

        auto Header = ParseHeader(Ctx->Bytes, Ctx->Config);
        REQUIRE(Header.has_value());
        Ctx->Header = *Header;

        auto Chunks = ParseChunkTable(Ctx->Bytes, Ctx->Header, Ctx->Config);
        REQUIRE(Chunks.has_value());
        Ctx->Chunks = std::move(*Chunks);

        Ctx->Decompressed.resize(Ctx->Chunks.size());
        Ctx->Graphs = std::make_unique<Detail::GraphRecord[]>(Ctx->Chunks.size());
        REQUIRE(Graph::BuildStringPool(*Ctx).has_value());
        return Ctx;
    }

    // Runs HydrateGraph for one chunk from several threads released together
    std::vector<BundleResult<void>> HydrateConcurrently(Detail::BundleContext& Ctx, ChunkIndex Index, size_t ThreadCount)
    {
        std::vector<BundleResult<void>> Results(ThreadCount);
        std::atomic<bool> bGo{false};
        std::vector<std::thread> Threads;
        for (size_t t = 0; t < ThreadCount; ++t)
        {
            Threads.emplace_back([&, t] {
                while (!bGo.load(std::memory_order_acquire))
                {
                    std::this_thread::yield();
                }
                Results[t] = Graph::HydrateGraph(Ctx, Index);
            });
        }
        bGo.store(true, std::memory_order_release);
        for (auto& Thread : Threads)
        {
            Thread.join();
        }
        return Results;
    }
} // namespace

TEST_CASE("Sample bundle round-trips nodes, edges and properties", "[graph]")
{
    SampleBundle Sample = BuildSampleBundle();
    REQUIRE_FALSE(Sample.Image.empty());

    Bundle B;
    REQUIRE(B.OpenFromMemory(Sample.Image).has_value());

    auto Root = B.GetRootGraph();
    REQUIRE(Root.has_value());
    REQUIRE(Root->GetChunkIndex() == Sample.Root);
    REQUIRE(Root->GetDepth() == 0);
    REQUIRE(Root->GetNodeCount() == 3);
    REQUIRE(Root->GetEdgeCount() == 2);
    REQUIRE(Root->GetPropertyCount() == 2);
    REQUIRE_FALSE(Root->HasCycles());
    REQUIRE_FALSE(Root->IsParallelGroup());

    SECTION("Nodes")
    {
        REQUIRE(*Root->GetNodeKind(0) == EChunkKind::Blob);
        REQUIRE(*Root->GetNodeKind(2) == EChunkKind::Graph);
        REQUIRE(*Root->GetNodeChunk(1) == Sample.BlobB);
        REQUIRE(AsString(*Root->GetNodeBlob(0)) == kBlobAText);
        REQUIRE(AsString(*Root->GetNodeBlob(1)) == kBlobBText);

        auto Sub = Root->GetChildGraph(2);
        REQUIRE(Sub.has_value());
        REQUIRE(Sub->GetChunkIndex() == Sample.Sub);
        REQUIRE(Sub->GetDepth() == 1);
        REQUIRE(*Sub->FindProperty("name") == "sub");

        REQUIRE(Root->GetChildGraph(0).error().Code == EBundleErrorCode::KindMismatch);
        REQUIRE(Root->GetNodeBlob(2).error().Code == EBundleErrorCode::KindMismatch);
        REQUIRE(Root->GetNodeChunk(3).error().Code == EBundleErrorCode::InvalidArgument);
    }

    SECTION("Edges")
    {
        auto First = Root->GetEdge(0);
        REQUIRE(First.has_value());
        REQUIRE(First->FromNode == 0);
        REQUIRE(First->ToNode == 1);
        REQUIRE(First->HasPayload());
        REQUIRE(First->Payload == Sample.Payload);

        auto Payload = Root->GetEdgePayload(0);
        REQUIRE(Payload.has_value());
        REQUIRE(Payload->GetDepth() == 1);
        REQUIRE(*Payload->FindProperty("transform") == "scale");
        REQUIRE(AsString(*Payload->GetNodeBlob(0)) == kBlobBText);

        auto Second = Root->GetEdge(1);
        REQUIRE(Second.has_value());
        REQUIRE_FALSE(Second->HasPayload());
        REQUIRE(Root->GetEdgePayload(1).error().Code == EBundleErrorCode::NotFound);
        REQUIRE(Root->GetEdge(2).error().Code == EBundleErrorCode::InvalidArgument);
    }

    SECTION("Properties")
    {
        std::vector<std::pair<std::string, std::string>> Seen;
        REQUIRE(Root->ForEachProperty([&](std::string_view Key, std::string_view Value) { Seen.emplace_back(Key, Value); }).has_value());
        REQUIRE(Seen.size() == 2);
        REQUIRE(Seen[0] == std::make_pair(std::string("name"), std::string("root")));
        REQUIRE(Seen[1] == std::make_pair(std::string("kind"), std::string("scene")));

        REQUIRE(*Root->FindProperty("kind") == "scene");
        REQUIRE(Root->FindProperty("missing").error().Code == EBundleErrorCode::NotFound);
        // Values are not keys
        REQUIRE(Root->FindProperty("scene").error().Code == EBundleErrorCode::NotFound);

        auto Property = Root->GetProperty(0);
        REQUIRE(Property.has_value());
        REQUIRE(Property->Key == "name");
        REQUIRE(*B.ResolveString(Property->KeyId) == "name");
        REQUIRE(*B.ResolveString(Property->ValueId) == "root");
        REQUIRE(Root->GetProperty(2).error().Code == EBundleErrorCode::InvalidArgument);
    }

    SECTION("String pool")
    {
        auto Pool = B.GetStringPool();
        REQUIRE(Pool.has_value());
        REQUIRE(Pool->GetChunkIndex() == 0);

        // name, root, kind, scene, sub, transform, scale
        REQUIRE(Pool->GetNodeCount() == 7);
        REQUIRE(B.GetStats()->StringCount == 7);
        REQUIRE(B.ResolveString(7).error().Code == EBundleErrorCode::NotFound);
    }
}

TEST_CASE("Chunk views are typed by kind", "[graph]")
{
    SampleBundle Sample = BuildSampleBundle();

    Bundle B;
    REQUIRE(B.OpenFromMemory(Sample.Image).has_value());

    auto Blob = B.GetChunk(Sample.BlobA);
    REQUIRE(Blob.has_value());
    REQUIRE(std::holds_alternative<BlobView>(*Blob));
    REQUIRE(AsString(std::get<BlobView>(*Blob).Bytes) == kBlobAText);

    auto Graph = B.GetChunk(Sample.Sub);
    REQUIRE(Graph.has_value());
    REQUIRE(std::holds_alternative<GraphView>(*Graph));
    REQUIRE(std::get<GraphView>(*Graph).GetNodeCount() == 1);

    const ChunkIndex Integrity = ReadHeader(Sample.Image).IntegrityChunk;
    auto Branch = B.GetChunk(Integrity);
    REQUIRE(Branch.has_value());
    REQUIRE(std::holds_alternative<HashBranchView>(*Branch));
    const auto& Children = std::get<HashBranchView>(*Branch).Children;
    REQUIRE_FALSE(Children.empty());

    auto Leaf = B.GetChunk(Children.front());
    REQUIRE(Leaf.has_value());
    REQUIRE(std::holds_alternative<HashLeafView>(*Leaf));
    REQUIRE(std::get<HashLeafView>(*Leaf).Target == 0);

    REQUIRE(B.GetBlob(Sample.Root).error().Code == EBundleErrorCode::KindMismatch);
    REQUIRE(B.GetGraph(Sample.BlobA).error().Code == EBundleErrorCode::KindMismatch);
    REQUIRE(B.GetChunk(*B.GetChunkCount()).error().Code == EBundleErrorCode::InvalidArgument);
}

TEST_CASE("Flagged composition cycle loads and traversal terminates", "[graph]")
{
    BundleBuilder Builder;
    const ChunkIndex Root = *Builder.CreateGraph();
    const ChunkIndex Other = *Builder.CreateGraph();
    REQUIRE(Builder.AddNode(Root, Other).has_value());
    REQUIRE(Builder.AddNode(Other, Root).has_value());
    REQUIRE(Builder.AddNode(Other, Other).has_value());
    REQUIRE(Builder.SetHasCycles(Root, true).has_value());
    REQUIRE(Builder.SetHasCycles(Other, true).has_value());
    REQUIRE(Builder.SetRoot(Root).has_value());

    auto Image = Builder.FinalizeToMemory();
    REQUIRE(Image.has_value());
    REQUIRE((ReadHeader(*Image).Flags & SnBndFlag_HasCyclicGraphs) != 0);

    Bundle B;
    REQUIRE(B.OpenFromMemory(*Image).has_value());

    std::vector<ChunkIndex> Visited;
    auto Result = B.Traverse([&](const GraphView& Graph, uint32_t) {
        Visited.push_back(Graph.GetChunkIndex());
        return ETraverseAction::Continue;
    });

    REQUIRE(Result.has_value());
    REQUIRE(Visited == std::vector<ChunkIndex>{Root, Other});

    // Following the cycle by hand is bounded by the recursion ceiling
    auto View = B.GetRootGraph();
    REQUIRE(View->HasCycles());
    auto Back = View->GetChildGraph(0)->GetChildGraph(0);
    REQUIRE(Back.has_value());
    REQUIRE(Back->GetChunkIndex() == Root);
    REQUIRE(Back->GetDepth() == 2);
}

TEST_CASE("Unflagged composition cycle is a structural error", "[graph]")
{
    auto Build = [](bool bVerify, BundleBuilder& Builder) {
        BundleWriteConfig Config;
        Config.bVerifyOnFinalize = bVerify;
        REQUIRE(Builder.SetConfig(Config).has_value());

        const ChunkIndex Root = *Builder.CreateGraph();
        const ChunkIndex Other = *Builder.CreateGraph();
        REQUIRE(Builder.AddNode(Root, Other).has_value());
        REQUIRE(Builder.AddNode(Other, Root).has_value());
        REQUIRE(Builder.SetHasCycles(Other, true).has_value());
        REQUIRE(Builder.SetRoot(Root).has_value());
        return Root;
    };

    SECTION("Reader rejects it")
    {
        BundleBuilder Builder;
        Build(false, Builder);
        auto Image = Builder.FinalizeToMemory();
        REQUIRE(Image.has_value());

        Bundle B;
        auto Result = B.OpenFromMemory(*Image);

        REQUIRE_FALSE(Result.has_value());
        REQUIRE(Result.error().Category == EBundleErrorCategory::Format);
        REQUIRE(Result.error().Code == EBundleErrorCode::StructuralCycle);
    }

    SECTION("Writer rejects it and can retry after flagging")
    {
        BundleBuilder Builder;
        const ChunkIndex Root = Build(true, Builder);

        auto Failed = Builder.FinalizeToMemory();
        REQUIRE_FALSE(Failed.has_value());
        REQUIRE(Failed.error().Code == EBundleErrorCode::StructuralCycle);
        REQUIRE_FALSE(Builder.IsSealed());

        REQUIRE(Builder.SetHasCycles(Root, true).has_value());
        auto Image = Builder.FinalizeToMemory();
        REQUIRE(Image.has_value());
        REQUIRE(Builder.IsSealed());
    }
}

TEST_CASE("Unflagged self reference is a structural error", "[graph]")
{
    BundleWriteConfig Config;
    Config.bVerifyOnFinalize = false;
    BundleBuilder Builder(Config);

    const ChunkIndex Root = *Builder.CreateGraph();
    REQUIRE(Builder.AddNode(Root, Root).has_value());
    REQUIRE(Builder.SetRoot(Root).has_value());

    auto Image = Builder.FinalizeToMemory();
    REQUIRE(Image.has_value());

    Bundle B;
    REQUIRE(B.OpenFromMemory(*Image).error().Code == EBundleErrorCode::StructuralCycle);
}

TEST_CASE("Unflagged edge cycle is a structural error", "[graph]")
{
    BundleWriteConfig Config;
    Config.bVerifyOnFinalize = false;
    BundleBuilder Builder(Config);

    const ChunkIndex A = *Builder.AddBlob(AsBytes("a"));
    const ChunkIndex C = *Builder.AddBlob(AsBytes("c"));
    const ChunkIndex Root = *Builder.CreateGraph();
    REQUIRE(Builder.AddNode(Root, A).has_value());
    REQUIRE(Builder.AddNode(Root, C).has_value());
    REQUIRE(Builder.AddEdge(Root, 0, 1).has_value());
    REQUIRE(Builder.AddEdge(Root, 1, 0).has_value());
    REQUIRE(Builder.SetRoot(Root).has_value());

    SECTION("Unflagged")
    {
        auto Image = Builder.FinalizeToMemory();
        REQUIRE(Image.has_value());

        Bundle B;
        REQUIRE(B.OpenFromMemory(*Image).error().Code == EBundleErrorCode::StructuralCycle);
    }

    SECTION("Flagged")
    {
        REQUIRE(Builder.SetHasCycles(Root, true).has_value());
        auto Image = Builder.FinalizeToMemory();
        REQUIRE(Image.has_value());

        Bundle B;
        REQUIRE(B.OpenFromMemory(*Image).has_value());
        REQUIRE(B.GetRootGraph()->HasCycles());
    }
}

TEST_CASE("Graphs reachable from a cycle need no flag", "[graph]")
{
    BundleBuilder Builder;
    const ChunkIndex Blob = *Builder.AddBlob(AsBytes("leaf"));
    const ChunkIndex Root = *Builder.CreateGraph();
    const ChunkIndex Loop = *Builder.CreateGraph();
    const ChunkIndex Leaf = *Builder.CreateGraph();

    // Root <-> Loop is a flagged cycle; Leaf hangs off it and is acyclic
    REQUIRE(Builder.AddNode(Root, Loop).has_value());
    REQUIRE(Builder.AddNode(Loop, Root).has_value());
    REQUIRE(Builder.AddNode(Loop, Leaf).has_value());
    REQUIRE(Builder.AddNode(Leaf, Blob).has_value());
    REQUIRE(Builder.SetHasCycles(Root, true).has_value());
    REQUIRE(Builder.SetHasCycles(Loop, true).has_value());
    REQUIRE(Builder.SetRoot(Root).has_value());

    auto Image = Builder.FinalizeToMemory();
    REQUIRE(Image.has_value());

    Bundle B;
    REQUIRE(B.OpenFromMemory(*Image).has_value());
    REQUIRE_FALSE(B.GetGraph(Leaf)->HasCycles());
}

TEST_CASE("Opening the same file twice gives identical views", "[graph]")
{
    SampleBundle Sample = BuildSampleBundle();
    std::string Path = CreateTempBundle(Sample.Image);

    Bundle First;
    Bundle Second;
    REQUIRE(First.Open(Path).has_value());
    REQUIRE(Second.Open(Path).has_value());

    REQUIRE(*First.GetFileDigest() == *Second.GetFileDigest());
    REQUIRE(*First.GetChunkCount() == *Second.GetChunkCount());

    auto A = First.GetRootGraph();
    auto C = Second.GetRootGraph();
    REQUIRE(A->GetNodeCount() == C->GetNodeCount());
    REQUIRE(A->GetEdgeCount() == C->GetEdgeCount());
    REQUIRE(*A->FindProperty("name") == *C->FindProperty("name"));
    REQUIRE(AsString(*A->GetNodeBlob(1)) == AsString(*C->GetNodeBlob(1)));

    First.Close();
    Second.Close();
    CleanupTempBundle(Path);
}

TEST_CASE("Flat 1000-node graph is read in place", "[graph]")
{
    constexpr uint32_t NodeCount = 1000;

    BundleBuilder Builder;
    const ChunkIndex Root = *Builder.CreateGraph();
    for (uint32_t i = 0; i < NodeCount; ++i)
    {
        const std::string Payload = "asset payload #" + std::to_string(i);
        const ChunkIndex Blob = *Builder.AddBlob(AsBytes(Payload));
        REQUIRE(Builder.AddNode(Root, Blob).has_value());
    }
    REQUIRE(Builder.SetProperty(Root, "name", "flat").has_value());
    REQUIRE(Builder.SetRoot(Root).has_value());

    std::string Path = MakeTempPath("flat");
    REQUIRE(Builder.Finalize(Path).has_value());

    Bundle B;
    REQUIRE(B.Open(Path).has_value());

    auto Stats = B.GetStats();
    REQUIRE(Stats.has_value());
    REQUIRE(Stats->CopiedPayloadBytes == 0);
    REQUIRE(Stats->CompressedChunkCount == 0);
    REQUIRE(Stats->HydratedChunkCount == Stats->GraphCount);
    REQUIRE(Stats->GraphCount == 2); // string pool + root

    const auto Mapped = *B.GetMappedSpan();
    auto View = B.GetRootGraph();
    REQUIRE(View->GetNodeCount() == NodeCount);

    for (uint32_t i = 0; i < NodeCount; ++i)
    {
        auto Blob = View->GetNodeBlob(i);
        REQUIRE(Blob.has_value());
        REQUIRE(Blob->data() >= Mapped.data());
        REQUIRE(Blob->data() + Blob->size() <= Mapped.data() + Mapped.size());
    }
    REQUIRE(AsString(*View->GetNodeBlob(999)) == "asset payload #999");

    auto Name = View->FindProperty("name");
    REQUIRE(Name->data() >= reinterpret_cast<const char*>(Mapped.data()));
    REQUIRE(Name->data() < reinterpret_cast<const char*>(Mapped.data() + Mapped.size()));

    B.Close();
    CleanupTempBundle(Path);
}

TEST_CASE("Recursion depth is bounded", "[graph]")
{
    BundleBuilder Builder;
    std::vector<ChunkIndex> Chain;
    for (int i = 0; i < 5; ++i)
    {
        Chain.push_back(*Builder.CreateGraph());
    }
    for (size_t i = 0; i + 1 < Chain.size(); ++i)
    {
        REQUIRE(Builder.AddNode(Chain[i], Chain[i + 1]).has_value());
    }
    REQUIRE(Builder.SetRoot(Chain.front()).has_value());

    auto Image = Builder.FinalizeToMemory();
    REQUIRE(Image.has_value());

    BundleLoadConfig Config;
    Config.MaxRecursionDepth = 2;

    Bundle B;
    REQUIRE(B.OpenFromMemory(*Image, Config).has_value());

    SECTION("Child access")
    {
        auto Level2 = B.GetRootGraph()->GetChildGraph(0)->GetChildGraph(0);
        REQUIRE(Level2.has_value());
        REQUIRE(Level2->GetDepth() == 2);
        REQUIRE(Level2->GetChildGraph(0).error().Code == EBundleErrorCode::DepthExceeded);
    }

    SECTION("Traversal")
    {
        uint32_t MaxDepth = 0;
        auto Result = B.Traverse([&](const GraphView&, uint32_t Depth) {
            MaxDepth = std::max(MaxDepth, Depth);
            return ETraverseAction::Continue;
        });

        REQUIRE_FALSE(Result.has_value());
        REQUIRE(Result.error().Code == EBundleErrorCode::DepthExceeded);
        REQUIRE(MaxDepth == 2);
    }

    SECTION("Traversal can stop and prune")
    {
        uint32_t Calls = 0;
        auto Stopped = B.Traverse([&](const GraphView&, uint32_t) {
            ++Calls;
            return ETraverseAction::Stop;
        });
        REQUIRE(Stopped.has_value());
        REQUIRE(Calls == 1);

        Calls = 0;
        auto Pruned = B.Traverse([&](const GraphView&, uint32_t Depth) {
            ++Calls;
            return Depth == 1 ? ETraverseAction::SkipChildren : ETraverseAction::Continue;
        });
        REQUIRE(Pruned.has_value());
        REQUIRE(Calls == 2);
    }
}

TEST_CASE("Concurrent hydration of one chunk claims it once", "[graph]")
{
    constexpr size_t kThreads = 8;

    SECTION("Valid graph: every caller succeeds and the record is complete")
    {
        SampleBundle Sample = BuildSampleBundle();
        auto Ctx = MakeUnhydratedContext(Sample.Image);

        for (auto& Result : HydrateConcurrently(*Ctx, Sample.Root, kThreads))
        {
            REQUIRE(Result.has_value());
        }

        const Detail::GraphRecord& Record = Ctx->Graphs[Sample.Root];
        REQUIRE(Record.IsReady());
        REQUIRE(Record.NodeCount == 3);
        REQUIRE(Record.EdgeCount == 2);
        REQUIRE(Record.PropCount == 2);
        REQUIRE(Record.Nodes[0].Chunk == Sample.BlobA);
        REQUIRE(Record.Nodes[2].Chunk == Sample.Sub);
        REQUIRE(Record.Edges[0].PayloadChunk == Sample.Payload);

        const auto Stored = Ctx->StoredBytes(Sample.Root);
        REQUIRE(reinterpret_cast<const uint8_t*>(Record.Nodes) >= Stored.data());
        REQUIRE(reinterpret_cast<const uint8_t*>(Record.Nodes) < Stored.data() + Stored.size());
    }

    SECTION("Malformed graph: only the claiming caller validates it")
    {
        SampleBundle Sample = BuildSampleBundle();
        const SnBndChunkEntryV1 Entry = ReadEntry(Sample.Image, Sample.Root);
        SnBndGraphHeaderV1 GraphHeader;
        std::memcpy(&GraphHeader, Sample.Image.data() + Entry.Offset, sizeof(GraphHeader));
        GraphHeader.NodesOffset += 4;
        std::memcpy(Sample.Image.data() + Entry.Offset, &GraphHeader, sizeof(GraphHeader));

        auto Ctx = MakeUnhydratedContext(Sample.Image);

        size_t Failures = 0;
        for (auto& Result : HydrateConcurrently(*Ctx, Sample.Root, kThreads))
        {
            if (!Result)
            {
                REQUIRE(Result.error().Code == EBundleErrorCode::MalformedGraph);
                ++Failures;
            }
        }

        REQUIRE(Failures == 1);
        REQUIRE_FALSE(Ctx->Graphs[Sample.Root].IsReady());
    }
}

TEST_CASE("Multi-worker open hydrates shared sub-graphs consistently", "[graph]")
{
    constexpr uint32_t kShared = 16;
    constexpr uint32_t kParents = 256;

    BundleBuilder Builder;
    const ChunkIndex Asset = *Builder.AddBlob(AsBytes("shared asset"));

    std::vector<ChunkIndex> Shared;
    for (uint32_t i = 0; i < kShared; ++i)
    {
        const ChunkIndex G = *Builder.CreateGraph();
        for (uint32_t n = 0; n <= i % 4; ++n)
        {
            REQUIRE(Builder.AddNode(G, Asset).has_value());
        }
        REQUIRE(Builder.SetProperty(G, "shared", std::to_string(i)).has_value());
        Shared.push_back(G);
    }

    const ChunkIndex Root = *Builder.CreateGraph();
    std::vector<ChunkIndex> Parents;
    for (uint32_t p = 0; p < kParents; ++p)
    {
        const ChunkIndex G = *Builder.CreateGraph();
        REQUIRE(Builder.AddNode(G, Shared[p % kShared]).has_value());
        REQUIRE(Builder.AddNode(G, Shared[(p * 7 + 3) % kShared]).has_value());
        REQUIRE(Builder.AddEdge(G, 0, 1, Shared[(p + 5) % kShared]).has_value());
        REQUIRE(Builder.AddNode(Root, G).has_value());
        Parents.push_back(G);
    }
    REQUIRE(Builder.SetRoot(Root).has_value());

    auto Image = Builder.FinalizeToMemory();
    REQUIRE(Image.has_value());

    for (uint32_t Threads : {2u, 4u, 8u})
    {
        for (int Round = 0; Round < 4; ++Round)
        {
            Bundle B;
            REQUIRE(B.OpenFromMemory(*Image, MakeLoadConfig(EVerificationMode::Full, Threads)).has_value());

            auto Stats = B.GetStats();
            REQUIRE(Stats.has_value());
            REQUIRE(Stats->HydratedChunkCount == Stats->GraphCount);

            auto RootView = B.GetRootGraph();
            REQUIRE(RootView.has_value());
            REQUIRE(RootView->GetNodeCount() == kParents);

            for (uint32_t p = 0; p < kParents; ++p)
            {
                auto Parent = RootView->GetChildGraph(p);
                REQUIRE(Parent.has_value());
                REQUIRE(Parent->GetChunkIndex() == Parents[p]);

                auto First = Parent->GetChildGraph(0);
                REQUIRE(First.has_value());
                REQUIRE(First->GetNodeCount() == (p % kShared) % 4 + 1);
                REQUIRE(First->FindProperty("shared").value() == std::to_string(p % kShared));

                auto Payload = Parent->GetEdgePayload(0);
                REQUIRE(Payload.has_value());
                REQUIRE(Payload->GetChunkIndex() == Shared[(p + 5) % kShared]);
            }
        }
    }
}
