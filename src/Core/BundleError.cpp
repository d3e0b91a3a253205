#include "BundleError.h"
#include "BundleTypes.h"

namespace SnAPI::GraphBundle
{

  BundleError::BundleError(EBundleErrorCode InCode, std::string InMessage)
      : Category(CategoryOf(InCode)), Code(InCode), Message(std::move(InMessage))
  {
  }

  std::string BundleError::ToString() const
  {
    std::string Out = GraphBundle::ToString(Category);
    Out += '/';
    Out += GraphBundle::ToString(Code);
    if (!Message.empty())
    {
      Out += ": ";
      Out += Message;
    }
    return Out;
  }

  BundleError& BundleError::Prepend(const std::string& Context)
  {
    Message = Context + ": " + Message;
    return *this;
  }

  EBundleErrorCategory CategoryOf(EBundleErrorCode Code)
  {
    switch (Code)
    {
      case EBundleErrorCode::FileOpenFailed:
      case EBundleErrorCode::FileReadFailed:
      case EBundleErrorCode::FileWriteFailed:
        return EBundleErrorCategory::Io;

      case EBundleErrorCode::BadMagic:
      case EBundleErrorCode::UnsupportedVersion:
      case EBundleErrorCode::BadHeader:
      case EBundleErrorCode::MalformedChunkTable:
      case EBundleErrorCode::ChunkOutOfBounds:
      case EBundleErrorCode::ChunkOverlap:
      case EBundleErrorCode::ChunkMisaligned:
      case EBundleErrorCode::KindMismatch:
      case EBundleErrorCode::MalformedGraph:
      case EBundleErrorCode::MalformedHashTree:
      case EBundleErrorCode::UnsupportedFeature:
      case EBundleErrorCode::DepthExceeded:
      case EBundleErrorCode::StructuralCycle:
        return EBundleErrorCategory::Format;

      case EBundleErrorCode::TableCrcMismatch:
      case EBundleErrorCode::CrcMismatch:
      case EBundleErrorCode::HashMismatch:
      case EBundleErrorCode::RootDigestMismatch:
      case EBundleErrorCode::CoverageGap:
        return EBundleErrorCategory::Integrity;

      case EBundleErrorCode::LimitExceeded:
      case EBundleErrorCode::AllocationFailed:
      case EBundleErrorCode::PrefetchFailed:
        return EBundleErrorCategory::Resource;

      case EBundleErrorCode::DecompressionFailed:
      case EBundleErrorCode::CompressionFailed:
      case EBundleErrorCode::SizeLimitExceeded:
        return EBundleErrorCategory::Compression;

      case EBundleErrorCode::BundleClosed:
      case EBundleErrorCode::BundleFailed:
      case EBundleErrorCode::InvalidState:
      case EBundleErrorCode::BuilderSealed:
      case EBundleErrorCode::InvalidArgument:
      case EBundleErrorCode::NotFound:
        return EBundleErrorCategory::State;
    }
    return EBundleErrorCategory::State;
  }

  const char* ToString(EBundleErrorCategory Category)
  {
    switch (Category)
    {
      case EBundleErrorCategory::Io:
        return "Io";
      case EBundleErrorCategory::Format:
        return "Format";
      case EBundleErrorCategory::Integrity:
        return "Integrity";
      case EBundleErrorCategory::Resource:
        return "Resource";
      case EBundleErrorCategory::Compression:
        return "Compression";
      case EBundleErrorCategory::State:
        return "State";
    }
    return "Unknown";
  }

  const char* ToString(EBundleErrorCode Code)
  {
    switch (Code)
    {
      case EBundleErrorCode::FileOpenFailed: return "FileOpenFailed";
      case EBundleErrorCode::FileReadFailed: return "FileReadFailed";
      case EBundleErrorCode::FileWriteFailed: return "FileWriteFailed";
      case EBundleErrorCode::BadMagic: return "BadMagic";
      case EBundleErrorCode::UnsupportedVersion: return "UnsupportedVersion";
      case EBundleErrorCode::BadHeader: return "BadHeader";
      case EBundleErrorCode::MalformedChunkTable: return "MalformedChunkTable";
      case EBundleErrorCode::ChunkOutOfBounds: return "ChunkOutOfBounds";
      case EBundleErrorCode::ChunkOverlap: return "ChunkOverlap";
      case EBundleErrorCode::ChunkMisaligned: return "ChunkMisaligned";
      case EBundleErrorCode::KindMismatch: return "KindMismatch";
      case EBundleErrorCode::MalformedGraph: return "MalformedGraph";
      case EBundleErrorCode::MalformedHashTree: return "MalformedHashTree";
      case EBundleErrorCode::UnsupportedFeature: return "UnsupportedFeature";
      case EBundleErrorCode::DepthExceeded: return "DepthExceeded";
      case EBundleErrorCode::StructuralCycle: return "StructuralCycle";
      case EBundleErrorCode::TableCrcMismatch: return "TableCrcMismatch";
      case EBundleErrorCode::CrcMismatch: return "CrcMismatch";
      case EBundleErrorCode::HashMismatch: return "HashMismatch";
      case EBundleErrorCode::RootDigestMismatch: return "RootDigestMismatch";
      case EBundleErrorCode::CoverageGap: return "CoverageGap";
      case EBundleErrorCode::LimitExceeded: return "LimitExceeded";
      case EBundleErrorCode::AllocationFailed: return "AllocationFailed";
      case EBundleErrorCode::PrefetchFailed: return "PrefetchFailed";
      case EBundleErrorCode::DecompressionFailed: return "DecompressionFailed";
      case EBundleErrorCode::CompressionFailed: return "CompressionFailed";
      case EBundleErrorCode::SizeLimitExceeded: return "SizeLimitExceeded";
      case EBundleErrorCode::BundleClosed: return "BundleClosed";
      case EBundleErrorCode::BundleFailed: return "BundleFailed";
      case EBundleErrorCode::InvalidState: return "InvalidState";
      case EBundleErrorCode::BuilderSealed: return "BuilderSealed";
      case EBundleErrorCode::InvalidArgument: return "InvalidArgument";
      case EBundleErrorCode::NotFound: return "NotFound";
    }
    return "Unknown";
  }

  const char* ToString(EChunkKind Kind)
  {
    switch (Kind)
    {
      case EChunkKind::Blob:
        return "Blob";
      case EChunkKind::Graph:
        return "Graph";
      case EChunkKind::HashLeaf:
        return "HashLeaf";
      case EChunkKind::HashBranch:
        return "HashBranch";
    }
    return "Unknown";
  }

  const char* ToString(EBundleState State)
  {
    switch (State)
    {
      case EBundleState::Unopened:
        return "Unopened";
      case EBundleState::HeaderValidated:
        return "HeaderValidated";
      case EBundleState::ChunkTableValidated:
        return "ChunkTableValidated";
      case EBundleState::CrcVerified:
        return "CrcVerified";
      case EBundleState::HashVerified:
        return "HashVerified";
      case EBundleState::Hydrated:
        return "Hydrated";
      case EBundleState::Closed:
        return "Closed";
      case EBundleState::Failed:
        return "Failed";
    }
    return "Unknown";
  }

} // namespace SnAPI::GraphBundle
