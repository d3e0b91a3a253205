#pragma once

#include <cstdint>
#include <span>
#include <string>

#include "Export.h"
#include "BundleError.h"

namespace SnAPI::GraphBundle
{

// Read-only memory mapping of a whole file.
// The mapping is never written, so it can be shared by any number of threads.
class SNAPI_GRAPHBUNDLE_API MemoryMappedFile
{
public:
    MemoryMappedFile() = default;
    ~MemoryMappedFile();

    // Open and map a file
    BundleResult<void> Open(const std::string& Path);

    // Unmap and close
    void Close();

    size_t GetSize() const { return m_Size; }

    std::span<const uint8_t> GetSpan() const { return {m_Data, m_Size}; }

    // Hint the OS to read a region ahead
    BundleResult<void> Prefetch(uint64_t Offset, uint64_t Length) const;

    // Owns the mapping; not copyable or movable
    MemoryMappedFile(const MemoryMappedFile&) = delete;
    MemoryMappedFile& operator=(const MemoryMappedFile&) = delete;

private:
    uint8_t* m_Data = nullptr;
    size_t m_Size = 0;

#ifdef _WIN32
    void* m_FileHandle = nullptr;
    void* m_MappingHandle = nullptr;
#else
    int m_Fd = -1;
#endif
};

} // namespace SnAPI::GraphBundle
