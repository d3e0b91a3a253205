#include "MemoryMappedFile.h"

#include <algorithm>
#include <cerrno>
#include <cstring>

#ifdef _WIN32
#  define WIN32_LEAN_AND_MEAN
#  define NOMINMAX
#  include <windows.h>
#else
#  include <fcntl.h>
#  include <sys/mman.h>
#  include <sys/stat.h>
#  include <unistd.h>
#endif

namespace SnAPI::GraphBundle
{

  MemoryMappedFile::~MemoryMappedFile()
  {
    Close();
  }

  BundleResult<void> MemoryMappedFile::Open(const std::string& Path)
  {
    Close();

#ifdef _WIN32
    m_FileHandle = CreateFileA(Path.c_str(), GENERIC_READ, FILE_SHARE_READ, nullptr, OPEN_EXISTING, FILE_ATTRIBUTE_NORMAL, nullptr);

    if (m_FileHandle == INVALID_HANDLE_VALUE)
    {
      m_FileHandle = nullptr;
      return MakeError(EBundleErrorCode::FileOpenFailed, "Failed to open file: " + Path);
    }

    LARGE_INTEGER FileSize;
    if (!GetFileSizeEx(m_FileHandle, &FileSize))
    {
      CloseHandle(m_FileHandle);
      m_FileHandle = nullptr;
      return MakeError(EBundleErrorCode::FileReadFailed, "Failed to get file size: " + Path);
    }

    m_Size = static_cast<size_t>(FileSize.QuadPart);

    if (m_Size == 0)
    {
      // Empty file - no mapping needed
      return {};
    }

    m_MappingHandle = CreateFileMappingA(m_FileHandle, nullptr, PAGE_READONLY, 0, 0, nullptr);

    if (!m_MappingHandle)
    {
      CloseHandle(m_FileHandle);
      m_FileHandle = nullptr;
      return MakeError(EBundleErrorCode::FileReadFailed, "Failed to create file mapping: " + Path);
    }

    m_Data = static_cast<uint8_t*>(MapViewOfFile(m_MappingHandle, FILE_MAP_READ, 0, 0, 0));

    if (!m_Data)
    {
      CloseHandle(m_MappingHandle);
      CloseHandle(m_FileHandle);
      m_MappingHandle = nullptr;
      m_FileHandle = nullptr;
      return MakeError(EBundleErrorCode::FileReadFailed, "Failed to map file: " + Path);
    }

#else // POSIX

    m_Fd = open(Path.c_str(), O_RDONLY);
    if (m_Fd < 0)
    {
      return MakeError(EBundleErrorCode::FileOpenFailed, "Failed to open file: " + Path + " (" + std::strerror(errno) + ")");
    }

    struct stat St;
    if (fstat(m_Fd, &St) < 0)
    {
      close(m_Fd);
      m_Fd = -1;
      return MakeError(EBundleErrorCode::FileReadFailed, "Failed to stat file: " + Path);
    }

    if (!S_ISREG(St.st_mode))
    {
      close(m_Fd);
      m_Fd = -1;
      return MakeError(EBundleErrorCode::FileOpenFailed, "Not a regular file: " + Path);
    }

    m_Size = static_cast<size_t>(St.st_size);

    if (m_Size == 0)
    {
      // Empty file - no mapping needed
      return {};
    }

    void* Mapped = mmap(nullptr, m_Size, PROT_READ, MAP_PRIVATE, m_Fd, 0);
    if (Mapped == MAP_FAILED)
    {
      m_Size = 0;
      close(m_Fd);
      m_Fd = -1;
      return MakeError(EBundleErrorCode::FileReadFailed, "Failed to mmap file: " + Path);
    }
    m_Data = static_cast<uint8_t*>(Mapped);

#endif

    return {};
  }

  void MemoryMappedFile::Close()
  {
#ifdef _WIN32
    if (m_Data)
    {
      UnmapViewOfFile(m_Data);
      m_Data = nullptr;
    }
    if (m_MappingHandle)
    {
      CloseHandle(m_MappingHandle);
      m_MappingHandle = nullptr;
    }
    if (m_FileHandle)
    {
      CloseHandle(m_FileHandle);
      m_FileHandle = nullptr;
    }
#else
    if (m_Data && m_Size > 0)
    {
      munmap(m_Data, m_Size);
      m_Data = nullptr;
    }
    if (m_Fd >= 0)
    {
      close(m_Fd);
      m_Fd = -1;
    }
#endif
    m_Size = 0;
  }

  BundleResult<void> MemoryMappedFile::Prefetch(uint64_t Offset, uint64_t Length) const
  {
    if (!m_Data || Offset >= m_Size)
    {
      return {};
    }
    Length = std::min<uint64_t>(Length, m_Size - Offset);

#ifdef _WIN32
    // Touch one byte per page
    volatile uint8_t Dummy = 0;
    constexpr size_t PageSize = 4096;
    for (size_t I = 0; I < Length; I += PageSize)
    {
      Dummy = m_Data[Offset + I];
    }
    (void)Dummy;
#else
    // madvise wants a page-aligned start
    long PageSize = sysconf(_SC_PAGE_SIZE);
    if (PageSize <= 0)
      PageSize = 4096;
    const uint64_t AlignedOffset = (Offset / static_cast<uint64_t>(PageSize)) * static_cast<uint64_t>(PageSize);
    const uint64_t AlignedLength = Length + (Offset - AlignedOffset);

    if (madvise(m_Data + AlignedOffset, static_cast<size_t>(AlignedLength), MADV_WILLNEED) != 0)
    {
      return MakeError(EBundleErrorCode::PrefetchFailed, std::string("madvise(MADV_WILLNEED) failed: ") + std::strerror(errno));
    }
#endif

    return {};
  }

} // namespace SnAPI::GraphBundle
