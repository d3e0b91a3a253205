#include "IBundleLogger.h"

#include <cstdarg>
#include <cstdio>
#include <mutex>

namespace SnAPI::GraphBundle
{

  class ConsoleLogger : public IBundleLogger
  {
    public:
      void LogInfo(const char* Fmt, ...) override
      {
        std::lock_guard Lock(m_LogMutex);
        va_list Args;
        va_start(Args, Fmt);
        std::printf("[INFO] ");
        std::vprintf(Fmt, Args);
        std::printf("\n");
        va_end(Args);
      }

      void LogWarn(const char* Fmt, ...) override
      {
        std::lock_guard Lock(m_LogMutex);
        va_list Args;
        va_start(Args, Fmt);
        std::printf("[WARN] ");
        std::vprintf(Fmt, Args);
        std::printf("\n");
        va_end(Args);
      }

      void LogError(const char* Fmt, ...) override
      {
        std::lock_guard Lock(m_LogMutex);
        va_list Args;
        va_start(Args, Fmt);
        std::fprintf(stderr, "[ERROR] ");
        std::vfprintf(stderr, Fmt, Args);
        std::fprintf(stderr, "\n");
        va_end(Args);
      }

    private:
      std::mutex m_LogMutex;
  };

  std::shared_ptr<IBundleLogger> CreateConsoleLogger()
  {
    return std::make_shared<ConsoleLogger>();
  }

} // namespace SnAPI::GraphBundle
