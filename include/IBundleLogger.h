#pragma once

#include <memory>

#include "Export.h"

namespace SnAPI::GraphBundle
{

class SNAPI_GRAPHBUNDLE_API IBundleLogger
{
public:
    virtual ~IBundleLogger() = default;

    virtual void LogInfo(const char* Fmt, ...) = 0;
    virtual void LogWarn(const char* Fmt, ...) = 0;
    virtual void LogError(const char* Fmt, ...) = 0;
};

// Thread-safe logger writing [INFO]/[WARN] to stdout and [ERROR] to stderr
SNAPI_GRAPHBUNDLE_API std::shared_ptr<IBundleLogger> CreateConsoleLogger();

} // namespace SnAPI::GraphBundle
