#include "surfbridge/Logging.hpp"

#include "base/logging.hpp"
#include "base/src_point.hpp"

#include <atomic>
#include <cstdio>
#include <cstdlib>
#include <string>

#if defined(_WIN32) || defined(_WIN64)
#include <windows.h>
#endif

namespace surfbridge
{

namespace
{
std::atomic<bool> g_loggingInitialized{false};

void SurfbridgeLogMessage(base::LogLevel level, base::SrcPoint const & src, std::string const & msg)
{
  char const * levelStr = "UNKNOWN";
  switch (level)
  {
  case base::LDEBUG: levelStr = "DEBUG"; break;
  case base::LINFO: levelStr = "INFO"; break;
  case base::LWARNING: levelStr = "WARN"; break;
  case base::LERROR: levelStr = "ERROR"; break;
  case base::LCRITICAL: levelStr = "CRITICAL"; break;
  default: break;
  }

  std::string const out = std::string("[surfbridge/") + levelStr + "] " + DebugPrint(src) + msg;
  std::fprintf(stderr, "%s\n", out.c_str());
#if defined(_WIN32) || defined(_WIN64)
  OutputDebugStringA((out + "\n").c_str());
#endif

  if (level >= base::LCRITICAL)
  {
    std::fflush(stderr);
    std::abort();
  }
}
}  // namespace

void InitLogging()
{
  if (g_loggingInitialized.exchange(true))
    return;

  base::SetLogMessageFn(&SurfbridgeLogMessage);
  // LERROR reports a failed call the caller can recover from; only LCRITICAL aborts.
  base::g_LogAbortLevel = base::LCRITICAL;
}

}  // namespace surfbridge
