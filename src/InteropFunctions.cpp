#include "surfbridge/InteropFunctions.hpp"

#if !defined(_WIN32) && !defined(_WIN64)
#include <cerrno>
#endif

namespace surfbridge
{

namespace
{
// Win32 error codes reported by wglDXLockObjectsNV / wglDXUnlockObjectsNV.
uint32_t constexpr kErrorInvalidData = 13;
uint32_t constexpr kErrorLockFailed = 167;
uint32_t constexpr kErrorBusy = 170;
}  // namespace

bool InteropFunctions::IsAvailable() const
{
  return m_setResourceShareHandle && m_openDevice && m_closeDevice && m_registerObject &&
         m_unregisterObject && m_lockObjects && m_unlockObjects;
}

uint32_t GetLastPlatformError()
{
#if defined(_WIN32) || defined(_WIN64)
  return static_cast<uint32_t>(::GetLastError());
#else
  return static_cast<uint32_t>(errno);
#endif
}

std::string DescribeInteropError(uint32_t error)
{
  // The driver may report either a plain Win32 code or one wrapped in an HRESULT.
  switch (error & 0xFFFF)
  {
  case kErrorBusy:
    return "object already locked, or not locked on unlock";
  case kErrorInvalidData:
    return "object does not belong to the interop device";
  case kErrorLockFailed:
    return "lock failed";
  default:
    return "unexpected interop error";
  }
}

}  // namespace surfbridge
