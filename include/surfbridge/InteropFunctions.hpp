#pragma once

#include "surfbridge/GlFunctions.hpp"
#include "surfbridge/Types.hpp"

#include <cstdint>
#include <string>

#if defined(_WIN32) || defined(_WIN64)
#define SURFBRIDGE_WINAPI __stdcall
#else
#define SURFBRIDGE_WINAPI
#endif

namespace surfbridge
{

// WGL_NV_DX_interop access modes
GLenum constexpr kInteropAccessReadOnly = 0x0000;
GLenum constexpr kInteropAccessReadWrite = 0x0001;

// WGL_NV_DX_interop entry points. BOOL is spelled int and HANDLE void * so the
// table can be filled on platforms without windows.h.
typedef int (SURFBRIDGE_WINAPI * DXSetResourceShareHandleFn)(void * dxObject, ShareHandle shareHandle);
typedef InteropDevice (SURFBRIDGE_WINAPI * DXOpenDeviceFn)(void * dxDevice);
typedef int (SURFBRIDGE_WINAPI * DXCloseDeviceFn)(InteropDevice device);
typedef InteropObject (SURFBRIDGE_WINAPI * DXRegisterObjectFn)(InteropDevice device, void * dxObject,
                                                              GLuint name, GLenum type, GLenum access);
typedef int (SURFBRIDGE_WINAPI * DXUnregisterObjectFn)(InteropDevice device, InteropObject object);
typedef int (SURFBRIDGE_WINAPI * DXLockObjectsFn)(InteropDevice device, GLint count, InteropObject * objects);
typedef int (SURFBRIDGE_WINAPI * DXUnlockObjectsFn)(InteropDevice device, GLint count, InteropObject * objects);

/**
 * @brief Capability table for WGL_NV_DX_interop.
 *
 * Filled once during device bootstrap and then only read. An incomplete table
 * means the extension set is unavailable and generic surfaces can not be
 * created.
 */
struct InteropFunctions
{
  bool IsAvailable() const;

  DXSetResourceShareHandleFn m_setResourceShareHandle = nullptr;
  DXOpenDeviceFn m_openDevice = nullptr;
  DXCloseDeviceFn m_closeDevice = nullptr;
  DXRegisterObjectFn m_registerObject = nullptr;
  DXUnregisterObjectFn m_unregisterObject = nullptr;
  DXLockObjectsFn m_lockObjects = nullptr;
  DXUnlockObjectsFn m_unlockObjects = nullptr;
};

/// Last error reported by the platform (GetLastError() on Windows, errno elsewhere).
uint32_t GetLastPlatformError();

/// Human-readable reason for a failed lock, unlock or register call.
std::string DescribeInteropError(uint32_t error);

}  // namespace surfbridge
