#pragma once

#include <cstdint>
#include <string>

namespace surfbridge
{

enum class ErrorCode : uint8_t
{
  Ok,
  // The WGL_NV_DX_interop extension set was not negotiated during bootstrap.
  RequiredExtensionUnavailable,
  SurfaceCreationFailed,
  SurfaceImportFailed,
  // The surface belongs to another context.
  IncompatibleSurface,
  InvalidNativeWidget,
  WidgetAttached,
  NoWidgetAttached,
  MakeCurrentFailed,
  ContextCreationFailed,
  DeviceCreationFailed,
  Unimplemented,
};

std::string DebugPrint(ErrorCode code);

/**
 * @brief Result of a fallible surfbridge operation.
 *
 * Carries the error kind and, where the failure came from the platform, the
 * raw native code (HRESULT, GetLastError() value or GL framebuffer status).
 */
class Error
{
public:
  Error() = default;
  Error(ErrorCode code, uint32_t nativeError = 0) : m_code(code), m_nativeError(nativeError) {}

  static Error Ok() { return Error(); }

  bool IsOk() const { return m_code == ErrorCode::Ok; }
  ErrorCode GetCode() const { return m_code; }
  uint32_t GetNativeError() const { return m_nativeError; }

  bool operator==(ErrorCode code) const { return m_code == code; }
  bool operator!=(ErrorCode code) const { return m_code != code; }

private:
  ErrorCode m_code = ErrorCode::Ok;
  uint32_t m_nativeError = 0;
};

std::string DebugPrint(Error const & error);

}  // namespace surfbridge
