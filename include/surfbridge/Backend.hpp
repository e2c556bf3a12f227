#pragma once

#include "surfbridge/Context.hpp"
#include "surfbridge/Error.hpp"
#include "surfbridge/InteropFunctions.hpp"
#include "surfbridge/Types.hpp"

#include <memory>

namespace surfbridge
{

/// A texture allocated by the native API. Releasing the object releases the
/// native reference.
class NativeTexture
{
public:
  virtual ~NativeTexture() = default;

  /// Raw native object pointer, as expected by the interop registration calls.
  virtual void * GetDxObject() const = 0;
};

/**
 * @brief Native allocation API (Direct3D 11 on Windows).
 */
class NativeDevice
{
public:
  virtual ~NativeDevice() = default;

  /// Raw device pointer handed to wglDXOpenDeviceNV.
  virtual void * GetDxDevice() const = 0;

  /// Allocates an RGBA8 render-target/shader-resource texture that can be
  /// opened by another device through @a shareHandle.
  /// Fails with SurfaceCreationFailed.
  virtual Error CreateSharedTexture(Size const & size, std::unique_ptr<NativeTexture> & texture,
                                    ShareHandle & shareHandle) = 0;

  /// Opens a texture previously shared through CreateSharedTexture().
  /// Fails with SurfaceImportFailed.
  virtual Error OpenSharedTexture(ShareHandle shareHandle, std::unique_ptr<NativeTexture> & texture) = 0;
};

/**
 * @brief The parts of the OS windowing system the surface code reads.
 */
class WindowSystem
{
public:
  virtual ~WindowSystem() = default;

  virtual bool GetClientSize(WindowHandle window, Size & size) = 0;
  virtual bool SwapBuffers(WindowHandle window) = 0;
};

/**
 * @brief Creates rendering contexts and switches the thread's current one.
 */
class ContextProvider
{
public:
  virtual ~ContextProvider() = default;

  virtual Error CreateContext(ContextAttributes const & attributes, NativeContext & context) = 0;
  virtual void DestroyContext(NativeContext const & context) = 0;

  /// Resolves the GL table. Must be called while the context is current.
  virtual bool LoadGlFunctions(GlFunctions & gl) = 0;

  /// Context the interop device was opened under. Owned by the provider.
  virtual NativeContext GetBootstrapContext() const = 0;

  virtual NativeContext GetCurrent() const = 0;
  /// A null context releases the current one.
  virtual bool MakeCurrent(NativeContext const & context) = 0;
};

/**
 * @brief Everything the device bootstrap hands to Device.
 */
struct DeviceBackend
{
  std::unique_ptr<NativeDevice> m_nativeDevice;
  std::unique_ptr<WindowSystem> m_windowSystem;
  std::unique_ptr<ContextProvider> m_contextProvider;
  // Read-only after bootstrap. Incomplete when the extension is missing.
  InteropFunctions m_interop;
  // Result of wglDXOpenDeviceNV on m_nativeDevice, null without interop.
  InteropDevice m_interopDevice = nullptr;
};

}  // namespace surfbridge
