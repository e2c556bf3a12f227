#pragma once

#include "surfbridge/Backend.hpp"
#include "surfbridge/Context.hpp"
#include "surfbridge/Error.hpp"
#include "surfbridge/GlFunctions.hpp"
#include "surfbridge/InteropFunctions.hpp"
#include "surfbridge/Types.hpp"

#include <cstdint>
#include <map>
#include <memory>
#include <ostream>
#include <set>

namespace surfbridge
{

// gtest printers.
void PrintTo(ErrorCode code, std::ostream * os);
void PrintTo(Error const & error, std::ostream * os);
void PrintTo(Size const & size, std::ostream * os);

namespace fake
{

// Error codes the fake driver leaves in errno, mirroring the Win32 values.
int constexpr kErrorInvalidData = 13;
int constexpr kErrorBusy = 170;
int constexpr kErrorInvalidWindow = 1400;
int constexpr kErrorInvalidPixelFormat = 2000;

InteropDevice const kInteropDevice = reinterpret_cast<InteropDevice>(0x1D);

struct Registration
{
  void * m_dxObject = nullptr;
  GLuint m_glName = 0;
  GLenum m_access = 0;
  bool m_locked = false;
};

/**
 * @brief Process-wide state of the fake GL, interop, D3D and window system.
 *
 * Reset before every test by DriverTest.
 */
struct DriverState
{
  // Context provider.
  NativeContext m_current;
  std::set<void *> m_liveContexts;
  uintptr_t m_nextContext = 0x100;
  bool m_failCreateContext = false;
  bool m_failLoadGl = false;
  bool m_failMakeCurrent = false;
  int m_makeCurrentCalls = 0;
  NativeContext m_bootstrap;

  // GL objects, each mapped to the context current when it was created.
  GLuint m_nextName = 1;
  std::map<GLuint, void *> m_textures;
  std::map<GLuint, void *> m_framebuffers;
  std::map<GLuint, void *> m_renderbuffers;
  std::map<GLuint, GLenum> m_renderbufferFormats;
  std::map<GLint, std::map<GLenum, GLuint>> m_attachments;
  std::map<GLenum, GLint> m_texParameters;
  int m_crossContextDeletes = 0;
  GLint m_boundFramebuffer = 0;
  GLint m_boundTexture = 0;
  GLint m_boundRenderbuffer = 0;
  GLint m_packAlignment = 4;
  GLenum m_framebufferStatus = GL_FRAMEBUFFER_COMPLETE;
  bool m_statusCheckedWhileLocked = false;
  bool m_readWhileLocked = false;
  GLint m_readFramebuffer = 0;
  GLint m_readPackAlignment = 0;

  // Interop.
  std::map<InteropObject, Registration> m_registrations;
  std::map<void *, ShareHandle> m_shareHandles;
  uintptr_t m_nextObject = 0x1000;
  bool m_failRegister = false;
  bool m_failSetShareHandle = false;
  int m_closeDeviceCalls = 0;
  NativeContext m_closeDeviceContext;

  // Native device.
  std::set<uintptr_t> m_liveTextures;
  std::map<ShareHandle, uintptr_t> m_sharedTextures;
  uintptr_t m_nextTexture = 0x2000;
  bool m_failCreateTexture = false;
  bool m_failOpenTexture = false;

  // Window system.
  std::map<WindowHandle, Size> m_windows;
  int m_swapCalls = 0;

  size_t CountLocked() const;
};

DriverState & State();
void ResetState();

GlFunctions MakeGlFunctions();
InteropFunctions MakeInteropFunctions();

/// Backend over the fake driver. Without interop the table is empty and no
/// interop device is set.
DeviceBackend MakeBackend(bool withInterop = true);

class FakeTexture : public NativeTexture
{
public:
  explicit FakeTexture(uintptr_t id);
  ~FakeTexture() override;

  void * GetDxObject() const override { return reinterpret_cast<void *>(m_id); }

private:
  uintptr_t const m_id;
};

class FakeNativeDevice : public NativeDevice
{
public:
  void * GetDxDevice() const override { return reinterpret_cast<void *>(0xD3D); }

  Error CreateSharedTexture(Size const & size, std::unique_ptr<NativeTexture> & texture,
                            ShareHandle & shareHandle) override;
  Error OpenSharedTexture(ShareHandle shareHandle, std::unique_ptr<NativeTexture> & texture) override;
};

class FakeWindowSystem : public WindowSystem
{
public:
  bool GetClientSize(WindowHandle window, Size & size) override;
  bool SwapBuffers(WindowHandle window) override;
};

class FakeContextProvider : public ContextProvider
{
public:
  /// Registers a live bootstrap context in the current DriverState.
  FakeContextProvider();

  Error CreateContext(ContextAttributes const & attributes, NativeContext & context) override;
  void DestroyContext(NativeContext const & context) override;
  bool LoadGlFunctions(GlFunctions & gl) override;
  NativeContext GetBootstrapContext() const override;
  NativeContext GetCurrent() const override;
  bool MakeCurrent(NativeContext const & context) override;
};

}  // namespace fake
}  // namespace surfbridge
