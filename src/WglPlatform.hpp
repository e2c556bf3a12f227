#pragma once

#if defined(_WIN32) || defined(_WIN64)

#include "surfbridge/Backend.hpp"
#include "surfbridge/Context.hpp"
#include "surfbridge/Error.hpp"
#include "surfbridge/InteropFunctions.hpp"

#include <windows.h>

#include <string>

namespace surfbridge
{

/**
 * @brief WGL contexts on a hidden window.
 *
 * Every context is created on the hidden window's DC, so all of them share
 * one pixel format and are current-compatible with each other. Surfaces never
 * render to this window: they carry their own framebuffers.
 */
class WglContextProvider : public ContextProvider
{
public:
  WglContextProvider() = default;
  ~WglContextProvider() override;

  WglContextProvider(WglContextProvider const &) = delete;
  WglContextProvider & operator=(WglContextProvider const &) = delete;

  /// Creates the hidden window and the bootstrap context.
  Error Initialize();

  /// Context used to query the driver and to open the interop device.
  NativeContext GetBootstrapContext() const override { return NativeContext{m_hdc, m_bootstrapGlrc}; }

  Error CreateContext(ContextAttributes const & attributes, NativeContext & context) override;
  void DestroyContext(NativeContext const & context) override;
  bool LoadGlFunctions(GlFunctions & gl) override;
  NativeContext GetCurrent() const override;
  bool MakeCurrent(NativeContext const & context) override;

private:
  void Cleanup();

  HWND m_hiddenWindow = nullptr;
  HDC m_hdc = nullptr;
  HGLRC m_bootstrapGlrc = nullptr;
};

class Win32WindowSystem : public WindowSystem
{
public:
  bool GetClientSize(WindowHandle window, Size & size) override;
  bool SwapBuffers(WindowHandle window) override;
};

/// GL_RENDERER of the current context, empty if none is current.
std::string GetCurrentRendererName();

/// Resolves WGL_NV_DX_interop with the current context. Leaves @a interop
/// empty and returns false if any entry point is missing.
bool LoadInteropFunctions(InteropFunctions & interop);

}  // namespace surfbridge

#endif  // defined(_WIN32) || defined(_WIN64)
