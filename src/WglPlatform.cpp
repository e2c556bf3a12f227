#if defined(_WIN32) || defined(_WIN64)

#include "WglPlatform.hpp"

#include "base/logging.hpp"

namespace surfbridge
{

namespace
{
wchar_t const * kWindowClassName = L"SurfbridgeHiddenWindow";
bool g_windowClassRegistered = false;

LRESULT CALLBACK HiddenWindowProc(HWND hwnd, UINT msg, WPARAM wParam, LPARAM lParam)
{
  return DefWindowProcW(hwnd, msg, wParam, lParam);
}

bool RegisterWindowClass()
{
  if (g_windowClassRegistered)
    return true;

  WNDCLASSEXW wc = {};
  wc.cbSize = sizeof(WNDCLASSEXW);
  wc.style = CS_OWNDC;
  wc.lpfnWndProc = HiddenWindowProc;
  wc.hInstance = GetModuleHandleW(nullptr);
  wc.lpszClassName = kWindowClassName;

  if (RegisterClassExW(&wc) == 0)
  {
    LOG(LERROR, ("Failed to register window class:", GetLastError()));
    return false;
  }

  g_windowClassRegistered = true;
  return true;
}

template <typename Fn>
Fn GetWglProc(char const * name)
{
  return reinterpret_cast<Fn>(wglGetProcAddress(name));
}
}  // namespace

// ============================================================================
// WglContextProvider
// ============================================================================

WglContextProvider::~WglContextProvider()
{
  Cleanup();
}

Error WglContextProvider::Initialize()
{
  if (!RegisterWindowClass())
    return Error(ErrorCode::DeviceCreationFailed, GetLastPlatformError());

  m_hiddenWindow = CreateWindowExW(0, kWindowClassName, L"SurfbridgeHiddenWindow", WS_POPUP, 0, 0, 1, 1,
                                   nullptr, nullptr, GetModuleHandleW(nullptr), nullptr);
  if (!m_hiddenWindow)
  {
    uint32_t const error = GetLastPlatformError();
    LOG(LERROR, ("Failed to create hidden window:", error));
    return Error(ErrorCode::DeviceCreationFailed, error);
  }

  m_hdc = GetDC(m_hiddenWindow);
  if (!m_hdc)
  {
    LOG(LERROR, ("Failed to get DC"));
    Cleanup();
    return Error(ErrorCode::DeviceCreationFailed);
  }

  PIXELFORMATDESCRIPTOR pfd = {};
  pfd.nSize = sizeof(PIXELFORMATDESCRIPTOR);
  pfd.nVersion = 1;
  pfd.dwFlags = PFD_DRAW_TO_WINDOW | PFD_SUPPORT_OPENGL | PFD_DOUBLEBUFFER;
  pfd.iPixelType = PFD_TYPE_RGBA;
  pfd.cColorBits = 32;
  pfd.cAlphaBits = 8;
  pfd.cDepthBits = 24;
  pfd.cStencilBits = 8;
  pfd.iLayerType = PFD_MAIN_PLANE;

  int const pixelFormat = ChoosePixelFormat(m_hdc, &pfd);
  if (pixelFormat == 0 || !SetPixelFormat(m_hdc, pixelFormat, &pfd))
  {
    uint32_t const error = GetLastPlatformError();
    LOG(LERROR, ("Failed to set pixel format:", error));
    Cleanup();
    return Error(ErrorCode::DeviceCreationFailed, error);
  }

  m_bootstrapGlrc = wglCreateContext(m_hdc);
  if (!m_bootstrapGlrc)
  {
    uint32_t const error = GetLastPlatformError();
    LOG(LERROR, ("Failed to create bootstrap GL context:", error));
    Cleanup();
    return Error(ErrorCode::DeviceCreationFailed, error);
  }

  return Error::Ok();
}

void WglContextProvider::Cleanup()
{
  if (m_bootstrapGlrc)
  {
    if (wglGetCurrentContext() == m_bootstrapGlrc)
      wglMakeCurrent(nullptr, nullptr);
    wglDeleteContext(m_bootstrapGlrc);
    m_bootstrapGlrc = nullptr;
  }

  if (m_hdc && m_hiddenWindow)
  {
    ReleaseDC(m_hiddenWindow, m_hdc);
    m_hdc = nullptr;
  }

  if (m_hiddenWindow)
  {
    DestroyWindow(m_hiddenWindow);
    m_hiddenWindow = nullptr;
  }
}

Error WglContextProvider::CreateContext(ContextAttributes const & /* attributes */, NativeContext & context)
{
  // Depth and stencil live in per-surface renderbuffers, so the pixel format
  // of the hidden window serves every attribute set.
  HGLRC glrc = wglCreateContext(m_hdc);
  if (!glrc)
  {
    uint32_t const error = GetLastPlatformError();
    LOG(LERROR, ("wglCreateContext failed:", error));
    return Error(ErrorCode::ContextCreationFailed, error);
  }

  context.m_dc = m_hdc;
  context.m_glrc = glrc;
  return Error::Ok();
}

void WglContextProvider::DestroyContext(NativeContext const & context)
{
  if (!wglDeleteContext(static_cast<HGLRC>(context.m_glrc)))
    LOG(LWARNING, ("wglDeleteContext failed:", GetLastError()));
}

bool WglContextProvider::LoadGlFunctions(GlFunctions & gl)
{
  // OpenGL 1.1 is exported by opengl32.dll, the rest must come from the driver.
  gl.glGenTextures = &::glGenTextures;
  gl.glDeleteTextures = &::glDeleteTextures;
  gl.glBindTexture = &::glBindTexture;
  gl.glTexParameteri = &::glTexParameteri;
  gl.glGetIntegerv = &::glGetIntegerv;
  gl.glPixelStorei = &::glPixelStorei;
  gl.glReadPixels = &::glReadPixels;

  gl.glGenFramebuffers = GetWglProc<GlGenFramebuffersFn>("glGenFramebuffers");
  gl.glDeleteFramebuffers = GetWglProc<GlDeleteFramebuffersFn>("glDeleteFramebuffers");
  gl.glBindFramebuffer = GetWglProc<GlBindFramebufferFn>("glBindFramebuffer");
  gl.glFramebufferTexture2D = GetWglProc<GlFramebufferTexture2DFn>("glFramebufferTexture2D");
  gl.glCheckFramebufferStatus = GetWglProc<GlCheckFramebufferStatusFn>("glCheckFramebufferStatus");
  gl.glGenRenderbuffers = GetWglProc<GlGenRenderbuffersFn>("glGenRenderbuffers");
  gl.glDeleteRenderbuffers = GetWglProc<GlDeleteRenderbuffersFn>("glDeleteRenderbuffers");
  gl.glBindRenderbuffer = GetWglProc<GlBindRenderbufferFn>("glBindRenderbuffer");
  gl.glRenderbufferStorage = GetWglProc<GlRenderbufferStorageFn>("glRenderbufferStorage");
  gl.glFramebufferRenderbuffer = GetWglProc<GlFramebufferRenderbufferFn>("glFramebufferRenderbuffer");

  return gl.IsComplete();
}

NativeContext WglContextProvider::GetCurrent() const
{
  return NativeContext{wglGetCurrentDC(), wglGetCurrentContext()};
}

bool WglContextProvider::MakeCurrent(NativeContext const & context)
{
  return wglMakeCurrent(static_cast<HDC>(context.m_dc), static_cast<HGLRC>(context.m_glrc)) == TRUE;
}

// ============================================================================
// Win32WindowSystem
// ============================================================================

bool Win32WindowSystem::GetClientSize(WindowHandle window, Size & size)
{
  RECT rect = {};
  if (!GetClientRect(static_cast<HWND>(window), &rect))
    return false;

  size = Size(static_cast<int32_t>(rect.right - rect.left), static_cast<int32_t>(rect.bottom - rect.top));
  return true;
}

bool Win32WindowSystem::SwapBuffers(WindowHandle window)
{
  HWND hwnd = static_cast<HWND>(window);
  HDC hdc = GetDC(hwnd);
  if (!hdc)
    return false;

  bool const ok = ::SwapBuffers(hdc) == TRUE;
  ReleaseDC(hwnd, hdc);
  return ok;
}

// ============================================================================
// Driver queries
// ============================================================================

std::string GetCurrentRendererName()
{
  if (GLubyte const * renderer = glGetString(GL_RENDERER))
    return reinterpret_cast<char const *>(renderer);
  return std::string();
}

bool LoadInteropFunctions(InteropFunctions & interop)
{
  InteropFunctions loaded;
  loaded.m_setResourceShareHandle = GetWglProc<DXSetResourceShareHandleFn>("wglDXSetResourceShareHandleNV");
  loaded.m_openDevice = GetWglProc<DXOpenDeviceFn>("wglDXOpenDeviceNV");
  loaded.m_closeDevice = GetWglProc<DXCloseDeviceFn>("wglDXCloseDeviceNV");
  loaded.m_registerObject = GetWglProc<DXRegisterObjectFn>("wglDXRegisterObjectNV");
  loaded.m_unregisterObject = GetWglProc<DXUnregisterObjectFn>("wglDXUnregisterObjectNV");
  loaded.m_lockObjects = GetWglProc<DXLockObjectsFn>("wglDXLockObjectsNV");
  loaded.m_unlockObjects = GetWglProc<DXUnlockObjectsFn>("wglDXUnlockObjectsNV");

  if (!loaded.IsAvailable())
  {
    LOG(LWARNING, ("WGL_NV_DX_interop entry points missing"));
    interop = InteropFunctions();
    return false;
  }

  interop = loaded;
  return true;
}

}  // namespace surfbridge

#endif  // defined(_WIN32) || defined(_WIN64)
