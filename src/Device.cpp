#include "surfbridge/Device.hpp"

#include "InteropGate.hpp"
#include "ScopedGuards.hpp"

#include "base/assert.hpp"
#include "base/logging.hpp"

#include <cstring>
#include <utility>

namespace surfbridge
{

namespace
{
// Reverse of generic surface creation. Must run with the owning context current.
void ReleaseTextureObjects(GlFunctions const & gl, InteropFunctions const & interop, InteropDevice device,
                           TextureObjects & objects)
{
  objects.m_renderbuffers.Destroy(gl);

  if (objects.m_glFramebuffer != 0)
  {
    gl.glDeleteFramebuffers(1, &objects.m_glFramebuffer);
    objects.m_glFramebuffer = 0;
  }

  gl.glDeleteTextures(1, &objects.m_glTexture);
  objects.m_glTexture = 0;

  UnregisterInteropObject(interop, device, objects.m_interopObject);
  objects.m_interopObject = nullptr;
}

void InitSamplingParameters(GlFunctions const & gl)
{
  gl.glTexParameteri(GL_TEXTURE_2D, GL_TEXTURE_MAG_FILTER, GL_LINEAR);
  gl.glTexParameteri(GL_TEXTURE_2D, GL_TEXTURE_MIN_FILTER, GL_LINEAR);
  gl.glTexParameteri(GL_TEXTURE_2D, GL_TEXTURE_WRAP_S, GL_CLAMP_TO_EDGE);
  gl.glTexParameteri(GL_TEXTURE_2D, GL_TEXTURE_WRAP_T, GL_CLAMP_TO_EDGE);
}
}  // namespace

Device::Device(DeviceBackend && backend)
  : m_nativeDevice(std::move(backend.m_nativeDevice))
  , m_windowSystem(std::move(backend.m_windowSystem))
  , m_contextProvider(std::move(backend.m_contextProvider))
  , m_interop(backend.m_interop)
  , m_interopDevice(backend.m_interopDevice)
{
  CHECK(m_nativeDevice && m_windowSystem && m_contextProvider, ("Incomplete device backend"));

  if (!HasInterop())
    LOG(LWARNING, ("WGL_NV_DX_interop unavailable, only widget surfaces can be created"));
}

Device::~Device()
{
  if (m_interopDevice == nullptr || m_interop.m_closeDevice == nullptr)
    return;

  ScopedContextCurrent current(*m_contextProvider, m_contextProvider->GetBootstrapContext());
  if (!current.IsCurrent())
  {
    LOG(LWARNING, ("Leaking interop device, bootstrap context can not be made current:", current.GetNativeError()));
    return;
  }

  if (!m_interop.m_closeDevice(m_interopDevice))
    LOG(LWARNING, ("wglDXCloseDeviceNV failed:", GetLastPlatformError()));
  m_interopDevice = nullptr;
}

// ============================================================================
// Contexts
// ============================================================================

Error Device::CreateContext(ContextAttributes const & attributes, std::unique_ptr<Context> & context)
{
  NativeContext native;
  Error const error = m_contextProvider->CreateContext(attributes, native);
  if (!error.IsOk())
  {
    LOG(LERROR, ("Failed to create GL context:", error));
    return error;
  }

  GlFunctions gl;
  bool loaded = false;
  uint32_t makeCurrentError = 0;
  {
    ScopedContextCurrent current(*m_contextProvider, native);
    if (current.IsCurrent())
      loaded = m_contextProvider->LoadGlFunctions(gl);
    else
      makeCurrentError = current.GetNativeError();
  }

  if (!loaded)
  {
    m_contextProvider->DestroyContext(native);
    if (makeCurrentError != 0)
      return Error(ErrorCode::MakeCurrentFailed, makeCurrentError);

    LOG(LERROR, ("Failed to load OpenGL FBO functions"));
    return Error(ErrorCode::ContextCreationFailed);
  }

  context = std::make_unique<Context>(AllocateContextID(), native, gl, attributes);
  return Error::Ok();
}

void Device::DestroyContext(std::unique_ptr<Context> context)
{
  CHECK(context, ());

  NativeContext const native = context->GetNative();
  if (m_contextProvider->GetCurrent() == native && !m_contextProvider->MakeCurrent(NativeContext()))
    LOG(LWARNING, ("Failed to release context", context->GetId(), GetLastPlatformError()));

  m_contextProvider->DestroyContext(native);
}

// ============================================================================
// Surfaces
// ============================================================================

Error Device::CreateSurface(Context const & context, SurfaceAccess /* access */, SurfaceType const & surfaceType,
                            std::unique_ptr<Surface> & surface)
{
  if (auto const * generic = std::get_if<GenericSurfaceType>(&surfaceType))
    return CreateGenericSurface(context, generic->m_size, surface);

  return CreateWidgetSurface(context, std::get<WidgetSurfaceType>(surfaceType).m_nativeWidget, surface);
}

Error Device::CreateGenericSurface(Context const & context, Size const & size, std::unique_ptr<Surface> & surface)
{
  if (!HasInterop())
    return Error(ErrorCode::RequiredExtensionUnavailable);

  if (size.IsEmpty())
  {
    LOG(LWARNING, ("Invalid surface size:", size));
    return Error(ErrorCode::SurfaceCreationFailed);
  }

  ScopedContextCurrent current(*m_contextProvider, context.GetNative());
  if (!current.IsCurrent())
    return Error(ErrorCode::MakeCurrentFailed, current.GetNativeError());

  GlFunctions const & gl = context.GetGl();

  TextureObjects objects;
  Error const error = m_nativeDevice->CreateSharedTexture(size, objects.m_nativeTexture, objects.m_shareHandle);
  if (!error.IsOk())
  {
    LOG(LERROR, ("Failed to create shared texture", size, error));
    return error;
  }

  void * dxObject = objects.m_nativeTexture->GetDxObject();

  // The share handle is needed both to bind to GL and to reopen the texture in other contexts.
  if (!m_interop.m_setResourceShareHandle(dxObject, objects.m_shareHandle))
  {
    uint32_t const nativeError = GetLastPlatformError();
    LOG(LERROR, ("wglDXSetResourceShareHandleNV failed:", nativeError));
    return Error(ErrorCode::SurfaceCreationFailed, nativeError);
  }

  gl.glGenTextures(1, &objects.m_glTexture);
  objects.m_interopObject = m_interop.m_registerObject(m_interopDevice, dxObject, objects.m_glTexture,
                                                       GL_TEXTURE_2D, kInteropAccessReadWrite);
  if (objects.m_interopObject == nullptr)
  {
    uint32_t const nativeError = GetLastPlatformError();
    LOG(LERROR, ("wglDXRegisterObjectNV failed:", DescribeInteropError(nativeError), nativeError));
    gl.glDeleteTextures(1, &objects.m_glTexture);
    return Error(ErrorCode::SurfaceCreationFailed, nativeError);
  }

  gl.glGenFramebuffers(1, &objects.m_glFramebuffer);
  objects.m_renderbuffers = Renderbuffers::Create(gl, size, context.GetAttributes());

  GLenum status = GL_FRAMEBUFFER_COMPLETE;
  {
    // The registered texture only has storage while it is locked.
    ScopedInteropLock lock(m_interop, m_interopDevice, objects.m_interopObject);
    ScopedFramebufferBinding binding(gl, objects.m_glFramebuffer);

    gl.glFramebufferTexture2D(GL_FRAMEBUFFER, GL_COLOR_ATTACHMENT0, GL_TEXTURE_2D, objects.m_glTexture, 0);
    objects.m_renderbuffers.BindToCurrentFramebuffer(gl);
    status = gl.glCheckFramebufferStatus(GL_FRAMEBUFFER);
  }

  if (status != GL_FRAMEBUFFER_COMPLETE)
  {
    LOG(LERROR, ("Surface framebuffer incomplete:", FramebufferStatusToString(status), size));
    ReleaseTextureObjects(gl, m_interop, m_interopDevice, objects);
    return Error(ErrorCode::SurfaceCreationFailed, status);
  }

  surface.reset(new Surface(size, context.GetId(), std::move(objects)));
  return Error::Ok();
}

Error Device::CreateWidgetSurface(Context const & context, NativeWidget const & widget,
                                  std::unique_ptr<Surface> & surface)
{
  Size size;
  if (widget.m_windowHandle == nullptr || !m_windowSystem->GetClientSize(widget.m_windowHandle, size))
  {
    LOG(LWARNING, ("Failed to query window client rect:", GetLastPlatformError()));
    return Error(ErrorCode::InvalidNativeWidget);
  }

  surface.reset(new Surface(size, context.GetId(), WidgetObjects{widget.m_windowHandle}));
  return Error::Ok();
}

Error Device::DestroySurface(Context const & context, std::unique_ptr<Surface> surface)
{
  CHECK(surface, ());

  if (surface->m_contextId != context.GetId())
  {
    // Releasing GL objects needs the creating context, which the caller did not supply.
    LOG(LWARNING, ("Leaking", DebugPrint(*surface), "of context", surface->m_contextId,
                   "passed with context", context.GetId()));
    surface->m_destroyed = true;
    return Error(ErrorCode::IncompatibleSurface);
  }

  surface->m_destroyed = true;

  // A widget surface owns no GL objects.
  auto * objects = std::get_if<TextureObjects>(&surface->m_objects);
  if (objects == nullptr)
    return Error::Ok();

  ScopedContextCurrent current(*m_contextProvider, context.GetNative());
  if (!current.IsCurrent())
  {
    LOG(LERROR, ("Leaking", DebugPrint(*surface), "because its context can not be made current"));
    return Error(ErrorCode::MakeCurrentFailed, current.GetNativeError());
  }

  ReleaseTextureObjects(context.GetGl(), m_interop, m_interopDevice, *objects);
  return Error::Ok();
}

// ============================================================================
// Surface textures
// ============================================================================

Error Device::CreateSurfaceTexture(Context const & context, std::unique_ptr<Surface> surface,
                                   std::unique_ptr<SurfaceTexture> & surfaceTexture)
{
  CHECK(surface, ());

  auto const * objects = std::get_if<TextureObjects>(&surface->m_objects);
  if (objects == nullptr)
  {
    surface->m_destroyed = true;
    return Error(ErrorCode::WidgetAttached);
  }

  ASSERT(HasInterop(), ("Texture surface without DX interop"));
  ShareHandle const shareHandle = objects->m_shareHandle;

  ScopedContextCurrent current(*m_contextProvider, context.GetNative());
  if (!current.IsCurrent())
  {
    LOG(LERROR, ("Leaking", DebugPrint(*surface), "because the target context can not be made current"));
    surface->m_destroyed = true;
    return Error(ErrorCode::MakeCurrentFailed, current.GetNativeError());
  }

  // A second D3D texture over the same memory.
  std::unique_ptr<NativeTexture> localTexture;
  Error const error = m_nativeDevice->OpenSharedTexture(shareHandle, localTexture);
  if (!error.IsOk())
  {
    LOG(LERROR, ("Failed to open shared texture of", DebugPrint(*surface), error));
    surface->m_destroyed = true;
    return error;
  }

  void * dxObject = localTexture->GetDxObject();
  if (!m_interop.m_setResourceShareHandle(dxObject, shareHandle))
  {
    uint32_t const nativeError = GetLastPlatformError();
    LOG(LERROR, ("wglDXSetResourceShareHandleNV failed:", nativeError));
    surface->m_destroyed = true;
    return Error(ErrorCode::SurfaceImportFailed, nativeError);
  }

  GlFunctions const & gl = context.GetGl();
  GLuint glTexture = 0;
  gl.glGenTextures(1, &glTexture);

  InteropObject localObject =
      m_interop.m_registerObject(m_interopDevice, dxObject, glTexture, GL_TEXTURE_2D, kInteropAccessReadOnly);
  if (localObject == nullptr)
  {
    uint32_t const nativeError = GetLastPlatformError();
    LOG(LERROR, ("wglDXRegisterObjectNV failed:", DescribeInteropError(nativeError), nativeError));
    gl.glDeleteTextures(1, &glTexture);
    surface->m_destroyed = true;
    return Error(ErrorCode::SurfaceImportFailed, nativeError);
  }

  // Locked until DestroySurfaceTexture() so it can be sampled right away.
  LockInteropObject(m_interop, m_interopDevice, localObject);

  {
    ScopedTextureBinding binding(gl, glTexture);
    InitSamplingParameters(gl);
  }

  surfaceTexture.reset(
      new SurfaceTexture(std::move(surface), context.GetId(), std::move(localTexture), localObject, glTexture));
  return Error::Ok();
}

Error Device::DestroySurfaceTexture(Context const & context, std::unique_ptr<SurfaceTexture> surfaceTexture,
                                    std::unique_ptr<Surface> & surface)
{
  CHECK(surfaceTexture, ());

  if (surfaceTexture->m_contextId != context.GetId())
  {
    // The sampling texture and its registration belong to the context that opened them.
    LOG(LWARNING, ("Leaking surface texture of", DebugPrint(*surfaceTexture->m_surface), "opened in context",
                   surfaceTexture->m_contextId, "passed with context", context.GetId()));
    surfaceTexture->m_surface->m_destroyed = true;
    return Error(ErrorCode::IncompatibleSurface);
  }

  ScopedContextCurrent current(*m_contextProvider, context.GetNative());
  if (!current.IsCurrent())
  {
    LOG(LERROR, ("Leaking surface texture of", DebugPrint(*surfaceTexture->m_surface),
                 "because its context can not be made current"));
    surfaceTexture->m_surface->m_destroyed = true;
    return Error(ErrorCode::MakeCurrentFailed, current.GetNativeError());
  }

  UnlockInteropObject(m_interop, m_interopDevice, surfaceTexture->m_localInteropObject);
  UnregisterInteropObject(m_interop, m_interopDevice, surfaceTexture->m_localInteropObject);
  surfaceTexture->m_localInteropObject = nullptr;

  context.GetGl().glDeleteTextures(1, &surfaceTexture->m_glTexture);
  surfaceTexture->m_glTexture = 0;

  surface = std::move(surfaceTexture->m_surface);
  return Error::Ok();
}

// ============================================================================
// Lock/unlock gate
// ============================================================================

void Device::LockSurface(Surface const & surface) const
{
  auto const * objects = std::get_if<TextureObjects>(&surface.m_objects);
  if (objects == nullptr)
    return;

  LockInteropObject(m_interop, m_interopDevice, objects->m_interopObject);
}

void Device::UnlockSurface(Surface const & surface) const
{
  auto const * objects = std::get_if<TextureObjects>(&surface.m_objects);
  if (objects == nullptr)
    return;

  UnlockInteropObject(m_interop, m_interopDevice, objects->m_interopObject);
}

// ============================================================================
// Readback and presentation
// ============================================================================

Error Device::ReadSurfacePixels(Context const & context, Surface const & surface, SurfacePixels & pixels)
{
  if (surface.m_contextId != context.GetId())
    return Error(ErrorCode::IncompatibleSurface);

  auto const * objects = std::get_if<TextureObjects>(&surface.m_objects);
  if (objects == nullptr)
    return Error(ErrorCode::Unimplemented);

  ScopedContextCurrent current(*m_contextProvider, context.GetNative());
  if (!current.IsCurrent())
    return Error(ErrorCode::MakeCurrentFailed, current.GetNativeError());

  GlFunctions const & gl = context.GetGl();
  Size const & size = surface.m_size;
  uint32_t const stride = static_cast<uint32_t>(size.m_width) * 4;
  std::vector<uint8_t> rows(static_cast<size_t>(stride) * static_cast<size_t>(size.m_height));

  {
    ScopedInteropLock lock(m_interop, m_interopDevice, objects->m_interopObject);
    ScopedFramebufferBinding binding(gl, objects->m_glFramebuffer);

    GLint packAlignment = 4;
    gl.glGetIntegerv(GL_PACK_ALIGNMENT, &packAlignment);
    gl.glPixelStorei(GL_PACK_ALIGNMENT, 1);
    gl.glReadPixels(0, 0, size.m_width, size.m_height, GL_RGBA, GL_UNSIGNED_BYTE, rows.data());
    gl.glPixelStorei(GL_PACK_ALIGNMENT, packAlignment);
  }

  // GL is Y-up: the first row read is the bottom one.
  pixels.m_size = size;
  pixels.m_stride = stride;
  pixels.m_data.resize(rows.size());
  for (int32_t y = 0; y < size.m_height; ++y)
  {
    uint8_t const * src = rows.data() + static_cast<size_t>(size.m_height - 1 - y) * stride;
    std::memcpy(pixels.m_data.data() + static_cast<size_t>(y) * stride, src, stride);
  }

  return Error::Ok();
}

Error Device::PresentSurfaceWithoutContext(Surface const & surface) const
{
  auto const * widget = std::get_if<WidgetObjects>(&surface.m_objects);
  if (widget == nullptr)
    return Error(ErrorCode::NoWidgetAttached);

  if (!m_windowSystem->SwapBuffers(widget->m_windowHandle))
  {
    uint32_t const nativeError = GetLastPlatformError();
    LOG(LWARNING, ("SwapBuffers failed for", DebugPrint(surface), nativeError));
    return Error(ErrorCode::InvalidNativeWidget, nativeError);
  }

  return Error::Ok();
}

}  // namespace surfbridge
