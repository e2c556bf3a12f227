#pragma once

#include "surfbridge/Backend.hpp"
#include "surfbridge/Context.hpp"
#include "surfbridge/Error.hpp"
#include "surfbridge/GlFunctions.hpp"
#include "surfbridge/Surface.hpp"
#include "surfbridge/Types.hpp"

#include <cstdint>
#include <memory>
#include <vector>

namespace surfbridge
{

/// CPU copy of a surface, rows top to bottom, RGBA8.
struct SurfacePixels
{
  Size m_size;
  uint32_t m_stride = 0;
  std::vector<uint8_t> m_data;
};

/**
 * @brief Owner of the native device and the GL/D3D interop device.
 *
 * Factory for contexts, surfaces and surface textures. All calls are
 * synchronous and must come from one thread. Calls that touch GL objects make
 * the required context current for their duration and restore the previous
 * one on every exit path.
 *
 * Ownership moves through std::unique_ptr: a surface passed by value is
 * consumed by the call, on failure as well as on success, so a caller never
 * ends up holding a half-initialized object.
 */
class Device
{
public:
  explicit Device(DeviceBackend && backend);
  ~Device();

  Device(Device const &) = delete;
  Device & operator=(Device const &) = delete;

  bool HasInterop() const { return m_interop.IsAvailable() && m_interopDevice != nullptr; }
  GLenum GetSurfaceTextureTarget() const { return GL_TEXTURE_2D; }

  Error CreateContext(ContextAttributes const & attributes, std::unique_ptr<Context> & context);
  /// Releases the context if current, then deletes it.
  void DestroyContext(std::unique_ptr<Context> context);

  Error CreateSurface(Context const & context, SurfaceAccess access, SurfaceType const & surfaceType,
                      std::unique_ptr<Surface> & surface);

  /// Releases the surface. A surface from another context is marked destroyed
  /// without releasing its GL objects and IncompatibleSurface is returned.
  Error DestroySurface(Context const & context, std::unique_ptr<Surface> surface);

  /// Wraps a texture surface for sampling in @a context. The result is
  /// already locked.
  Error CreateSurfaceTexture(Context const & context, std::unique_ptr<Surface> surface,
                             std::unique_ptr<SurfaceTexture> & surfaceTexture);
  /// Unlocks and releases the sampling texture and hands the surface back.
  /// @a context must be the one the texture was opened in, otherwise the
  /// surface is leaked and IncompatibleSurface is returned.
  Error DestroySurfaceTexture(Context const & context, std::unique_ptr<SurfaceTexture> surfaceTexture,
                              std::unique_ptr<Surface> & surface);

  /// Gives GL exclusive access to the surface memory until UnlockSurface().
  /// May block until D3D work on the texture retires. No-op for widgets.
  void LockSurface(Surface const & surface) const;
  void UnlockSurface(Surface const & surface) const;

  /// Copies a texture surface into CPU memory. The surface must not be locked
  /// by the caller.
  Error ReadSurfacePixels(Context const & context, Surface const & surface, SurfacePixels & pixels);

  /// Swaps a widget surface's window buffers. Needs no current context.
  Error PresentSurfaceWithoutContext(Surface const & surface) const;

private:
  Error CreateGenericSurface(Context const & context, Size const & size, std::unique_ptr<Surface> & surface);
  Error CreateWidgetSurface(Context const & context, NativeWidget const & widget,
                            std::unique_ptr<Surface> & surface);

  std::unique_ptr<NativeDevice> m_nativeDevice;
  std::unique_ptr<WindowSystem> m_windowSystem;
  std::unique_ptr<ContextProvider> m_contextProvider;
  InteropFunctions const m_interop;
  InteropDevice m_interopDevice = nullptr;
};

}  // namespace surfbridge
