#pragma once

#include "surfbridge/Backend.hpp"
#include "surfbridge/GlFunctions.hpp"
#include "surfbridge/Renderbuffers.hpp"
#include "surfbridge/Types.hpp"

#include <memory>
#include <string>
#include <variant>

namespace surfbridge
{

/// GL and D3D objects behind an offscreen surface.
struct TextureObjects
{
  std::unique_ptr<NativeTexture> m_nativeTexture;
  ShareHandle m_shareHandle = nullptr;
  // Read-write registration owned by the creating context.
  InteropObject m_interopObject = nullptr;
  GLuint m_glTexture = 0;
  GLuint m_glFramebuffer = 0;
  Renderbuffers m_renderbuffers;
};

struct WidgetObjects
{
  WindowHandle m_windowHandle = nullptr;
};

/**
 * @brief A render target created by Device::CreateSurface().
 *
 * Either an offscreen texture shared between GL and D3D, or a native window's
 * own back buffer. A surface must be handed back to Device::DestroySurface()
 * before it is deleted: deleting a live surface outside of stack unwinding
 * aborts the process, since its GL and interop objects can only be released
 * with the creating context current.
 */
class Surface
{
  friend class Device;

public:
  ~Surface();

  Surface(Surface const &) = delete;
  Surface & operator=(Surface const &) = delete;

  Size const & GetSize() const { return m_size; }
  SurfaceID GetId() const;
  ContextID GetContextId() const { return m_contextId; }

  bool IsWidget() const { return std::holds_alternative<WidgetObjects>(m_objects); }

  /// Framebuffer to render into: the surface FBO, or 0 for a widget.
  GLuint GetFramebuffer() const;

private:
  Surface(Size const & size, ContextID contextId, TextureObjects && objects);
  Surface(Size const & size, ContextID contextId, WidgetObjects const & objects);

  Size const m_size;
  ContextID const m_contextId;
  std::variant<TextureObjects, WidgetObjects> m_objects;
  bool m_destroyed = false;
};

std::string DebugPrint(Surface const & surface);

/**
 * @brief A texture surface re-opened in another context for sampling.
 *
 * Holds its own D3D texture over the same memory and a read-only interop
 * registration, which stays locked for the lifetime of the object.
 */
class SurfaceTexture
{
  friend class Device;

public:
  SurfaceTexture(SurfaceTexture const &) = delete;
  SurfaceTexture & operator=(SurfaceTexture const &) = delete;

  GLuint GetTextureName() const { return m_glTexture; }
  Surface const & GetSurface() const { return *m_surface; }
  /// Context the texture was opened in, the only one that can destroy it.
  ContextID GetContextId() const { return m_contextId; }

private:
  SurfaceTexture(std::unique_ptr<Surface> surface, ContextID contextId, std::unique_ptr<NativeTexture> localTexture,
                 InteropObject localInteropObject, GLuint glTexture);

  // Declared first so it is released last.
  std::unique_ptr<Surface> m_surface;
  ContextID const m_contextId;
  std::unique_ptr<NativeTexture> m_localTexture;
  InteropObject m_localInteropObject = nullptr;
  GLuint m_glTexture = 0;
};

}  // namespace surfbridge
