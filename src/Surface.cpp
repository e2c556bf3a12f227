#include "surfbridge/Surface.hpp"

#include "base/assert.hpp"

#include <exception>
#include <sstream>
#include <utility>

namespace surfbridge
{

std::string DebugPrint(Size const & size)
{
  return std::to_string(size.m_width) + "x" + std::to_string(size.m_height);
}

// ============================================================================
// Surface
// ============================================================================

Surface::Surface(Size const & size, ContextID contextId, TextureObjects && objects)
  : m_size(size)
  , m_contextId(contextId)
  , m_objects(std::move(objects))
{
}

Surface::Surface(Size const & size, ContextID contextId, WidgetObjects const & objects)
  : m_size(size)
  , m_contextId(contextId)
  , m_objects(objects)
{
}

Surface::~Surface()
{
  // Unwinding already reports a failure of its own, aborting here would hide it.
  if (m_destroyed || std::uncaught_exceptions() > 0)
    return;

  CHECK(false, ("Surface", DebugPrint(*this), "deleted without Device::DestroySurface()"));
}

SurfaceID Surface::GetId() const
{
  if (auto const * texture = std::get_if<TextureObjects>(&m_objects))
    return reinterpret_cast<SurfaceID>(texture->m_nativeTexture->GetDxObject());

  return reinterpret_cast<SurfaceID>(std::get<WidgetObjects>(m_objects).m_windowHandle);
}

GLuint Surface::GetFramebuffer() const
{
  if (auto const * texture = std::get_if<TextureObjects>(&m_objects))
    return texture->m_glFramebuffer;
  return 0;
}

std::string DebugPrint(Surface const & surface)
{
  std::ostringstream out;
  out << "Surface(0x" << std::hex << surface.GetId() << ")";
  return out.str();
}

// ============================================================================
// SurfaceTexture
// ============================================================================

SurfaceTexture::SurfaceTexture(std::unique_ptr<Surface> surface, ContextID contextId,
                               std::unique_ptr<NativeTexture> localTexture, InteropObject localInteropObject,
                               GLuint glTexture)
  : m_surface(std::move(surface))
  , m_contextId(contextId)
  , m_localTexture(std::move(localTexture))
  , m_localInteropObject(localInteropObject)
  , m_glTexture(glTexture)
{
}

}  // namespace surfbridge
