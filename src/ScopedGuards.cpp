#include "ScopedGuards.hpp"

#include "surfbridge/InteropFunctions.hpp"

#include "base/logging.hpp"

namespace surfbridge
{

// ============================================================================
// ScopedContextCurrent
// ============================================================================

ScopedContextCurrent::ScopedContextCurrent(ContextProvider & provider, NativeContext const & target)
  : m_provider(provider)
  , m_previous(provider.GetCurrent())
{
  if (m_previous == target)
  {
    m_isCurrent = true;
    return;
  }

  if (!m_provider.MakeCurrent(target))
  {
    m_nativeError = GetLastPlatformError();
    LOG(LWARNING, ("Failed to make context current:", m_nativeError));
    return;
  }

  m_switched = true;
  m_isCurrent = true;
}

ScopedContextCurrent::~ScopedContextCurrent()
{
  if (!m_switched)
    return;

  // A null previous context releases ours.
  if (!m_provider.MakeCurrent(m_previous))
    LOG(LWARNING, ("Failed to restore previous context:", GetLastPlatformError()));
}

// ============================================================================
// ScopedFramebufferBinding
// ============================================================================

ScopedFramebufferBinding::ScopedFramebufferBinding(GlFunctions const & gl, GLuint framebuffer)
  : m_gl(gl)
{
  m_gl.glGetIntegerv(GL_FRAMEBUFFER_BINDING, &m_previous);
  m_gl.glBindFramebuffer(GL_FRAMEBUFFER, framebuffer);
}

ScopedFramebufferBinding::~ScopedFramebufferBinding()
{
  m_gl.glBindFramebuffer(GL_FRAMEBUFFER, static_cast<GLuint>(m_previous));
}

// ============================================================================
// ScopedTextureBinding
// ============================================================================

ScopedTextureBinding::ScopedTextureBinding(GlFunctions const & gl, GLuint texture)
  : m_gl(gl)
{
  m_gl.glGetIntegerv(GL_TEXTURE_BINDING_2D, &m_previous);
  m_gl.glBindTexture(GL_TEXTURE_2D, texture);
}

ScopedTextureBinding::~ScopedTextureBinding()
{
  m_gl.glBindTexture(GL_TEXTURE_2D, static_cast<GLuint>(m_previous));
}

}  // namespace surfbridge
