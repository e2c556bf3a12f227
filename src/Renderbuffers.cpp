#include "surfbridge/Renderbuffers.hpp"

#include "base/assert.hpp"

#include <utility>

namespace surfbridge
{

namespace
{
GLuint CreateRenderbuffer(GlFunctions const & gl, GLenum internalFormat, Size const & size)
{
  GLuint renderbuffer = 0;
  gl.glGenRenderbuffers(1, &renderbuffer);
  gl.glBindRenderbuffer(GL_RENDERBUFFER, renderbuffer);
  gl.glRenderbufferStorage(GL_RENDERBUFFER, internalFormat, size.m_width, size.m_height);
  gl.glBindRenderbuffer(GL_RENDERBUFFER, 0);
  return renderbuffer;
}

void DeleteRenderbuffer(GlFunctions const & gl, GLuint & renderbuffer)
{
  if (renderbuffer == 0)
    return;
  gl.glDeleteRenderbuffers(1, &renderbuffer);
  renderbuffer = 0;
}
}  // namespace

Renderbuffers::Renderbuffers(Renderbuffers && other)
  : m_depthStencil(std::exchange(other.m_depthStencil, 0))
  , m_depth(std::exchange(other.m_depth, 0))
  , m_stencil(std::exchange(other.m_stencil, 0))
{
}

Renderbuffers & Renderbuffers::operator=(Renderbuffers && other)
{
  ASSERT(IsEmpty(), ("Overwriting live renderbuffers"));
  m_depthStencil = std::exchange(other.m_depthStencil, 0);
  m_depth = std::exchange(other.m_depth, 0);
  m_stencil = std::exchange(other.m_stencil, 0);
  return *this;
}

// static
Renderbuffers Renderbuffers::Create(GlFunctions const & gl, Size const & size, ContextAttributes const & attributes)
{
  Renderbuffers renderbuffers;
  if (attributes.m_depth && attributes.m_stencil)
  {
    renderbuffers.m_depthStencil = CreateRenderbuffer(gl, GL_DEPTH24_STENCIL8, size);
  }
  else
  {
    if (attributes.m_depth)
      renderbuffers.m_depth = CreateRenderbuffer(gl, GL_DEPTH_COMPONENT24, size);
    if (attributes.m_stencil)
      renderbuffers.m_stencil = CreateRenderbuffer(gl, GL_STENCIL_INDEX8, size);
  }
  return renderbuffers;
}

void Renderbuffers::BindToCurrentFramebuffer(GlFunctions const & gl) const
{
  if (m_depthStencil != 0)
  {
    gl.glFramebufferRenderbuffer(GL_FRAMEBUFFER, GL_DEPTH_STENCIL_ATTACHMENT, GL_RENDERBUFFER, m_depthStencil);
    return;
  }

  if (m_depth != 0)
    gl.glFramebufferRenderbuffer(GL_FRAMEBUFFER, GL_DEPTH_ATTACHMENT, GL_RENDERBUFFER, m_depth);
  if (m_stencil != 0)
    gl.glFramebufferRenderbuffer(GL_FRAMEBUFFER, GL_STENCIL_ATTACHMENT, GL_RENDERBUFFER, m_stencil);
}

void Renderbuffers::Destroy(GlFunctions const & gl)
{
  DeleteRenderbuffer(gl, m_depthStencil);
  DeleteRenderbuffer(gl, m_depth);
  DeleteRenderbuffer(gl, m_stencil);
}

}  // namespace surfbridge
