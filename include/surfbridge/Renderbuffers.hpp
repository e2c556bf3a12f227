#pragma once

#include "surfbridge/Context.hpp"
#include "surfbridge/GlFunctions.hpp"
#include "surfbridge/Types.hpp"

namespace surfbridge
{

/**
 * @brief Depth/stencil attachments of a surface framebuffer.
 *
 * A context that wants both depth and stencil gets one packed
 * GL_DEPTH24_STENCIL8 buffer, otherwise separate buffers are created for
 * whichever of the two is requested.
 */
class Renderbuffers
{
public:
  Renderbuffers() = default;
  Renderbuffers(Renderbuffers && other);
  Renderbuffers & operator=(Renderbuffers && other);

  Renderbuffers(Renderbuffers const &) = delete;
  Renderbuffers & operator=(Renderbuffers const &) = delete;

  /// Must be called with the owning context current.
  static Renderbuffers Create(GlFunctions const & gl, Size const & size, ContextAttributes const & attributes);

  /// Attaches the buffers to the framebuffer bound to GL_FRAMEBUFFER.
  void BindToCurrentFramebuffer(GlFunctions const & gl) const;

  /// Deletes the buffers. Must be called with the owning context current.
  void Destroy(GlFunctions const & gl);

  bool IsEmpty() const { return m_depthStencil == 0 && m_depth == 0 && m_stencil == 0; }

  GLuint GetDepthStencil() const { return m_depthStencil; }
  GLuint GetDepth() const { return m_depth; }
  GLuint GetStencil() const { return m_stencil; }

private:
  GLuint m_depthStencil = 0;
  GLuint m_depth = 0;
  GLuint m_stencil = 0;
};

}  // namespace surfbridge
