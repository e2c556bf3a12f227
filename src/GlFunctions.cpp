#include "surfbridge/GlFunctions.hpp"

namespace surfbridge
{

bool GlFunctions::IsComplete() const
{
  return glGenTextures && glDeleteTextures && glBindTexture && glTexParameteri && glGetIntegerv &&
         glPixelStorei && glReadPixels && glGenFramebuffers && glDeleteFramebuffers && glBindFramebuffer &&
         glFramebufferTexture2D && glCheckFramebufferStatus && glGenRenderbuffers && glDeleteRenderbuffers &&
         glBindRenderbuffer && glRenderbufferStorage && glFramebufferRenderbuffer;
}

char const * FramebufferStatusToString(GLenum status)
{
  switch (status)
  {
  case GL_FRAMEBUFFER_COMPLETE:
    return "GL_FRAMEBUFFER_COMPLETE";
  case 0x8CD6:  // GL_FRAMEBUFFER_INCOMPLETE_ATTACHMENT
    return "GL_FRAMEBUFFER_INCOMPLETE_ATTACHMENT";
  case 0x8CD7:  // GL_FRAMEBUFFER_INCOMPLETE_MISSING_ATTACHMENT
    return "GL_FRAMEBUFFER_INCOMPLETE_MISSING_ATTACHMENT";
  case 0x8CDB:  // GL_FRAMEBUFFER_INCOMPLETE_DRAW_BUFFER
    return "GL_FRAMEBUFFER_INCOMPLETE_DRAW_BUFFER";
  case 0x8CDC:  // GL_FRAMEBUFFER_INCOMPLETE_READ_BUFFER
    return "GL_FRAMEBUFFER_INCOMPLETE_READ_BUFFER";
  case 0x8CDD:  // GL_FRAMEBUFFER_UNSUPPORTED
    return "GL_FRAMEBUFFER_UNSUPPORTED";
  case 0x8D56:  // GL_FRAMEBUFFER_INCOMPLETE_MULTISAMPLE
    return "GL_FRAMEBUFFER_INCOMPLETE_MULTISAMPLE";
  default:
    return "GL_FRAMEBUFFER_INCOMPLETE_UNKNOWN";
  }
}

}  // namespace surfbridge
