#pragma once

#if defined(_WIN32) || defined(_WIN64)
#include <windows.h>
#endif

#include <GL/gl.h>

// OpenGL constants for FBOs and texture state (not in Windows gl.h)
#ifndef GL_FRAMEBUFFER
#define GL_FRAMEBUFFER                    0x8D40
#define GL_RENDERBUFFER                   0x8D41
#define GL_FRAMEBUFFER_COMPLETE           0x8CD5
#define GL_COLOR_ATTACHMENT0              0x8CE0
#define GL_DEPTH_ATTACHMENT               0x8D00
#define GL_STENCIL_ATTACHMENT             0x8D20
#define GL_DEPTH_STENCIL_ATTACHMENT       0x821A
#define GL_DEPTH24_STENCIL8               0x88F0
#endif

#ifndef GL_FRAMEBUFFER_BINDING
#define GL_FRAMEBUFFER_BINDING            0x8CA6
#endif

#ifndef GL_DEPTH_COMPONENT24
#define GL_DEPTH_COMPONENT24              0x81A6
#endif

#ifndef GL_STENCIL_INDEX8
#define GL_STENCIL_INDEX8                 0x8D48
#endif

#ifndef GL_CLAMP_TO_EDGE
#define GL_CLAMP_TO_EDGE                  0x812F
#endif

namespace surfbridge
{

typedef void (APIENTRY * GlGenTexturesFn)(GLsizei n, GLuint * textures);
typedef void (APIENTRY * GlDeleteTexturesFn)(GLsizei n, GLuint const * textures);
typedef void (APIENTRY * GlBindTextureFn)(GLenum target, GLuint texture);
typedef void (APIENTRY * GlTexParameteriFn)(GLenum target, GLenum pname, GLint param);
typedef void (APIENTRY * GlGetIntegervFn)(GLenum pname, GLint * data);
typedef void (APIENTRY * GlPixelStoreiFn)(GLenum pname, GLint param);
typedef void (APIENTRY * GlReadPixelsFn)(GLint x, GLint y, GLsizei width, GLsizei height,
                                         GLenum format, GLenum type, void * pixels);
typedef void (APIENTRY * GlGenFramebuffersFn)(GLsizei n, GLuint * framebuffers);
typedef void (APIENTRY * GlDeleteFramebuffersFn)(GLsizei n, GLuint const * framebuffers);
typedef void (APIENTRY * GlBindFramebufferFn)(GLenum target, GLuint framebuffer);
typedef void (APIENTRY * GlFramebufferTexture2DFn)(GLenum target, GLenum attachment, GLenum textarget,
                                                   GLuint texture, GLint level);
typedef GLenum (APIENTRY * GlCheckFramebufferStatusFn)(GLenum target);
typedef void (APIENTRY * GlGenRenderbuffersFn)(GLsizei n, GLuint * renderbuffers);
typedef void (APIENTRY * GlDeleteRenderbuffersFn)(GLsizei n, GLuint const * renderbuffers);
typedef void (APIENTRY * GlBindRenderbufferFn)(GLenum target, GLuint renderbuffer);
typedef void (APIENTRY * GlRenderbufferStorageFn)(GLenum target, GLenum internalformat,
                                                  GLsizei width, GLsizei height);
typedef void (APIENTRY * GlFramebufferRenderbufferFn)(GLenum target, GLenum attachment,
                                                      GLenum renderbuffertarget, GLuint renderbuffer);

/**
 * @brief GL entry points used by the surface code, resolved per context.
 *
 * Core 1.1 functions come straight from the system GL library, the FBO set is
 * resolved through the platform's proc-address query while the owning
 * context is current.
 */
struct GlFunctions
{
  bool IsComplete() const;

  GlGenTexturesFn glGenTextures = nullptr;
  GlDeleteTexturesFn glDeleteTextures = nullptr;
  GlBindTextureFn glBindTexture = nullptr;
  GlTexParameteriFn glTexParameteri = nullptr;
  GlGetIntegervFn glGetIntegerv = nullptr;
  GlPixelStoreiFn glPixelStorei = nullptr;
  GlReadPixelsFn glReadPixels = nullptr;

  GlGenFramebuffersFn glGenFramebuffers = nullptr;
  GlDeleteFramebuffersFn glDeleteFramebuffers = nullptr;
  GlBindFramebufferFn glBindFramebuffer = nullptr;
  GlFramebufferTexture2DFn glFramebufferTexture2D = nullptr;
  GlCheckFramebufferStatusFn glCheckFramebufferStatus = nullptr;
  GlGenRenderbuffersFn glGenRenderbuffers = nullptr;
  GlDeleteRenderbuffersFn glDeleteRenderbuffers = nullptr;
  GlBindRenderbufferFn glBindRenderbuffer = nullptr;
  GlRenderbufferStorageFn glRenderbufferStorage = nullptr;
  GlFramebufferRenderbufferFn glFramebufferRenderbuffer = nullptr;
};

char const * FramebufferStatusToString(GLenum status);

}  // namespace surfbridge
