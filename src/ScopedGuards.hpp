#pragma once

#include "surfbridge/Backend.hpp"
#include "surfbridge/Context.hpp"
#include "surfbridge/GlFunctions.hpp"

#include <cstdint>

namespace surfbridge
{

/**
 * @brief Makes a context current for the lifetime of the guard.
 *
 * Whatever was current before (including nothing) is restored on
 * destruction. If the target is already current nothing is switched.
 */
class ScopedContextCurrent
{
public:
  ScopedContextCurrent(ContextProvider & provider, NativeContext const & target);
  ~ScopedContextCurrent();

  ScopedContextCurrent(ScopedContextCurrent const &) = delete;
  ScopedContextCurrent & operator=(ScopedContextCurrent const &) = delete;

  /// False if the switch failed; the previous context is still current then.
  bool IsCurrent() const { return m_isCurrent; }
  uint32_t GetNativeError() const { return m_nativeError; }

private:
  ContextProvider & m_provider;
  NativeContext m_previous;
  bool m_switched = false;
  bool m_isCurrent = false;
  uint32_t m_nativeError = 0;
};

/// Binds a framebuffer to GL_FRAMEBUFFER and rebinds the previous one on exit.
class ScopedFramebufferBinding
{
public:
  ScopedFramebufferBinding(GlFunctions const & gl, GLuint framebuffer);
  ~ScopedFramebufferBinding();

  ScopedFramebufferBinding(ScopedFramebufferBinding const &) = delete;
  ScopedFramebufferBinding & operator=(ScopedFramebufferBinding const &) = delete;

private:
  GlFunctions const & m_gl;
  GLint m_previous = 0;
};

/// Same for the GL_TEXTURE_2D binding of the active texture unit.
class ScopedTextureBinding
{
public:
  ScopedTextureBinding(GlFunctions const & gl, GLuint texture);
  ~ScopedTextureBinding();

  ScopedTextureBinding(ScopedTextureBinding const &) = delete;
  ScopedTextureBinding & operator=(ScopedTextureBinding const &) = delete;

private:
  GlFunctions const & m_gl;
  GLint m_previous = 0;
};

}  // namespace surfbridge
