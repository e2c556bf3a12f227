#pragma once

#include "surfbridge/GlFunctions.hpp"
#include "surfbridge/Types.hpp"

namespace surfbridge
{

/// Platform handles of a rendering context (HDC and HGLRC under WGL).
struct NativeContext
{
  bool operator==(NativeContext const & rhs) const { return m_dc == rhs.m_dc && m_glrc == rhs.m_glrc; }
  bool operator!=(NativeContext const & rhs) const { return !(*this == rhs); }

  bool IsNull() const { return m_glrc == nullptr; }

  void * m_dc = nullptr;
  void * m_glrc = nullptr;
};

/// Which auxiliary buffers surfaces created for a context carry.
struct ContextAttributes
{
  bool m_depth = true;
  bool m_stencil = true;
};

/**
 * @brief A rendering context as seen by the surface code.
 *
 * The context does not own its native handles: they are created and deleted
 * through Device::CreateContext() and Device::DestroyContext().
 */
class Context
{
public:
  Context(ContextID id, NativeContext const & native, GlFunctions const & gl,
          ContextAttributes const & attributes);

  Context(Context const &) = delete;
  Context & operator=(Context const &) = delete;

  ContextID GetId() const { return m_id; }
  NativeContext const & GetNative() const { return m_native; }
  GlFunctions const & GetGl() const { return m_gl; }
  ContextAttributes const & GetAttributes() const { return m_attributes; }

private:
  ContextID const m_id;
  NativeContext const m_native;
  GlFunctions const m_gl;
  ContextAttributes const m_attributes;
};

/// Returns a new process-unique context id. Thread-safe.
ContextID AllocateContextID();

}  // namespace surfbridge
