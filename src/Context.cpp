#include "surfbridge/Context.hpp"

#include <atomic>

namespace surfbridge
{

namespace
{
std::atomic<ContextID> g_nextContextId{1};
}  // namespace

Context::Context(ContextID id, NativeContext const & native, GlFunctions const & gl,
                 ContextAttributes const & attributes)
  : m_id(id)
  , m_native(native)
  , m_gl(gl)
  , m_attributes(attributes)
{
}

ContextID AllocateContextID()
{
  return g_nextContextId.fetch_add(1);
}

}  // namespace surfbridge
