#include "InteropGate.hpp"

#include "base/assert.hpp"
#include "base/logging.hpp"

namespace surfbridge
{

void LockInteropObject(InteropFunctions const & interop, InteropDevice device, InteropObject object)
{
  ASSERT(object != nullptr, ());
  if (!interop.m_lockObjects(device, 1, &object))
  {
    uint32_t const error = GetLastPlatformError();
    CHECK(false, ("wglDXLockObjectsNV failed:", DescribeInteropError(error), error));
  }
}

void UnlockInteropObject(InteropFunctions const & interop, InteropDevice device, InteropObject object)
{
  ASSERT(object != nullptr, ());
  if (!interop.m_unlockObjects(device, 1, &object))
  {
    uint32_t const error = GetLastPlatformError();
    CHECK(false, ("wglDXUnlockObjectsNV failed:", DescribeInteropError(error), error));
  }
}

void UnregisterInteropObject(InteropFunctions const & interop, InteropDevice device, InteropObject object)
{
  if (!interop.m_unregisterObject(device, object))
  {
    uint32_t const error = GetLastPlatformError();
    CHECK(false, ("wglDXUnregisterObjectNV failed:", DescribeInteropError(error), error));
  }
}

ScopedInteropLock::ScopedInteropLock(InteropFunctions const & interop, InteropDevice device, InteropObject object)
  : m_interop(interop)
  , m_device(device)
  , m_object(object)
{
  LockInteropObject(m_interop, m_device, m_object);
}

ScopedInteropLock::~ScopedInteropLock()
{
  UnlockInteropObject(m_interop, m_device, m_object);
}

}  // namespace surfbridge
