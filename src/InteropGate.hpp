#pragma once

#include "surfbridge/InteropFunctions.hpp"
#include "surfbridge/Types.hpp"

namespace surfbridge
{

// Lock and unlock a single interop object. The driver refusing either call
// after a successful registration means the handle bookkeeping is broken, so
// both abort with a diagnostic instead of returning.
void LockInteropObject(InteropFunctions const & interop, InteropDevice device, InteropObject object);
void UnlockInteropObject(InteropFunctions const & interop, InteropDevice device, InteropObject object);

// Aborts if the driver refuses to unregister.
void UnregisterInteropObject(InteropFunctions const & interop, InteropDevice device, InteropObject object);

/// Holds the lock on one interop object for the lifetime of the guard.
class ScopedInteropLock
{
public:
  ScopedInteropLock(InteropFunctions const & interop, InteropDevice device, InteropObject object);
  ~ScopedInteropLock();

  ScopedInteropLock(ScopedInteropLock const &) = delete;
  ScopedInteropLock & operator=(ScopedInteropLock const &) = delete;

private:
  InteropFunctions const & m_interop;
  InteropDevice m_device;
  InteropObject m_object;
};

}  // namespace surfbridge
