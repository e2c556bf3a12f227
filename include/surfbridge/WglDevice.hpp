#pragma once

#if defined(_WIN32) || defined(_WIN64)

#include "surfbridge/Device.hpp"
#include "surfbridge/DeviceConfig.hpp"
#include "surfbridge/Error.hpp"

#include <memory>

namespace surfbridge
{

/**
 * @brief Opens a Direct3D 11 device with WGL_NV_DX_interop on top.
 *
 * Without the interop extension (or with SURFBRIDGE_DISABLE_INTEROP set) the
 * device is still created, but only widget surfaces can be made from it.
 * Widget surfaces take an HWND as NativeWidget::m_windowHandle.
 * Fails with DeviceCreationFailed.
 */
Error CreateWglDevice(DeviceConfig const & config, std::unique_ptr<Device> & device);

}  // namespace surfbridge

#endif  // defined(_WIN32) || defined(_WIN64)
