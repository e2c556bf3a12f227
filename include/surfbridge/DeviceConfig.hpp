#pragma once

#include <string>

namespace surfbridge
{

/**
 * @brief Bootstrap options for a device.
 *
 * Defaults are what a production embedder wants; FromEnvironment() lets a
 * developer flip them without rebuilding:
 *   SURFBRIDGE_KEYED_MUTEX      allocate shared textures with a keyed mutex (default on)
 *   SURFBRIDGE_D3D11_DEBUG      enable the D3D11 debug layer (default off)
 *   SURFBRIDGE_MATCH_ADAPTER    pick the DXGI adapter matching the GL renderer (default on)
 *   SURFBRIDGE_DISABLE_INTEROP  behave as if WGL_NV_DX_interop were missing (default off)
 */
struct DeviceConfig
{
  static DeviceConfig FromEnvironment();

  bool m_useKeyedMutex = true;
  bool m_d3dDebugLayer = false;
  bool m_matchAdapterToRenderer = true;
  bool m_disableInterop = false;
};

std::string DebugPrint(DeviceConfig const & config);

}  // namespace surfbridge
