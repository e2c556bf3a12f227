#include "surfbridge/DeviceConfig.hpp"

#include <cstdlib>
#include <cstring>

namespace surfbridge
{

namespace
{
bool ReadSwitch(char const * name, bool defaultValue)
{
  char const * env = std::getenv(name);
  if (!env)
    return defaultValue;

  if (std::strcmp(env, "1") == 0 || std::strcmp(env, "true") == 0 || std::strcmp(env, "TRUE") == 0)
    return true;
  if (std::strcmp(env, "0") == 0 || std::strcmp(env, "false") == 0 || std::strcmp(env, "FALSE") == 0)
    return false;
  return defaultValue;
}
}  // namespace

// static
DeviceConfig DeviceConfig::FromEnvironment()
{
  DeviceConfig config;
  config.m_useKeyedMutex = ReadSwitch("SURFBRIDGE_KEYED_MUTEX", config.m_useKeyedMutex);
  config.m_d3dDebugLayer = ReadSwitch("SURFBRIDGE_D3D11_DEBUG", config.m_d3dDebugLayer);
  config.m_matchAdapterToRenderer = ReadSwitch("SURFBRIDGE_MATCH_ADAPTER", config.m_matchAdapterToRenderer);
  config.m_disableInterop = ReadSwitch("SURFBRIDGE_DISABLE_INTEROP", config.m_disableInterop);
  return config;
}

std::string DebugPrint(DeviceConfig const & config)
{
  auto const onOff = [](bool value) { return value ? "on" : "off"; };
  return std::string("DeviceConfig [keyed mutex: ") + onOff(config.m_useKeyedMutex) +
         ", d3d11 debug: " + onOff(config.m_d3dDebugLayer) +
         ", match adapter: " + onOff(config.m_matchAdapterToRenderer) +
         ", interop disabled: " + onOff(config.m_disableInterop) + "]";
}

}  // namespace surfbridge
