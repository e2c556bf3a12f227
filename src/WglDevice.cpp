#if defined(_WIN32) || defined(_WIN64)

#include "surfbridge/WglDevice.hpp"

#include "D3D11NativeDevice.hpp"
#include "ScopedGuards.hpp"
#include "WglPlatform.hpp"

#include "base/logging.hpp"

#include <string>
#include <utility>

namespace surfbridge
{

Error CreateWglDevice(DeviceConfig const & config, std::unique_ptr<Device> & device)
{
  LOG(LINFO, ("Creating WGL device with", DebugPrint(config)));

  auto contextProvider = std::make_unique<WglContextProvider>();
  Error error = contextProvider->Initialize();
  if (!error.IsOk())
    return error;

  std::string renderer;
  InteropFunctions interop;
  {
    ScopedContextCurrent current(*contextProvider, contextProvider->GetBootstrapContext());
    if (!current.IsCurrent())
      return Error(ErrorCode::DeviceCreationFailed, current.GetNativeError());

    renderer = GetCurrentRendererName();
    if (config.m_disableInterop)
      LOG(LINFO, ("WGL_NV_DX_interop disabled by configuration"));
    else
      LoadInteropFunctions(interop);
  }

  std::unique_ptr<D3D11NativeDevice> nativeDevice;
  error = D3D11NativeDevice::Create(config, renderer, nativeDevice);
  if (!error.IsOk())
    return error;

  InteropDevice interopDevice = nullptr;
  if (interop.IsAvailable())
  {
    ScopedContextCurrent current(*contextProvider, contextProvider->GetBootstrapContext());
    if (!current.IsCurrent())
      return Error(ErrorCode::DeviceCreationFailed, current.GetNativeError());

    interopDevice = interop.m_openDevice(nativeDevice->GetDxDevice());
    if (interopDevice == nullptr)
    {
      uint32_t const nativeError = GetLastPlatformError();
      LOG(LERROR, ("wglDXOpenDeviceNV failed:", nativeError));
      return Error(ErrorCode::DeviceCreationFailed, nativeError);
    }
  }

  LOG(LINFO, ("GL renderer:", renderer, "interop:", interopDevice != nullptr));

  DeviceBackend backend;
  backend.m_nativeDevice = std::move(nativeDevice);
  backend.m_windowSystem = std::make_unique<Win32WindowSystem>();
  backend.m_contextProvider = std::move(contextProvider);
  backend.m_interop = interop;
  backend.m_interopDevice = interopDevice;

  device = std::make_unique<Device>(std::move(backend));
  return Error::Ok();
}

}  // namespace surfbridge

#endif  // defined(_WIN32) || defined(_WIN64)
