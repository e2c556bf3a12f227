#pragma once

#if defined(_WIN32) || defined(_WIN64)

#include "surfbridge/Backend.hpp"
#include "surfbridge/DeviceConfig.hpp"

#include <windows.h>
#include <d3d11.h>
#include <dxgi1_2.h>
#include <wrl/client.h>

#include <memory>
#include <string>
#include <utility>

namespace surfbridge
{

class D3D11Texture : public NativeTexture
{
public:
  explicit D3D11Texture(Microsoft::WRL::ComPtr<ID3D11Texture2D> texture) : m_texture(std::move(texture)) {}

  void * GetDxObject() const override { return m_texture.Get(); }

private:
  Microsoft::WRL::ComPtr<ID3D11Texture2D> m_texture;
};

/**
 * @brief Direct3D 11 allocation backend.
 *
 * Shared textures are RGBA8 render targets created with a legacy (non-NT)
 * share handle, which is what wglDXSetResourceShareHandleNV expects.
 */
class D3D11NativeDevice : public NativeDevice
{
public:
  /// Creates the device on the DXGI adapter named like @a glRenderer when
  /// possible so GL and D3D run on the same GPU.
  static Error Create(DeviceConfig const & config, std::string const & glRenderer,
                      std::unique_ptr<D3D11NativeDevice> & device);

  void * GetDxDevice() const override { return m_device.Get(); }

  Error CreateSharedTexture(Size const & size, std::unique_ptr<NativeTexture> & texture,
                            ShareHandle & shareHandle) override;
  Error OpenSharedTexture(ShareHandle shareHandle, std::unique_ptr<NativeTexture> & texture) override;

private:
  D3D11NativeDevice(Microsoft::WRL::ComPtr<ID3D11Device> device, bool useKeyedMutex);

  Microsoft::WRL::ComPtr<ID3D11Device> m_device;
  bool const m_useKeyedMutex;
};

}  // namespace surfbridge

#endif  // defined(_WIN32) || defined(_WIN64)
