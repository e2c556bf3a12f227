#if defined(_WIN32) || defined(_WIN64)

#include "D3D11NativeDevice.hpp"

#include "base/logging.hpp"

#include <algorithm>
#include <cctype>
#include <utility>

namespace surfbridge
{

namespace
{
std::string WideToUtf8(wchar_t const * input)
{
  if (!input)
    return std::string();

  int required = WideCharToMultiByte(CP_UTF8, 0, input, -1, nullptr, 0, nullptr, nullptr);
  if (required <= 0)
    return std::string();

  std::string result(static_cast<size_t>(required - 1), '\0');
  WideCharToMultiByte(CP_UTF8, 0, input, -1, result.data(), required, nullptr, nullptr);
  return result;
}

std::string ToLower(std::string value)
{
  std::transform(value.begin(), value.end(), value.begin(), [](unsigned char c) {
    return static_cast<char>(std::tolower(c));
  });
  return value;
}

Microsoft::WRL::ComPtr<IDXGIAdapter> FindAdapter(std::string const & glRenderer)
{
  Microsoft::WRL::ComPtr<IDXGIFactory1> factory;
  if (FAILED(CreateDXGIFactory1(IID_PPV_ARGS(&factory))) || !factory)
    return nullptr;

  std::string const rendererLower = ToLower(glRenderer);
  for (UINT index = 0;; ++index)
  {
    Microsoft::WRL::ComPtr<IDXGIAdapter> adapter;
    if (factory->EnumAdapters(index, &adapter) == DXGI_ERROR_NOT_FOUND)
      break;

    DXGI_ADAPTER_DESC desc = {};
    if (FAILED(adapter->GetDesc(&desc)))
      continue;

    std::string const adapterName = WideToUtf8(desc.Description);
    std::string const adapterLower = ToLower(adapterName);
    if (rendererLower.find(adapterLower) != std::string::npos ||
        adapterLower.find(rendererLower) != std::string::npos)
    {
      LOG(LINFO, ("Using DXGI adapter", adapterName, "for GL renderer", glRenderer));
      return adapter;
    }
  }

  LOG(LWARNING, ("No DXGI adapter matches GL renderer", glRenderer));
  return nullptr;
}
}  // namespace

// static
Error D3D11NativeDevice::Create(DeviceConfig const & config, std::string const & glRenderer,
                                std::unique_ptr<D3D11NativeDevice> & device)
{
  UINT createFlags = D3D11_CREATE_DEVICE_BGRA_SUPPORT;
  if (config.m_d3dDebugLayer)
    createFlags |= D3D11_CREATE_DEVICE_DEBUG;

  D3D_FEATURE_LEVEL featureLevels[] = {
    D3D_FEATURE_LEVEL_11_1,
    D3D_FEATURE_LEVEL_11_0,
    D3D_FEATURE_LEVEL_10_1,
    D3D_FEATURE_LEVEL_10_0,
  };

  Microsoft::WRL::ComPtr<ID3D11Device> d3dDevice;
  D3D_FEATURE_LEVEL featureLevel;
  HRESULT hr = E_FAIL;

  Microsoft::WRL::ComPtr<IDXGIAdapter> preferredAdapter;
  if (config.m_matchAdapterToRenderer && !glRenderer.empty())
    preferredAdapter = FindAdapter(glRenderer);

  if (preferredAdapter)
  {
    hr = D3D11CreateDevice(preferredAdapter.Get(), D3D_DRIVER_TYPE_UNKNOWN, nullptr, createFlags, featureLevels,
                           ARRAYSIZE(featureLevels), D3D11_SDK_VERSION, &d3dDevice, &featureLevel, nullptr);
  }

  if (FAILED(hr))
  {
    hr = D3D11CreateDevice(nullptr, D3D_DRIVER_TYPE_HARDWARE, nullptr, createFlags, featureLevels,
                           ARRAYSIZE(featureLevels), D3D11_SDK_VERSION, &d3dDevice, &featureLevel, nullptr);
  }

  if (FAILED(hr))
  {
    LOG(LERROR, ("Failed to create D3D11 device:", hr));
    return Error(ErrorCode::DeviceCreationFailed, static_cast<uint32_t>(hr));
  }

  device.reset(new D3D11NativeDevice(std::move(d3dDevice), config.m_useKeyedMutex));
  return Error::Ok();
}

D3D11NativeDevice::D3D11NativeDevice(Microsoft::WRL::ComPtr<ID3D11Device> device, bool useKeyedMutex)
  : m_device(std::move(device))
  , m_useKeyedMutex(useKeyedMutex)
{
}

Error D3D11NativeDevice::CreateSharedTexture(Size const & size, std::unique_ptr<NativeTexture> & texture,
                                             ShareHandle & shareHandle)
{
  D3D11_TEXTURE2D_DESC desc = {};
  desc.Width = static_cast<UINT>(size.m_width);
  desc.Height = static_cast<UINT>(size.m_height);
  desc.MipLevels = 1;
  desc.ArraySize = 1;
  desc.Format = DXGI_FORMAT_R8G8B8A8_UNORM;
  desc.SampleDesc.Count = 1;
  desc.SampleDesc.Quality = 0;
  desc.Usage = D3D11_USAGE_DEFAULT;
  desc.BindFlags = D3D11_BIND_SHADER_RESOURCE | D3D11_BIND_RENDER_TARGET;
  desc.CPUAccessFlags = 0;
  desc.MiscFlags = m_useKeyedMutex ? D3D11_RESOURCE_MISC_SHARED_KEYEDMUTEX : D3D11_RESOURCE_MISC_SHARED;

  Microsoft::WRL::ComPtr<ID3D11Texture2D> d3dTexture;
  HRESULT hr = m_device->CreateTexture2D(&desc, nullptr, &d3dTexture);
  if (FAILED(hr))
  {
    LOG(LERROR, ("Failed to create shared texture:", hr));
    return Error(ErrorCode::SurfaceCreationFailed, static_cast<uint32_t>(hr));
  }

  Microsoft::WRL::ComPtr<IDXGIResource> dxgiResource;
  hr = d3dTexture.As(&dxgiResource);
  if (FAILED(hr))
  {
    LOG(LERROR, ("Failed to get DXGI resource:", hr));
    return Error(ErrorCode::SurfaceCreationFailed, static_cast<uint32_t>(hr));
  }

  // Legacy handles are not reference counted and must not be closed.
  HANDLE handle = nullptr;
  hr = dxgiResource->GetSharedHandle(&handle);
  if (FAILED(hr) || handle == nullptr)
  {
    LOG(LERROR, ("Failed to get shared handle:", hr));
    return Error(ErrorCode::SurfaceCreationFailed, static_cast<uint32_t>(hr));
  }

  texture = std::make_unique<D3D11Texture>(std::move(d3dTexture));
  shareHandle = handle;
  return Error::Ok();
}

Error D3D11NativeDevice::OpenSharedTexture(ShareHandle shareHandle, std::unique_ptr<NativeTexture> & texture)
{
  Microsoft::WRL::ComPtr<ID3D11Texture2D> d3dTexture;
  HRESULT hr = m_device->OpenSharedResource(shareHandle, IID_PPV_ARGS(&d3dTexture));
  if (FAILED(hr))
  {
    LOG(LERROR, ("Failed to open shared texture:", hr));
    return Error(ErrorCode::SurfaceImportFailed, static_cast<uint32_t>(hr));
  }

  texture = std::make_unique<D3D11Texture>(std::move(d3dTexture));
  return Error::Ok();
}

}  // namespace surfbridge

#endif  // defined(_WIN32) || defined(_WIN64)
