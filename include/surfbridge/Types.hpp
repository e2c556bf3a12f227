#pragma once

#include <cstdint>
#include <string>
#include <variant>

namespace surfbridge
{

struct Size
{
  Size() = default;
  Size(int32_t width, int32_t height) : m_width(width), m_height(height) {}

  bool operator==(Size const & rhs) const { return m_width == rhs.m_width && m_height == rhs.m_height; }
  bool operator!=(Size const & rhs) const { return !(*this == rhs); }

  bool IsEmpty() const { return m_width <= 0 || m_height <= 0; }

  int32_t m_width = 0;
  int32_t m_height = 0;
};

std::string DebugPrint(Size const & size);

/// Identifies the rendering context that owns a surface. Unique per process.
using ContextID = uint64_t;

/// Identifies a live surface. Derived from the native texture pointer for
/// texture surfaces and from the window handle for widget surfaces.
using SurfaceID = uintptr_t;

// Opaque handles shared between the native API and the interop layer.
using ShareHandle = void *;
using InteropDevice = void *;
using InteropObject = void *;
using WindowHandle = void *;

/// Hint about CPU access to the surface memory. Shared textures are always
/// GPU-only on this backend, the hint is accepted for API compatibility.
enum class SurfaceAccess
{
  GPUOnly,
  GPUCPU,
  GPUCPUWriteCombined,
};

/// Native window the caller wants to render into. The window is borrowed:
/// its creation and destruction belong to the windowing glue.
struct NativeWidget
{
  WindowHandle m_windowHandle = nullptr;
};

struct GenericSurfaceType
{
  Size m_size;
};

struct WidgetSurfaceType
{
  NativeWidget m_nativeWidget;
};

using SurfaceType = std::variant<GenericSurfaceType, WidgetSurfaceType>;

}  // namespace surfbridge
