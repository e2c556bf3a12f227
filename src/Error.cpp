#include "surfbridge/Error.hpp"

#include "base/assert.hpp"

#include <iomanip>
#include <sstream>

namespace surfbridge
{

std::string DebugPrint(ErrorCode code)
{
  switch (code)
  {
  case ErrorCode::Ok: return "Ok";
  case ErrorCode::RequiredExtensionUnavailable: return "RequiredExtensionUnavailable";
  case ErrorCode::SurfaceCreationFailed: return "SurfaceCreationFailed";
  case ErrorCode::SurfaceImportFailed: return "SurfaceImportFailed";
  case ErrorCode::IncompatibleSurface: return "IncompatibleSurface";
  case ErrorCode::InvalidNativeWidget: return "InvalidNativeWidget";
  case ErrorCode::WidgetAttached: return "WidgetAttached";
  case ErrorCode::NoWidgetAttached: return "NoWidgetAttached";
  case ErrorCode::MakeCurrentFailed: return "MakeCurrentFailed";
  case ErrorCode::ContextCreationFailed: return "ContextCreationFailed";
  case ErrorCode::DeviceCreationFailed: return "DeviceCreationFailed";
  case ErrorCode::Unimplemented: return "Unimplemented";
  }
  UNREACHABLE();
}

std::string DebugPrint(Error const & error)
{
  if (error.GetNativeError() == 0)
    return DebugPrint(error.GetCode());

  std::ostringstream out;
  out << DebugPrint(error.GetCode()) << "(0x" << std::hex << std::setw(8) << std::setfill('0')
      << error.GetNativeError() << ")";
  return out.str();
}

}  // namespace surfbridge
