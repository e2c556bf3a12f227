#pragma once

namespace surfbridge
{

/// Routes CoMaps LOG output to stderr (and the debugger on Windows) and keeps
/// LERROR from aborting debug builds. Safe to call more than once.
void InitLogging();

}  // namespace surfbridge
