#pragma once

#include <cstring>

#if defined(TRACY_ENABLE)
    #include <tracy/Tracy.hpp>

    #define VRMI_PROFILE_FRAME_MARK() FrameMark
    #define VRMI_PROFILE_FUNCTION() ZoneScoped
    #define VRMI_PROFILE_SCOPE(name) ZoneScopedN(name)
    #define VRMI_PROFILE_TAG(str) ZoneText(str, strlen(str))
#else
    // Empty macros when disabled
    #define VRMI_PROFILE_FRAME_MARK()
    #define VRMI_PROFILE_FUNCTION()
    #define VRMI_PROFILE_SCOPE(name)
    #define VRMI_PROFILE_TAG(str)
#endif
