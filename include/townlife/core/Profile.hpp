#pragma once
// include/townlife/core/Profile.hpp

// Tracy is enabled by the build (TOWNLIFE_WITH_TRACY) when the client library is found.
#if defined(TOWNLIFE_WITH_TRACY) && TOWNLIFE_WITH_TRACY
  #include <tracy/Tracy.hpp>
  #define TOWNLIFE_ZONE(name_literal)        ZoneScopedN(name_literal)
  #define TOWNLIFE_FRAME_MARK()              FrameMark
  #define TOWNLIFE_PLOT(name_literal, val)   TracyPlot(name_literal, val)
#else
  #define TOWNLIFE_ZONE(name_literal)        do{}while(0)
  #define TOWNLIFE_FRAME_MARK()              do{}while(0)
  #define TOWNLIFE_PLOT(name_literal, val)   do{}while(0)
#endif
