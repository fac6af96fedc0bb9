#pragma once

#include <cstdint>

namespace tandem {

// Bitmap of readiness events. Values are the epoll ones, checked in event-loop.cpp.
using EventBmp = uint32_t;

inline constexpr EventBmp EventIn = 0x001;
inline constexpr EventBmp EventOut = 0x004;
inline constexpr EventBmp EventErr = 0x008;
inline constexpr EventBmp EventHup = 0x010;
inline constexpr EventBmp EventRdHup = 0x2000;

// Interest of a connection waiting for input. Peer hang-up is reported as readable, the read then sees the end.
inline constexpr EventBmp EventReadInterest = EventIn | EventRdHup;

// Interest of a connection waiting for room in the kernel send buffer.
inline constexpr EventBmp EventWriteInterest = EventOut;

}  // namespace tandem
