#pragma once

#include <cstdint>

// Millisecond clock + blocking sleep used by every wait loop.
//
// Link-time seam: the command-line build links host_time_posix.cpp, the device
// simulator links sim/sim_clock.cpp, where delay() advances model time instead
// of sleeping.
namespace host_time {

// Monotonic milliseconds. Wraps; compare with (uint32_t)(now - start).
uint32_t millis();

void delay(uint32_t ms);

}  // namespace host_time
