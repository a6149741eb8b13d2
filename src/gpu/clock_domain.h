#pragma once

#include "shared/log.h"
#include "shared/types.h"

namespace pacer::gpu {

enum class ClockStandard
{
  NTSC,
  PAL,
};

const char *clock_standard_name(ClockStandard standard);

/*! @brief GPU video clock for the given standard, in Hz. */
u64 get_clock_rate(ClockStandard standard);

/*!
 * @brief Converts GPU cycle counts to wall-clock time and to CPU cycles under a
 *        selected refresh standard. Holds no state beyond that selection.
 */
class ClockDomain {
public:
  // Video clock. NTSC: 53.2224 MHz, PAL: 53.693175 MHz.
  static constexpr u64 kNtscClockHz = 53'222'400;
  static constexpr u64 kPalClockHz = 53'693'175;

  // The CPU runs from the same crystal in both regions.
  static constexpr u64 kCpuClockHz = 33'868'800;

  static constexpr u32 kNtscRefreshHz = 60;
  static constexpr u32 kPalRefreshHz = 50;

  // Scanline timing, in GPU cycles
  static constexpr u32 kCyclesPerScanline = 3688;
  static constexpr u32 kHBlankCycles = 900;
  static constexpr u32 kVBlankScanlines = 60;

  explicit ClockDomain(ClockStandard standard = ClockStandard::NTSC);

  ClockStandard standard() const
  {
    return m_standard;
  }

  u64 clock_rate() const;
  u32 refresh_rate() const;

  /*! @brief GPU cycles in one frame: clock rate / refresh rate, rounded down. */
  cycles_t frame_cycles() const;

  /*! @brief Scanlines that start within one frame (the last may be partial). */
  u32 scanlines_per_frame() const;

  u64 cycles_to_nanos(cycles_t cycles) const;
  cycles_t nanos_to_cycles(u64 nanos) const;
  f64 cycles_to_seconds(cycles_t cycles) const;

  u64 gpu_to_cpu_cycles(cycles_t gpu_cycles) const;
  cycles_t cpu_to_gpu_cycles(u64 cpu_cycles) const;

private:
  static Log::Logger<Log::LogModule::CLOCK> log;

  ClockStandard m_standard;
};

}
