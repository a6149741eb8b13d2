#include "gpu/clock_domain.h"

namespace pacer::gpu {

Log::Logger<Log::LogModule::CLOCK> ClockDomain::log;

const char *
clock_standard_name(const ClockStandard standard)
{
  return standard == ClockStandard::PAL ? "PAL" : "NTSC";
}

u64
get_clock_rate(const ClockStandard standard)
{
  switch (standard) {
    case ClockStandard::NTSC:
      return ClockDomain::kNtscClockHz;
    case ClockStandard::PAL:
      return ClockDomain::kPalClockHz;
  }
  return ClockDomain::kNtscClockHz;
}

ClockDomain::ClockDomain(const ClockStandard standard) : m_standard(standard)
{
  log.debug("%s video clock %llu Hz, %llu cycles per frame",
            clock_standard_name(m_standard),
            (unsigned long long)clock_rate(),
            (unsigned long long)frame_cycles());
}

u64
ClockDomain::clock_rate() const
{
  return get_clock_rate(m_standard);
}

u32
ClockDomain::refresh_rate() const
{
  return m_standard == ClockStandard::PAL ? kPalRefreshHz : kNtscRefreshHz;
}

cycles_t
ClockDomain::frame_cycles() const
{
  // NTSC: 887'040, PAL: 1'073'863
  return clock_rate() / refresh_rate();
}

u32
ClockDomain::scanlines_per_frame() const
{
  return u32((frame_cycles() + kCyclesPerScanline - 1) / kCyclesPerScanline);
}

// The 128-bit intermediates keep these exact for any session length.

u64
ClockDomain::cycles_to_nanos(const cycles_t cycles) const
{
  return u64((unsigned __int128)cycles * 1'000'000'000u / clock_rate());
}

cycles_t
ClockDomain::nanos_to_cycles(const u64 nanos) const
{
  return cycles_t((unsigned __int128)nanos * clock_rate() / 1'000'000'000u);
}

f64
ClockDomain::cycles_to_seconds(const cycles_t cycles) const
{
  return f64(cycles) / f64(clock_rate());
}

u64
ClockDomain::gpu_to_cpu_cycles(const cycles_t gpu_cycles) const
{
  return u64((unsigned __int128)gpu_cycles * kCpuClockHz / clock_rate());
}

cycles_t
ClockDomain::cpu_to_gpu_cycles(const u64 cpu_cycles) const
{
  return cycles_t((unsigned __int128)cpu_cycles * clock_rate() / kCpuClockHz);
}

}
