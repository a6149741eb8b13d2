#include <stdexcept>

#include <fmt/core.h>

#include "gpu/timing_config.h"
#include "shared/log.h"

namespace pacer::gpu {

static Log::Logger<Log::LogModule::CONFIG> log;

ClockStandard
parse_clock_standard(const std::string_view value)
{
  if (value == "ntsc" || value == "NTSC") {
    return ClockStandard::NTSC;
  } else if (value == "pal" || value == "PAL") {
    return ClockStandard::PAL;
  }
  throw std::runtime_error(fmt::format("unknown clock standard '{}' (ntsc, pal)", value));
}

CacheMissPolicy
parse_cache_miss_policy(const std::string_view value)
{
  if (value == "page_switch_only") {
    return CacheMissPolicy::PageSwitchOnly;
  } else if (value == "disabled") {
    return CacheMissPolicy::Disabled;
  }
  throw std::runtime_error(
    fmt::format("unknown cache miss policy '{}' (page_switch_only, disabled)", value));
}

static bool
parse_bool(const std::string_view key, const std::string_view value)
{
  if (value == "true" || value == "1") {
    return true;
  } else if (value == "false" || value == "0") {
    return false;
  }
  throw std::runtime_error(fmt::format("{} must be true or false, got '{}'", key, value));
}

TimingConfig
TimingConfig::from_settings(const local::Settings &settings)
{
  TimingConfig config;
  config.clock_standard =
    parse_clock_standard(settings.get_or_default(kClockStandardKey, "ntsc"));
  config.cache_miss_policy =
    parse_cache_miss_policy(settings.get_or_default(kCacheMissPolicyKey, "page_switch_only"));
  config.fifo_block_on_full =
    parse_bool(kFifoBlockOnFullKey, settings.get_or_default(kFifoBlockOnFullKey, "true"));

  log.info("%s", config.describe().c_str());
  return config;
}

void
TimingConfig::store(local::Settings &settings) const
{
  settings.set(kClockStandardKey, clock_standard == ClockStandard::PAL ? "pal" : "ntsc");
  settings.set(kCacheMissPolicyKey, cache_miss_policy_name(cache_miss_policy));
  settings.set(kFifoBlockOnFullKey, fifo_block_on_full ? "true" : "false");
}

std::string
TimingConfig::describe() const
{
  return fmt::format("clock {}, cache miss policy {}, {} on full FIFO",
                     clock_standard_name(clock_standard),
                     cache_miss_policy_name(cache_miss_policy),
                     fifo_block_on_full ? "stall" : "reject");
}

}
