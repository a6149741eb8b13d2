#pragma once

#include <string>

#include "gpu/clock_domain.h"
#include "gpu/texture_cache.h"
#include "local/settings.h"

namespace pacer::gpu {

/*!
 * @brief Options recognized by the timing engine.
 */
struct TimingConfig {
  static constexpr const char *kClockStandardKey = "gpu.clock_standard";
  static constexpr const char *kCacheMissPolicyKey = "gpu.cache_miss_policy";
  static constexpr const char *kFifoBlockOnFullKey = "gpu.fifo_block_on_full";

  ClockStandard clock_standard = ClockStandard::NTSC;
  CacheMissPolicy cache_miss_policy = CacheMissPolicy::PageSwitchOnly;

  /*! When set, a submission to a full FIFO stalls the issuer until the head
   *  drains. When clear, it throws FifoFull. */
  bool fifo_block_on_full = true;

  /*!
   * @brief Read the gpu.* keys, using defaults for the missing ones. Throws
   *        std::runtime_error for values it does not recognize.
   */
  static TimingConfig from_settings(const local::Settings &settings);

  /*! @brief Write every option back, so a settings file documents itself. */
  void store(local::Settings &settings) const;

  std::string describe() const;
};

ClockStandard parse_clock_standard(std::string_view value);
CacheMissPolicy parse_cache_miss_policy(std::string_view value);

}
