#pragma once

#include <optional>

#include "gpu/primitive.h"
#include "shared/log.h"
#include "shared/types.h"

namespace pacer::gpu {

enum class CacheMissPolicy
{
  /*! Charge the miss surcharge on every pixel of a command that switched pages. */
  PageSwitchOnly,
  /*! Never charge a miss surcharge. */
  Disabled,
};

const char *cache_miss_policy_name(CacheMissPolicy policy);

/*!
 * @brief Texture-state costs of one command: what it pays once for rebinding,
 *        and what every pixel pays for sampling.
 */
struct CacheResult {
  u32 one_time_cycles = 0;
  f64 per_pixel_surcharge = 0.0;
  bool page_switched = false;
  bool clut_switched = false;
};

/*!
 * @brief Remembers which texture page and CLUT the rasterizer has bound and
 *        charges for changing them.
 *
 * The hardware's texture cache hit rate depends on texel locality, which the
 * timing engine does not see. The miss surcharge is therefore a fixed policy
 * decision rather than a measurement, see CacheMissPolicy.
 */
class TextureCacheTracker {
public:
  static constexpr u32 kPageSwitchCycles = 150;
  static constexpr u32 kClutSwitchCycles = 100;
  static constexpr f64 kTextureFetchCycles = 1.0;
  static constexpr f64 kCacheMissCycles = 0.5;

  explicit TextureCacheTracker(CacheMissPolicy policy = CacheMissPolicy::PageSwitchOnly);

  /*!
   * @brief Charge the descriptor for its texture state and update the bound
   *        page/CLUT. The descriptor must already have passed validation.
   */
  CacheResult resolve(const PrimitiveDescriptor &descriptor);

  /*! @brief Forget both bindings, as the GP0 clear-cache command does. */
  void invalidate();

  /*! @brief Reinstate bindings from a save state. */
  void restore(std::optional<u32> page, std::optional<u32> clut);

  std::optional<u32> bound_page() const
  {
    return m_current_page;
  }

  std::optional<u32> bound_clut() const
  {
    return m_current_clut;
  }

  CacheMissPolicy policy() const
  {
    return m_policy;
  }

private:
  static Log::Logger<Log::LogModule::TEXCACHE> log;

  CacheMissPolicy m_policy;
  std::optional<u32> m_current_page;
  std::optional<u32> m_current_clut;

  bool bind_page(u32 page);
  bool bind_clut(u32 clut);
};

}
