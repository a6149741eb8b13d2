#pragma once

#include "gpu/area_rasterizer.h"
#include "gpu/primitive.h"
#include "gpu/texture_cache.h"
#include "shared/log.h"
#include "shared/types.h"

namespace pacer::gpu {

/*!
 * @brief Resolved cost of one command. total = base + ceil(area * per pixel).
 */
struct CostEntry {
  u32 base_cycles = 0;
  f64 cycles_per_pixel = 0.0;

  cycles_t total_cycles(u64 pixel_area) const;
};

/*!
 * @brief Maps a command to its cycle cost with additive per-feature rules.
 *
 * The hardware figures these tables are built from are ranges that depend on
 * content (cache locality, span lengths). They are fixed here to single values
 * so a command always costs the same thing.
 *
 * Quads have their own table entry; they are not costed as two triangles and
 * their per-pixel rate is the same as a triangle's.
 */
class CostModel {
public:
  static constexpr f64 kPixelWriteCycles = 1.0;
  static constexpr f64 kTexturedGouraudCycles = 0.5;
  static constexpr f64 kBlendCycles = 1.0;
  static constexpr u32 kTextureStateLoadCycles = 4;

  /*!
   * @brief Reject descriptors the model cannot cost. Throws UnsupportedKind,
   *        UnsupportedBlendMode or InvalidGeometry; has no side effects.
   */
  void check(const PrimitiveDescriptor &descriptor) const;

  /*!
   * @brief Cost of the descriptor given its pixel area and the texture-state
   *        charges already resolved for it.
   */
  CostEntry estimate(const PrimitiveDescriptor &descriptor,
                     u64 pixel_area,
                     const CacheResult &cache) const;

  /*! @brief Base cycles before any one-time texture state charge. */
  u32 base_cycles(const PrimitiveDescriptor &descriptor) const;

  /*! @brief Per-pixel cycles, given the cache's per-pixel surcharge. */
  f64 cycles_per_pixel(const PrimitiveDescriptor &descriptor, f64 surcharge) const;

private:
  static Log::Logger<Log::LogModule::COST> log;

  AreaRasterizer m_geometry;
};

}
