#include <cmath>

#include <fmt/core.h>

#include "gpu/cost_model.h"
#include "gpu/timing_errors.h"

namespace pacer::gpu {

Log::Logger<Log::LogModule::COST> CostModel::log;

namespace {

// Setup cycles, indexed [gouraud][textured]. Untextured shading has no
// per-pixel cost of its own, its interpolator setup is folded in here.
constexpr u32 triangle_base[2][2] = {
  { 30, 40 },
  { 35, 45 },
};
constexpr u32 quad_base[2][2] = {
  { 50, 65 },
  { 60, 75 },
};

// Per segment, indexed [gouraud]
constexpr u32 line_base[2] = { 20, 25 };

// Indexed [SpriteSize][textured]
constexpr u32 sprite_base[4][2] = {
  { 20, 30 },
  { 22, 34 },
  { 26, 40 },
  { 30, 48 },
};

// Indexed by FillSize
constexpr u32 fill_base[4] = { 10, 14, 18, 24 };

struct TransferRate {
  u32 base;
  f64 cycles_per_pixel;
};

// VRAM->VRAM moves 2 pixels per cycle. Transfers through the data port move one
// halfword per cycle.
constexpr TransferRate vram_to_vram_rate = { 30, 0.5 };
constexpr TransferRate cpu_to_vram_rate = { 20, 1.0 };
constexpr TransferRate vram_to_cpu_rate = { 20, 1.0 };

const TransferRate &
transfer_rate(const PrimitiveKind kind)
{
  switch (kind) {
    case PrimitiveKind::VramToVram:
      return vram_to_vram_rate;
    case PrimitiveKind::CpuToVram:
      return cpu_to_vram_rate;
    default:
      return vram_to_cpu_rate;
  }
}

}

cycles_t
CostEntry::total_cycles(const u64 pixel_area) const
{
  // Every per-pixel term is a multiple of 0.5, so the product is exact.
  return cycles_t(base_cycles) + cycles_t(std::ceil(f64(pixel_area) * cycles_per_pixel));
}

void
CostModel::check(const PrimitiveDescriptor &descriptor) const
{
  if (!is_known_kind(descriptor.kind)) {
    throw UnsupportedKind(
      fmt::format("primitive kind {} is not supported", unsigned(descriptor.kind)));
  }

  if (!is_known_blend_mode(descriptor.blend_mode)) {
    throw UnsupportedBlendMode(
      fmt::format("blend mode {} is not supported", unsigned(descriptor.blend_mode)));
  }

  const bool blending = descriptor.blend_mode != BlendMode::None;
  if (blending && !can_blend(descriptor.kind)) {
    throw UnsupportedBlendMode(fmt::format("{} cannot use blend mode {}",
                                           kind_name(descriptor.kind),
                                           blend_mode_name(descriptor.blend_mode)));
  }

  if (can_blend(descriptor.kind) && descriptor.semi_transparent != blending) {
    throw UnsupportedBlendMode(
      fmt::format("{} is {}semi-transparent but has blend mode {}",
                  kind_name(descriptor.kind),
                  descriptor.semi_transparent ? "" : "not ",
                  blend_mode_name(descriptor.blend_mode)));
  }

  if (effective_textured(descriptor) && !descriptor.texture_page) {
    throw InvalidGeometry(
      fmt::format("textured {} has no texture page", kind_name(descriptor.kind)));
  }

  if (descriptor.kind == PrimitiveKind::LoadTexturePage && !descriptor.texture_page) {
    throw InvalidGeometry("LoadTexturePage has no texture page");
  }

  if (descriptor.kind == PrimitiveKind::LoadClut && !descriptor.clut) {
    throw InvalidGeometry("LoadClut has no clut");
  }
}

u32
CostModel::base_cycles(const PrimitiveDescriptor &descriptor) const
{
  const unsigned textured = effective_textured(descriptor) ? 1 : 0;
  const unsigned gouraud = effective_gouraud(descriptor) ? 1 : 0;

  switch (descriptor.kind) {
    case PrimitiveKind::FlatTriangle:
    case PrimitiveKind::GouraudTriangle:
      return triangle_base[gouraud][textured];

    case PrimitiveKind::FlatQuad:
    case PrimitiveKind::GouraudQuad:
      return quad_base[gouraud][textured];

    case PrimitiveKind::FlatLine:
    case PrimitiveKind::GouraudLine:
    case PrimitiveKind::Polyline:
      return line_base[gouraud] * m_geometry.segment_count(descriptor);

    case PrimitiveKind::SolidSprite:
    case PrimitiveKind::TexturedSprite: {
      const SpriteSize size = AreaRasterizer::sprite_size_class(m_geometry.extent(descriptor));
      return sprite_base[unsigned(size)][textured];
    }

    case PrimitiveKind::RectFill: {
      const FillSize size = AreaRasterizer::fill_size_class(m_geometry.extent(descriptor));
      return fill_base[unsigned(size)];
    }

    case PrimitiveKind::VramToVram:
    case PrimitiveKind::VramToCpu:
    case PrimitiveKind::CpuToVram:
      return transfer_rate(descriptor.kind).base;

    case PrimitiveKind::LoadClut:
    case PrimitiveKind::LoadTexturePage:
      return kTextureStateLoadCycles;
  }

  throw UnsupportedKind(
    fmt::format("primitive kind {} is not supported", unsigned(descriptor.kind)));
}

f64
CostModel::cycles_per_pixel(const PrimitiveDescriptor &descriptor, const f64 surcharge) const
{
  if (is_transfer(descriptor.kind)) {
    return transfer_rate(descriptor.kind).cycles_per_pixel;
  }

  if (is_texture_state_load(descriptor.kind)) {
    return 0.0;
  }

  if (descriptor.kind == PrimitiveKind::RectFill) {
    return kPixelWriteCycles;
  }

  const bool textured = effective_textured(descriptor);

  // The texture fetch itself arrives in the surcharge, along with any miss
  // penalty, so it is only counted once.
  f64 rate = kPixelWriteCycles + surcharge;
  if (textured && effective_gouraud(descriptor)) {
    rate += kTexturedGouraudCycles;
  }
  if (descriptor.blend_mode != BlendMode::None) {
    rate += kBlendCycles;
  }
  return rate;
}

CostEntry
CostModel::estimate(const PrimitiveDescriptor &descriptor,
                    const u64 pixel_area,
                    const CacheResult &cache) const
{
  CostEntry entry;
  entry.base_cycles = base_cycles(descriptor) + cache.one_time_cycles;
  entry.cycles_per_pixel = cycles_per_pixel(descriptor, cache.per_pixel_surcharge);

  log.verbose("%s: base %u, %.1f/px, %llu px -> %llu cycles",
              kind_name(descriptor.kind),
              entry.base_cycles,
              entry.cycles_per_pixel,
              (unsigned long long)pixel_area,
              (unsigned long long)entry.total_cycles(pixel_area));
  return entry;
}

}
