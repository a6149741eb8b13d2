#include <gtest/gtest.h>

#include "gpu/cost_model.h"
#include "gpu/timing_errors.h"

using namespace pacer::gpu;

// Page already bound: the fetch is charged, the miss is not.
static const CacheResult kPageBound = { .one_time_cycles = 0, .per_pixel_surcharge = 1.0 };

static PrimitiveDescriptor
triangle(const bool textured, const bool semi_transparent)
{
  PrimitiveDescriptor descriptor;
  descriptor.kind = PrimitiveKind::FlatTriangle;
  descriptor.textured = textured;
  descriptor.semi_transparent = semi_transparent;
  descriptor.blend_mode = semi_transparent ? BlendMode::Average : BlendMode::None;
  descriptor.dimensions = VertexList { { 0, 0 }, { 20, 0 }, { 0, 10 } };
  if (textured) {
    descriptor.texture_page = 0;
  }
  return descriptor;
}

static PrimitiveDescriptor
sized(const PrimitiveKind kind, const i32 width, const i32 height)
{
  PrimitiveDescriptor descriptor;
  descriptor.kind = kind;
  descriptor.dimensions = Extent { .width = width, .height = height };
  return descriptor;
}

TEST(CostModel, flat_untextured_triangle)
{
  const CostModel model;
  const CostEntry cost = model.estimate(triangle(false, false), 100, CacheResult {});
  ASSERT_EQ(cost.base_cycles, 30u);
  ASSERT_DOUBLE_EQ(cost.cycles_per_pixel, 1.0);
  ASSERT_EQ(cost.total_cycles(100), 130u);
}

TEST(CostModel, textured_semi_transparent_triangle)
{
  const CostModel model;
  const CostEntry cost = model.estimate(triangle(true, true), 200, kPageBound);
  ASSERT_EQ(cost.base_cycles, 40u);
  ASSERT_DOUBLE_EQ(cost.cycles_per_pixel, 3.0);
  ASSERT_EQ(cost.total_cycles(200), 640u);
}

TEST(CostModel, gouraud_textured_semi_transparent_quad)
{
  const CostModel model;

  PrimitiveDescriptor quad;
  quad.kind = PrimitiveKind::GouraudQuad;
  quad.textured = true;
  quad.semi_transparent = true;
  quad.blend_mode = BlendMode::Additive;
  quad.dimensions = VertexList { { 0, 0 }, { 40, 0 }, { 0, 20 }, { 40, 20 } };
  quad.texture_page = 1;

  const CostEntry cost = model.estimate(quad, 800, kPageBound);
  ASSERT_EQ(cost.base_cycles, 75u);
  ASSERT_DOUBLE_EQ(cost.cycles_per_pixel, 3.5);
  ASSERT_EQ(cost.total_cycles(800), 2875u);
}

TEST(CostModel, vram_to_vram)
{
  const CostModel model;
  const CostEntry cost = model.estimate(sized(PrimitiveKind::VramToVram, 64, 64), 4096, {});
  ASSERT_EQ(cost.total_cycles(4096), 2078u);

  // Odd pixel counts round up.
  ASSERT_EQ(cost.total_cycles(3), 32u);
}

TEST(CostModel, page_switch_charges)
{
  const CostModel model;
  const CacheResult switched = {
    .one_time_cycles = 150,
    .per_pixel_surcharge = 1.5,
    .page_switched = true,
  };

  const CostEntry cost = model.estimate(triangle(true, false), 100, switched);
  ASSERT_EQ(cost.base_cycles, 190u);
  ASSERT_DOUBLE_EQ(cost.cycles_per_pixel, 2.5);
  ASSERT_EQ(cost.total_cycles(100), 440u);
}

TEST(CostModel, zero_area_costs_base)
{
  const CostModel model;
  const PrimitiveDescriptor descriptors[] = {
    triangle(false, false),
    triangle(true, true),
    sized(PrimitiveKind::SolidSprite, 8, 8),
    sized(PrimitiveKind::RectFill, 320, 240),
    sized(PrimitiveKind::CpuToVram, 1, 1),
  };

  for (const PrimitiveDescriptor &descriptor : descriptors) {
    const CostEntry cost = model.estimate(descriptor, 0, kPageBound);
    ASSERT_EQ(cost.total_cycles(0), cost.base_cycles) << kind_name(descriptor.kind);
    ASSERT_GT(cost.base_cycles, 0u) << kind_name(descriptor.kind);
  }
}

TEST(CostModel, cost_grows_with_area)
{
  const CostModel model;
  const CostEntry cost = model.estimate(triangle(true, true), 0, kPageBound);

  cycles_t previous = 0;
  for (u64 area = 0; area < 4096; area += 37) {
    const cycles_t total = cost.total_cycles(area);
    ASSERT_GE(total, previous);
    previous = total;
  }
}

TEST(CostModel, each_feature_adds_cycles)
{
  const CostModel model;

  const f64 flat = model.cycles_per_pixel(triangle(false, false), 0.0);
  const f64 textured = model.cycles_per_pixel(triangle(true, false), 1.0);
  const f64 blended = model.cycles_per_pixel(triangle(true, true), 1.0);

  PrimitiveDescriptor shaded = triangle(true, true);
  shaded.gouraud = true;
  const f64 all = model.cycles_per_pixel(shaded, 1.0);

  ASSERT_LT(flat, textured);
  ASSERT_LT(textured, blended);
  ASSERT_LT(blended, all);
}

TEST(CostModel, lines_cost_per_segment)
{
  const CostModel model;

  PrimitiveDescriptor strip;
  strip.kind = PrimitiveKind::Polyline;
  strip.dimensions = VertexList { { 0, 0 }, { 10, 0 }, { 10, 10 }, { 0, 10 } };
  ASSERT_EQ(model.base_cycles(strip), 60u);

  strip.gouraud = true;
  ASSERT_EQ(model.base_cycles(strip), 75u);

  PrimitiveDescriptor line;
  line.kind = PrimitiveKind::GouraudLine;
  line.dimensions = VertexList { { 0, 0 }, { 10, 0 } };
  ASSERT_EQ(model.base_cycles(line), 25u);
}

TEST(CostModel, sprites_and_fills)
{
  const CostModel model;

  ASSERT_EQ(model.base_cycles(sized(PrimitiveKind::SolidSprite, 8, 8)), 20u);

  PrimitiveDescriptor sprite = sized(PrimitiveKind::TexturedSprite, 64, 64);
  sprite.texture_page = 0;
  ASSERT_EQ(model.base_cycles(sprite), 48u);

  ASSERT_EQ(model.base_cycles(sized(PrimitiveKind::RectFill, 16, 16)), 10u);
  ASSERT_EQ(model.base_cycles(sized(PrimitiveKind::RectFill, 320, 240)), 24u);

  // Fills bypass texturing and blending.
  ASSERT_DOUBLE_EQ(model.cycles_per_pixel(sized(PrimitiveKind::RectFill, 16, 16), 0.0), 1.0);
}

TEST(CostModel, rejects_unsupported_descriptors)
{
  const CostModel model;

  PrimitiveDescriptor bad_kind = triangle(false, false);
  bad_kind.kind = PrimitiveKind(200);
  ASSERT_THROW(model.check(bad_kind), UnsupportedKind);

  PrimitiveDescriptor bad_mode = triangle(false, true);
  bad_mode.blend_mode = BlendMode(17);
  ASSERT_THROW(model.check(bad_mode), UnsupportedBlendMode);

  // Blend mode without semi-transparency, and the reverse.
  PrimitiveDescriptor mismatch = triangle(false, false);
  mismatch.blend_mode = BlendMode::Subtractive;
  ASSERT_THROW(model.check(mismatch), UnsupportedBlendMode);
  mismatch.blend_mode = BlendMode::None;
  mismatch.semi_transparent = true;
  ASSERT_THROW(model.check(mismatch), UnsupportedBlendMode);

  // Fills and transfers never blend.
  PrimitiveDescriptor fill = sized(PrimitiveKind::RectFill, 10, 10);
  fill.semi_transparent = true;
  fill.blend_mode = BlendMode::Average;
  ASSERT_THROW(model.check(fill), UnsupportedBlendMode);

  PrimitiveDescriptor no_page = triangle(true, false);
  no_page.texture_page.reset();
  ASSERT_THROW(model.check(no_page), InvalidGeometry);

  PrimitiveDescriptor load_clut;
  load_clut.kind = PrimitiveKind::LoadClut;
  ASSERT_THROW(model.check(load_clut), InvalidGeometry);

  ASSERT_NO_THROW(model.check(triangle(true, true)));
}

int
main(int argc, char *argv[])
{
  ::testing::InitGoogleTest(&argc, argv);
  return RUN_ALL_TESTS();
}
