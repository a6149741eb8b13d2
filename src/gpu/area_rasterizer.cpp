#include <algorithm>
#include <cstdlib>

#include <fmt/core.h>

#include "gpu/area_rasterizer.h"
#include "gpu/timing_errors.h"

namespace pacer::gpu {

Log::Logger<Log::LogModule::COST> AreaRasterizer::log;

// The GPU skips any polygon or line whose vertices span more than 1023 pixels
// across or 511 down.
static bool
exceeds_size_limit(std::initializer_list<Vertex> points)
{
  const auto [min_x, max_x] = std::minmax(
    points, [](const Vertex &a, const Vertex &b) { return a.x < b.x; });
  const auto [min_y, max_y] = std::minmax(
    points, [](const Vertex &a, const Vertex &b) { return a.y < b.y; });

  return max_x.x - min_x.x > AreaRasterizer::kMaxPrimitiveWidth ||
         max_y.y - min_y.y > AreaRasterizer::kMaxPrimitiveHeight;
}

u64
AreaRasterizer::triangle_area(const Vertex &a, const Vertex &b, const Vertex &c)
{
  if (exceeds_size_limit({ a, b, c })) {
    return 0;
  }

  // Twice the signed area; coordinates are 11-bit so this fits comfortably.
  const i64 cross =
    i64(b.x - a.x) * i64(c.y - a.y) - i64(c.x - a.x) * i64(b.y - a.y);
  return u64(std::llabs(cross)) / 2;
}

u64
AreaRasterizer::line_length(const Vertex &a, const Vertex &b)
{
  if (exceeds_size_limit({ a, b })) {
    return 0;
  }

  return u64(std::max(std::abs(b.x - a.x), std::abs(b.y - a.y)));
}

SpriteSize
AreaRasterizer::sprite_size_class(const Extent &extent)
{
  const i32 side = std::max(extent.width, extent.height);
  if (side <= 8) {
    return SpriteSize::Size8;
  } else if (side <= 16) {
    return SpriteSize::Size16;
  } else if (side <= 32) {
    return SpriteSize::Size32;
  }
  return SpriteSize::Size64Plus;
}

FillSize
AreaRasterizer::fill_size_class(const Extent &extent)
{
  if (extent.width == kFullScreenWidth && extent.height == kFullScreenHeight) {
    return FillSize::FullScreen;
  }

  const i32 side = std::max(extent.width, extent.height);
  if (side < 32) {
    return FillSize::Small;
  } else if (side <= 128) {
    return FillSize::Medium;
  }
  return FillSize::Large;
}

const VertexList &
AreaRasterizer::vertices(const PrimitiveDescriptor &descriptor) const
{
  const VertexList *list = std::get_if<VertexList>(&descriptor.dimensions);
  if (!list) {
    throw InvalidGeometry(
      fmt::format("{} requires a vertex list", kind_name(descriptor.kind)));
  }

  for (const Vertex &v : *list) {
    if (v.x < kMinCoordinate || v.x > kMaxCoordinate || v.y < kMinCoordinate ||
        v.y > kMaxCoordinate) {
      throw InvalidGeometry(fmt::format("{} vertex ({}, {}) is outside {}..{}",
                                        kind_name(descriptor.kind),
                                        v.x,
                                        v.y,
                                        kMinCoordinate,
                                        kMaxCoordinate));
    }
  }

  return *list;
}

const Extent &
AreaRasterizer::extent(const PrimitiveDescriptor &descriptor) const
{
  const Extent *size = std::get_if<Extent>(&descriptor.dimensions);
  if (!size) {
    throw InvalidGeometry(
      fmt::format("{} requires a width x height", kind_name(descriptor.kind)));
  }
  return *size;
}

void
AreaRasterizer::check_vertex_count(const PrimitiveDescriptor &descriptor,
                                   const size_t count) const
{
  const size_t actual = vertices(descriptor).size();
  const bool ok = descriptor.kind == PrimitiveKind::Polyline ? actual >= count
                                                              : actual == count;
  if (!ok) {
    throw InvalidGeometry(fmt::format("{} needs {}{} vertices, got {}",
                                      kind_name(descriptor.kind),
                                      descriptor.kind == PrimitiveKind::Polyline ? "at least "
                                                                                 : "",
                                      count,
                                      actual));
  }
}

void
AreaRasterizer::check_extent(const PrimitiveDescriptor &descriptor,
                             const i32 max_width,
                             const i32 max_height) const
{
  const Extent &size = extent(descriptor);
  if (size.width <= 0 || size.height <= 0 || size.width > max_width ||
      size.height > max_height) {
    throw InvalidGeometry(fmt::format("{} size {}x{} is outside 1x1..{}x{}",
                                      kind_name(descriptor.kind),
                                      size.width,
                                      size.height,
                                      max_width,
                                      max_height));
  }
}

u32
AreaRasterizer::segment_count(const PrimitiveDescriptor &descriptor) const
{
  switch (descriptor.kind) {
    case PrimitiveKind::FlatLine:
    case PrimitiveKind::GouraudLine:
      return 1;
    case PrimitiveKind::Polyline:
      check_vertex_count(descriptor, 2);
      return u32(vertices(descriptor).size() - 1);
    default:
      return 0;
  }
}

u64
AreaRasterizer::pixel_area(const PrimitiveDescriptor &descriptor) const
{
  u64 area = 0;

  switch (descriptor.kind) {
    case PrimitiveKind::FlatTriangle:
    case PrimitiveKind::GouraudTriangle: {
      check_vertex_count(descriptor, 3);
      const VertexList &v = vertices(descriptor);
      area = triangle_area(v[0], v[1], v[2]);
      break;
    }

    case PrimitiveKind::FlatQuad:
    case PrimitiveKind::GouraudQuad: {
      // Quads are drawn as the strip (v0, v1, v2) + (v1, v2, v3). Shared edge
      // pixels are not deducted.
      check_vertex_count(descriptor, 4);
      const VertexList &v = vertices(descriptor);
      area = triangle_area(v[0], v[1], v[2]) + triangle_area(v[1], v[2], v[3]);
      break;
    }

    case PrimitiveKind::FlatLine:
    case PrimitiveKind::GouraudLine: {
      check_vertex_count(descriptor, 2);
      const VertexList &v = vertices(descriptor);
      area = line_length(v[0], v[1]);
      break;
    }

    case PrimitiveKind::Polyline: {
      check_vertex_count(descriptor, 2);
      const VertexList &v = vertices(descriptor);
      for (size_t i = 1; i < v.size(); ++i) {
        area += line_length(v[i - 1], v[i]);
      }
      break;
    }

    case PrimitiveKind::SolidSprite:
    case PrimitiveKind::TexturedSprite:
    case PrimitiveKind::VramToVram:
    case PrimitiveKind::VramToCpu:
    case PrimitiveKind::CpuToVram: {
      check_extent(descriptor, kMaxRectWidth, kMaxRectHeight);
      const Extent &size = extent(descriptor);
      area = u64(size.width) * u64(size.height);
      break;
    }

    case PrimitiveKind::RectFill: {
      check_extent(descriptor, kMaxRectWidth, kMaxRectHeight);
      const Extent &size = extent(descriptor);
      if (fill_size_class(size) == FillSize::FullScreen) {
        area = kFullScreenArea;
      } else {
        area = u64(size.width) * u64(size.height);
      }
      break;
    }

    case PrimitiveKind::LoadClut:
    case PrimitiveKind::LoadTexturePage:
      area = 0;
      break;

    default:
      throw UnsupportedKind(fmt::format("cannot measure primitive kind {}",
                                        unsigned(descriptor.kind)));
  }

  log.verbose("%s covers %llu pixels", kind_name(descriptor.kind), (unsigned long long)area);
  return area;
}

}
