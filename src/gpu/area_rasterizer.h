#pragma once

#include "gpu/primitive.h"
#include "shared/log.h"
#include "shared/types.h"

namespace pacer::gpu {

enum class SpriteSize
{
  Size8,
  Size16,
  Size32,
  Size64Plus,
};

enum class FillSize
{
  Small,      /*!< larger side < 32 */
  Medium,     /*!< larger side 32..128 */
  Large,      /*!< larger side > 128 */
  FullScreen, /*!< exactly 320x240 */
};

/*!
 * @brief Computes how many pixels a command touches. Stateless geometry; does
 *        not clip against the drawing area.
 */
class AreaRasterizer {
public:
  // Coordinates are 11-bit signed on the wire.
  static constexpr i32 kMinCoordinate = -1024;
  static constexpr i32 kMaxCoordinate = 1023;

  // Primitives whose extent reaches past these are dropped by the hardware.
  static constexpr i32 kMaxPrimitiveWidth = 1023;
  static constexpr i32 kMaxPrimitiveHeight = 511;

  // VRAM is 1024x512 halfwords.
  static constexpr i32 kMaxRectWidth = 1024;
  static constexpr i32 kMaxRectHeight = 512;

  static constexpr u64 kFullScreenArea = 76'800; // 320 x 240
  static constexpr i32 kFullScreenWidth = 320;
  static constexpr i32 kFullScreenHeight = 240;

  /*!
   * @brief Pixel area covered by the descriptor. Throws InvalidGeometry when
   *        the dimensions do not fit the kind.
   */
  u64 pixel_area(const PrimitiveDescriptor &descriptor) const;

  /*!
   * @brief Number of independently costed line segments. One for a line, N-1
   *        for a polyline of N vertices and zero for anything else.
   */
  u32 segment_count(const PrimitiveDescriptor &descriptor) const;

  /*! @brief The width x height of a sprite, fill or transfer. */
  const Extent &extent(const PrimitiveDescriptor &descriptor) const;

  static SpriteSize sprite_size_class(const Extent &extent);
  static FillSize fill_size_class(const Extent &extent);

  static u64 triangle_area(const Vertex &a, const Vertex &b, const Vertex &c);
  static u64 line_length(const Vertex &a, const Vertex &b);

private:
  static Log::Logger<Log::LogModule::COST> log;

  const VertexList &vertices(const PrimitiveDescriptor &descriptor) const;
  void check_vertex_count(const PrimitiveDescriptor &descriptor, size_t count) const;
  void check_extent(const PrimitiveDescriptor &descriptor, i32 max_width, i32 max_height) const;
};

}
