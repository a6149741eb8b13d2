#pragma once

#include <optional>
#include <variant>
#include <vector>

#include "shared/types.h"

namespace pacer::gpu {

// GP0 drawing and transfer commands the timing engine knows how to cost. The
// numbering is internal and only used for range checks on decoded values.
enum class PrimitiveKind : u8
{
  FlatTriangle,
  GouraudTriangle,
  FlatQuad,
  GouraudQuad,
  FlatLine,
  GouraudLine,
  Polyline,
  SolidSprite,
  TexturedSprite,
  RectFill,
  VramToVram,
  VramToCpu,
  CpuToVram,
  LoadClut,
  LoadTexturePage,
};
static constexpr u8 kPrimitiveKindCount = u8(PrimitiveKind::LoadTexturePage) + 1;

// Semi-transparency arithmetic. All four modes cost the same.
enum class BlendMode : u8
{
  None,
  Average,     /*!< B/2 + F/2 */
  Additive,    /*!< B + F */
  Subtractive, /*!< B - F */
  QuarterAdd,  /*!< B + F/4 */
};
static constexpr u8 kBlendModeCount = u8(BlendMode::QuarterAdd) + 1;

// Vertex in drawing coordinates. The hardware takes 11-bit signed values.
struct Vertex {
  i32 x = 0;
  i32 y = 0;
};
using VertexList = std::vector<Vertex>;

struct Extent {
  i32 width = 0;
  i32 height = 0;
};

// Polygons and lines carry vertices, sprites/fills/transfers carry an extent and
// texture-state loads carry nothing.
using Dimensions = std::variant<std::monostate, VertexList, Extent>;

/*!
 * @brief One drawing or transfer command as seen by the timing engine. Treated
 *        as an immutable value once submitted.
 */
struct PrimitiveDescriptor {
  PrimitiveKind kind = PrimitiveKind::FlatTriangle;
  bool textured = false;
  bool semi_transparent = false;
  bool gouraud = false;
  BlendMode blend_mode = BlendMode::None;
  Dimensions dimensions;
  std::optional<u32> texture_page;
  std::optional<u32> clut;
};

bool is_known_kind(PrimitiveKind kind);
bool is_known_blend_mode(BlendMode mode);

const char *kind_name(PrimitiveKind kind);
const char *blend_mode_name(BlendMode mode);

/*! @brief Returns the kind with the given name, or nullopt. */
std::optional<PrimitiveKind> kind_from_name(const char *name);
std::optional<BlendMode> blend_mode_from_name(const char *name);

// Kind classification
bool is_triangle(PrimitiveKind kind);
bool is_quad(PrimitiveKind kind);
bool is_line(PrimitiveKind kind);
bool is_sprite(PrimitiveKind kind);
bool is_transfer(PrimitiveKind kind);
bool is_texture_state_load(PrimitiveKind kind);

/*!
 * @brief Texturing as the engine evaluates it. Only triangles and quads honor
 *        the flag; TexturedSprite always samples, everything else never does.
 */
bool effective_textured(const PrimitiveDescriptor &descriptor);

/*!
 * @brief Gouraud shading as the engine evaluates it. The Gouraud* kinds always
 *        shade, Flat* kinds and Polyline honor the flag, everything else never
 *        shades.
 */
bool effective_gouraud(const PrimitiveDescriptor &descriptor);

/*! @brief True for kinds that are allowed a blend mode. */
bool can_blend(PrimitiveKind kind);

}
