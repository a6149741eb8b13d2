#include <cstring>

#include "gpu/primitive.h"

namespace pacer::gpu {

static const char *const kind_names[kPrimitiveKindCount] = {
  "FlatTriangle", "GouraudTriangle", "FlatQuad",       "GouraudQuad", "FlatLine",
  "GouraudLine",  "Polyline",        "SolidSprite",    "TexturedSprite", "RectFill",
  "VramToVram",   "VramToCpu",       "CpuToVram",      "LoadClut",    "LoadTexturePage",
};

static const char *const blend_mode_names[kBlendModeCount] = {
  "None", "Average", "Additive", "Subtractive", "QuarterAdd",
};

bool
is_known_kind(const PrimitiveKind kind)
{
  return u8(kind) < kPrimitiveKindCount;
}

bool
is_known_blend_mode(const BlendMode mode)
{
  return u8(mode) < kBlendModeCount;
}

const char *
kind_name(const PrimitiveKind kind)
{
  return is_known_kind(kind) ? kind_names[u8(kind)] : "<unknown kind>";
}

const char *
blend_mode_name(const BlendMode mode)
{
  return is_known_blend_mode(mode) ? blend_mode_names[u8(mode)] : "<unknown blend mode>";
}

std::optional<PrimitiveKind>
kind_from_name(const char *name)
{
  for (u8 i = 0; i < kPrimitiveKindCount; ++i) {
    if (strcmp(name, kind_names[i]) == 0) {
      return PrimitiveKind(i);
    }
  }
  return {};
}

std::optional<BlendMode>
blend_mode_from_name(const char *name)
{
  for (u8 i = 0; i < kBlendModeCount; ++i) {
    if (strcmp(name, blend_mode_names[i]) == 0) {
      return BlendMode(i);
    }
  }
  return {};
}

bool
is_triangle(const PrimitiveKind kind)
{
  return kind == PrimitiveKind::FlatTriangle || kind == PrimitiveKind::GouraudTriangle;
}

bool
is_quad(const PrimitiveKind kind)
{
  return kind == PrimitiveKind::FlatQuad || kind == PrimitiveKind::GouraudQuad;
}

bool
is_line(const PrimitiveKind kind)
{
  return kind == PrimitiveKind::FlatLine || kind == PrimitiveKind::GouraudLine ||
         kind == PrimitiveKind::Polyline;
}

bool
is_sprite(const PrimitiveKind kind)
{
  return kind == PrimitiveKind::SolidSprite || kind == PrimitiveKind::TexturedSprite;
}

bool
is_transfer(const PrimitiveKind kind)
{
  return kind == PrimitiveKind::VramToVram || kind == PrimitiveKind::VramToCpu ||
         kind == PrimitiveKind::CpuToVram;
}

bool
is_texture_state_load(const PrimitiveKind kind)
{
  return kind == PrimitiveKind::LoadClut || kind == PrimitiveKind::LoadTexturePage;
}

bool
effective_textured(const PrimitiveDescriptor &descriptor)
{
  if (descriptor.kind == PrimitiveKind::TexturedSprite) {
    return true;
  }
  if (is_triangle(descriptor.kind) || is_quad(descriptor.kind)) {
    return descriptor.textured;
  }
  return false;
}

bool
effective_gouraud(const PrimitiveDescriptor &descriptor)
{
  switch (descriptor.kind) {
    case PrimitiveKind::GouraudTriangle:
    case PrimitiveKind::GouraudQuad:
    case PrimitiveKind::GouraudLine:
      return true;
    case PrimitiveKind::FlatTriangle:
    case PrimitiveKind::FlatQuad:
    case PrimitiveKind::FlatLine:
    case PrimitiveKind::Polyline:
      return descriptor.gouraud;
    default:
      return false;
  }
}

bool
can_blend(const PrimitiveKind kind)
{
  return is_triangle(kind) || is_quad(kind) || is_line(kind) || is_sprite(kind);
}

}
