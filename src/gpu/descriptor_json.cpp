#include <fmt/core.h>

#include "gpu/descriptor_json.h"
#include "gpu/timing_errors.h"

namespace pacer::gpu {

static Json::Value
pair_to_json(const i32 a, const i32 b)
{
  Json::Value pair(Json::arrayValue);
  pair.append(a);
  pair.append(b);
  return pair;
}

static std::pair<i32, i32>
pair_from_json(const Json::Value &value, const char *what)
{
  if (!value.isArray() || value.size() != 2 || !value[0].isInt() || !value[1].isInt()) {
    throw InvalidGeometry(fmt::format("{} must be a [int, int] pair", what));
  }
  return { value[0].asInt(), value[1].asInt() };
}

static bool
flag_from_json(const Json::Value &value, const char *name)
{
  const Json::Value &flag = value[name];
  if (flag.isNull()) {
    return false;
  }
  if (!flag.isBool()) {
    throw InvalidGeometry(fmt::format("\"{}\" must be true or false", name));
  }
  return flag.asBool();
}

static u32
index_from_json(const Json::Value &value, const char *name)
{
  const Json::Value &index = value[name];
  if (!index.isUInt()) {
    throw InvalidGeometry(fmt::format("\"{}\" must be a non-negative integer", name));
  }
  return index.asUInt();
}

Json::Value
descriptor_to_json(const PrimitiveDescriptor &descriptor)
{
  Json::Value out(Json::objectValue);
  out["kind"] = kind_name(descriptor.kind);

  if (descriptor.textured) {
    out["textured"] = true;
  }
  if (descriptor.semi_transparent) {
    out["semi_transparent"] = true;
  }
  if (descriptor.gouraud) {
    out["gouraud"] = true;
  }
  if (descriptor.blend_mode != BlendMode::None) {
    out["blend"] = blend_mode_name(descriptor.blend_mode);
  }

  if (const VertexList *vertices = std::get_if<VertexList>(&descriptor.dimensions)) {
    Json::Value &list = out["vertices"];
    list = Json::Value(Json::arrayValue);
    for (const Vertex &v : *vertices) {
      list.append(pair_to_json(v.x, v.y));
    }
  } else if (const Extent *size = std::get_if<Extent>(&descriptor.dimensions)) {
    out["size"] = pair_to_json(size->width, size->height);
  }

  if (descriptor.texture_page) {
    out["texture_page"] = *descriptor.texture_page;
  }
  if (descriptor.clut) {
    out["clut"] = *descriptor.clut;
  }

  return out;
}

PrimitiveDescriptor
descriptor_from_json(const Json::Value &value)
{
  if (!value.isObject()) {
    throw InvalidGeometry("descriptor must be a JSON object");
  }

  const Json::Value &kind = value["kind"];
  if (!kind.isString()) {
    throw UnsupportedKind("descriptor has no \"kind\" name");
  }

  PrimitiveDescriptor descriptor;
  const auto parsed_kind = kind_from_name(kind.asCString());
  if (!parsed_kind) {
    throw UnsupportedKind(fmt::format("unknown primitive kind '{}'", kind.asString()));
  }
  descriptor.kind = *parsed_kind;

  descriptor.textured = flag_from_json(value, "textured");
  descriptor.semi_transparent = flag_from_json(value, "semi_transparent");
  descriptor.gouraud = flag_from_json(value, "gouraud");

  if (value.isMember("blend")) {
    if (!value["blend"].isString()) {
      throw UnsupportedBlendMode("\"blend\" must be a blend mode name");
    }
    const std::string name = value["blend"].asString();
    const auto mode = blend_mode_from_name(name.c_str());
    if (!mode) {
      throw UnsupportedBlendMode(fmt::format("unknown blend mode '{}'", name));
    }
    descriptor.blend_mode = *mode;
  }

  if (value.isMember("vertices")) {
    const Json::Value &list = value["vertices"];
    if (!list.isArray()) {
      throw InvalidGeometry("\"vertices\" must be an array");
    }

    VertexList vertices;
    for (const Json::Value &entry : list) {
      const auto [x, y] = pair_from_json(entry, "vertex");
      vertices.push_back(Vertex { .x = x, .y = y });
    }
    descriptor.dimensions = std::move(vertices);
  } else if (value.isMember("size")) {
    const auto [width, height] = pair_from_json(value["size"], "size");
    descriptor.dimensions = Extent { .width = width, .height = height };
  }

  if (value.isMember("texture_page")) {
    descriptor.texture_page = index_from_json(value, "texture_page");
  }
  if (value.isMember("clut")) {
    descriptor.clut = index_from_json(value, "clut");
  }

  return descriptor;
}

}
