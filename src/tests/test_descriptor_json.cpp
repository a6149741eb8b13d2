#include <gtest/gtest.h>

#include "gpu/descriptor_json.h"
#include "gpu/timing_errors.h"

using namespace pacer::gpu;

static Json::Value
parse(const std::string &text)
{
  Json::CharReaderBuilder builder;
  std::unique_ptr<Json::CharReader> reader(builder.newCharReader());

  Json::Value root;
  std::string errors;
  const bool ok = reader->parse(text.data(), text.data() + text.size(), &root, &errors);
  EXPECT_TRUE(ok) << errors;
  return root;
}

TEST(DescriptorJson, decode_quad)
{
  const PrimitiveDescriptor quad = descriptor_from_json(parse(R"({
    "kind": "GouraudQuad",
    "textured": true,
    "semi_transparent": true,
    "blend": "Average",
    "vertices": [[0, 0], [40, 0], [0, 20], [40, 20]],
    "texture_page": 3,
    "clut": 1
  })"));

  ASSERT_EQ(quad.kind, PrimitiveKind::GouraudQuad);
  ASSERT_TRUE(quad.textured);
  ASSERT_TRUE(quad.semi_transparent);
  ASSERT_FALSE(quad.gouraud);
  ASSERT_EQ(quad.blend_mode, BlendMode::Average);
  ASSERT_EQ(quad.texture_page, 3u);
  ASSERT_EQ(quad.clut, 1u);

  const VertexList &vertices = std::get<VertexList>(quad.dimensions);
  ASSERT_EQ(vertices.size(), 4u);
  ASSERT_EQ(vertices[3].x, 40);
  ASSERT_EQ(vertices[3].y, 20);
}

TEST(DescriptorJson, decode_sized)
{
  const PrimitiveDescriptor copy =
    descriptor_from_json(parse(R"({"kind": "VramToVram", "size": [64, 32]})"));

  ASSERT_EQ(copy.kind, PrimitiveKind::VramToVram);
  ASSERT_EQ(std::get<Extent>(copy.dimensions).width, 64);
  ASSERT_EQ(std::get<Extent>(copy.dimensions).height, 32);
  ASSERT_EQ(copy.blend_mode, BlendMode::None);
  ASSERT_FALSE(copy.texture_page.has_value());

  const PrimitiveDescriptor load = descriptor_from_json(parse(R"({"kind": "LoadClut", "clut": 9})"));
  ASSERT_TRUE(std::holds_alternative<std::monostate>(load.dimensions));
}

TEST(DescriptorJson, encode_decode)
{
  PrimitiveDescriptor sprite;
  sprite.kind = PrimitiveKind::TexturedSprite;
  sprite.semi_transparent = true;
  sprite.blend_mode = BlendMode::Subtractive;
  sprite.dimensions = Extent { .width = 16, .height = 16 };
  sprite.texture_page = 12;

  const Json::Value encoded = descriptor_to_json(sprite);
  ASSERT_EQ(encoded["kind"].asString(), "TexturedSprite");
  ASSERT_EQ(encoded["blend"].asString(), "Subtractive");
  ASSERT_FALSE(encoded.isMember("textured"));
  ASSERT_FALSE(encoded.isMember("clut"));

  const PrimitiveDescriptor decoded = descriptor_from_json(encoded);
  ASSERT_EQ(decoded.kind, sprite.kind);
  ASSERT_EQ(decoded.blend_mode, sprite.blend_mode);
  ASSERT_EQ(decoded.semi_transparent, sprite.semi_transparent);
  ASSERT_EQ(decoded.texture_page, sprite.texture_page);
  ASSERT_EQ(std::get<Extent>(decoded.dimensions).width, 16);
}

TEST(DescriptorJson, malformed)
{
  ASSERT_THROW(descriptor_from_json(parse(R"({"kind": "Hexagon"})")), UnsupportedKind);
  ASSERT_THROW(descriptor_from_json(parse(R"({"size": [1, 1]})")), UnsupportedKind);
  ASSERT_THROW(descriptor_from_json(parse(R"({"kind": "FlatLine", "blend": "Multiply"})")),
               UnsupportedBlendMode);
  ASSERT_THROW(descriptor_from_json(parse(R"({"kind": "FlatLine", "vertices": [[0, 0], [1]]})")),
               InvalidGeometry);
  ASSERT_THROW(descriptor_from_json(parse(R"({"kind": "RectFill", "size": "big"})")),
               InvalidGeometry);
  ASSERT_THROW(descriptor_from_json(parse("[1, 2]")), InvalidGeometry);
}

TEST(DescriptorJson, wrongly_typed_fields)
{
  ASSERT_THROW(
    descriptor_from_json(parse(R"({"kind": "FlatTriangle", "textured": "yes"})")),
    InvalidGeometry);
  ASSERT_THROW(descriptor_from_json(parse(R"({"kind": "FlatLine", "gouraud": 1})")),
               InvalidGeometry);
  ASSERT_THROW(descriptor_from_json(parse(R"({"kind": "LoadTexturePage", "texture_page": -1})")),
               InvalidGeometry);
  ASSERT_THROW(descriptor_from_json(parse(R"({"kind": "LoadClut", "clut": "7"})")),
               InvalidGeometry);
  ASSERT_THROW(descriptor_from_json(parse(R"({"kind": "FlatLine", "blend": 2})")),
               UnsupportedBlendMode);

  // An explicit null reads as an absent flag.
  const PrimitiveDescriptor line =
    descriptor_from_json(parse(R"({"kind": "FlatLine", "textured": null})"));
  ASSERT_FALSE(line.textured);
}

int
main(int argc, char *argv[])
{
  ::testing::InitGoogleTest(&argc, argv);
  return RUN_ALL_TESTS();
}
