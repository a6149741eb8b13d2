#pragma once

#include <json/json.h>

#include "gpu/primitive.h"

namespace pacer::gpu {

/*!
 * @brief Encode a descriptor as
 *        {"kind": "FlatQuad", "textured": true, "semi_transparent": true,
 *         "gouraud": false, "blend": "Average", "vertices": [[x, y], ...],
 *         "texture_page": 3, "clut": 1}
 *        with "size": [w, h] in place of "vertices" for sized kinds. Flags that
 *        are false and absent bindings are omitted.
 */
Json::Value descriptor_to_json(const PrimitiveDescriptor &descriptor);

/*!
 * @brief Decode the format written by descriptor_to_json. Unknown kind or blend
 *        names throw UnsupportedKind / UnsupportedBlendMode, malformed vertex or
 *        size arrays throw InvalidGeometry.
 */
PrimitiveDescriptor descriptor_from_json(const Json::Value &value);

}
