#pragma once

#include <json/json.h>

namespace serialization {

/*!
 * @brief Implemented by components whose state goes into a save state. Each
 *        component owns one JSON object inside the snapshot.
 */
class Serializer {
public:
  virtual ~Serializer() = default;

  virtual void serialize(Json::Value &snapshot) const = 0;
  virtual void deserialize(const Json::Value &snapshot) = 0;
};

}
