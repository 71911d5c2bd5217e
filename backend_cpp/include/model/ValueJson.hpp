#pragma once
#include <nlohmann/json.hpp>
#include "model/Value.hpp"

namespace terrascope {

using ordered_json = nlohmann::ordered_json;

// Throws std::invalid_argument for null, binary and mixed Map/scalar lists.
Value value_from_json(const ordered_json& j);

// Requires a JSON object.
ValueMap map_from_json(const ordered_json& j);

ordered_json value_to_json(const Value& value);
ordered_json map_to_json(const ValueMap& map);

}
