#include "model/ValueJson.hpp"
#include <limits>
#include <stdexcept>

namespace terrascope {

Value value_from_json(const ordered_json& j) {
    switch (j.type()) {
        case ordered_json::value_t::string:
            return Value(j.get<std::string>());
        case ordered_json::value_t::boolean:
            return Value(j.get<bool>());
        case ordered_json::value_t::number_integer:
            return Value(j.get<int64_t>());
        case ordered_json::value_t::number_unsigned: {
            auto u = j.get<uint64_t>();
            if (u > static_cast<uint64_t>(std::numeric_limits<int64_t>::max())) {
                return Value(static_cast<double>(u));
            }
            return Value(static_cast<int64_t>(u));
        }
        case ordered_json::value_t::number_float:
            return Value(j.get<double>());
        case ordered_json::value_t::array: {
            Value::List items;
            items.reserve(j.size());
            for (const auto& item : j) items.push_back(value_from_json(item));
            Value list(std::move(items));
            if (!list.is_homogeneous()) {
                throw std::invalid_argument("list mixes objects with scalar values");
            }
            return list;
        }
        case ordered_json::value_t::object:
            return Value(map_from_json(j));
        default:
            throw std::invalid_argument(std::string("unsupported JSON value: ") + j.type_name());
    }
}

ValueMap map_from_json(const ordered_json& j) {
    if (!j.is_object()) {
        throw std::invalid_argument(std::string("expected a JSON object, got ") + j.type_name());
    }
    ValueMap map;
    for (auto it = j.begin(); it != j.end(); ++it) {
        try {
            map.set(it.key(), value_from_json(it.value()));
        } catch (const std::invalid_argument& e) {
            throw std::invalid_argument("'" + it.key() + "': " + e.what());
        }
    }
    return map;
}

ordered_json value_to_json(const Value& value) {
    switch (value.kind()) {
        case Value::Kind::STRING: return value.as_string();
        case Value::Kind::BOOLEAN: return value.as_bool();
        case Value::Kind::INTEGER: return value.as_integer();
        case Value::Kind::FLOAT: return value.as_float();
        case Value::Kind::LIST: {
            ordered_json arr = ordered_json::array();
            for (const auto& item : value.as_list()) arr.push_back(value_to_json(item));
            return arr;
        }
        case Value::Kind::MAP: return map_to_json(value.as_map());
    }
    return nullptr;
}

ordered_json map_to_json(const ValueMap& map) {
    ordered_json obj = ordered_json::object();
    for (const auto& [key, value] : map) obj[key] = value_to_json(value);
    return obj;
}

}
