#include "model/Value.hpp"
#include <algorithm>
#include <sstream>
#include <spdlog/fmt/fmt.h>

namespace terrascope {

void ValueMap::set(const std::string& key, Value value) {
    if (Value* existing = find(key)) {
        *existing = std::move(value);
        return;
    }
    entries_.emplace_back(key, std::move(value));
}

const Value* ValueMap::find(const std::string& key) const {
    auto it = std::find_if(entries_.begin(), entries_.end(),
                           [&](const Entry& e) { return e.first == key; });
    return it == entries_.end() ? nullptr : &it->second;
}

Value* ValueMap::find(const std::string& key) {
    auto it = std::find_if(entries_.begin(), entries_.end(),
                           [&](const Entry& e) { return e.first == key; });
    return it == entries_.end() ? nullptr : &it->second;
}

bool ValueMap::erase(const std::string& key) {
    auto it = std::find_if(entries_.begin(), entries_.end(),
                           [&](const Entry& e) { return e.first == key; });
    if (it == entries_.end()) return false;
    entries_.erase(it);
    return true;
}

bool ValueMap::operator==(const ValueMap& other) const {
    if (entries_.size() != other.entries_.size()) return false;
    for (const auto& [key, value] : entries_) {
        const Value* theirs = other.find(key);
        if (!theirs || *theirs != value) return false;
    }
    return true;
}

bool Value::is_homogeneous() const {
    if (is_map()) {
        for (const auto& [key, child] : as_map()) {
            if (!child.is_homogeneous()) return false;
        }
        return true;
    }
    if (is_list()) {
        const auto& items = as_list();
        size_t maps = std::count_if(items.begin(), items.end(),
                                    [](const Value& v) { return v.is_map(); });
        if (maps != 0 && maps != items.size()) return false;
        return std::all_of(items.begin(), items.end(),
                           [](const Value& v) { return v.is_homogeneous(); });
    }
    return true;
}

std::string kind_to_string(Value::Kind kind) {
    switch (kind) {
        case Value::Kind::STRING: return "string";
        case Value::Kind::BOOLEAN: return "boolean";
        case Value::Kind::INTEGER: return "integer";
        case Value::Kind::FLOAT: return "float";
        case Value::Kind::LIST: return "list";
        case Value::Kind::MAP: return "map";
        default: return "unknown";
    }
}

std::string to_display_string(const Value& value) {
    switch (value.kind()) {
        case Value::Kind::STRING: return value.as_string();
        case Value::Kind::BOOLEAN: return value.as_bool() ? "true" : "false";
        case Value::Kind::INTEGER: return std::to_string(value.as_integer());
        case Value::Kind::FLOAT: return fmt::format("{}", value.as_float());
        case Value::Kind::LIST: {
            std::stringstream ss;
            ss << "[";
            const auto& items = value.as_list();
            for (size_t i = 0; i < items.size(); ++i) {
                if (i) ss << ", ";
                ss << to_display_string(items[i]);
            }
            ss << "]";
            return ss.str();
        }
        case Value::Kind::MAP: {
            std::stringstream ss;
            ss << "{";
            bool first = true;
            for (const auto& [key, child] : value.as_map()) {
                if (!first) ss << ", ";
                ss << key << ": " << to_display_string(child);
                first = false;
            }
            ss << "}";
            return ss.str();
        }
    }
    return "";
}

}
