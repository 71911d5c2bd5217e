#pragma once
#include <cstdint>
#include <initializer_list>
#include <string>
#include <utility>
#include <variant>
#include <vector>

namespace terrascope {

class Value;

// Insertion-ordered map with unique keys. Rendering follows insertion order,
// equality does not (two maps are equal when they hold the same key/value pairs).
class ValueMap {
public:
    using Entry = std::pair<std::string, Value>;
    using const_iterator = std::vector<Entry>::const_iterator;
    using iterator = std::vector<Entry>::iterator;

    ValueMap() = default;
    ValueMap(std::initializer_list<Entry> entries);

    // Replaces the value in place when the key exists, appends otherwise.
    void set(const std::string& key, Value value);

    const Value* find(const std::string& key) const;
    Value* find(const std::string& key);
    bool contains(const std::string& key) const { return find(key) != nullptr; }
    bool erase(const std::string& key);

    size_t size() const { return entries_.size(); }
    bool empty() const { return entries_.empty(); }

    const_iterator begin() const { return entries_.begin(); }
    const_iterator end() const { return entries_.end(); }
    iterator begin() { return entries_.begin(); }
    iterator end() { return entries_.end(); }

    bool operator==(const ValueMap& other) const;
    bool operator!=(const ValueMap& other) const { return !(*this == other); }

private:
    std::vector<Entry> entries_;
};

class Value {
public:
    enum class Kind { STRING, BOOLEAN, INTEGER, FLOAT, LIST, MAP };

    using List = std::vector<Value>;
    using Map = ValueMap;

    Value() : data_(std::string()) {}
    Value(std::string s) : data_(std::move(s)) {}
    Value(const char* s) : data_(std::string(s)) {}
    Value(bool b) : data_(b) {}
    Value(int i) : data_(static_cast<int64_t>(i)) {}
    Value(int64_t i) : data_(i) {}
    Value(double d) : data_(d) {}
    Value(List l) : data_(std::move(l)) {}
    Value(ValueMap m) : data_(std::move(m)) {}

    Kind kind() const { return static_cast<Kind>(data_.index()); }

    bool is_string() const { return std::holds_alternative<std::string>(data_); }
    bool is_bool() const { return std::holds_alternative<bool>(data_); }
    bool is_integer() const { return std::holds_alternative<int64_t>(data_); }
    bool is_float() const { return std::holds_alternative<double>(data_); }
    bool is_list() const { return std::holds_alternative<List>(data_); }
    bool is_map() const { return std::holds_alternative<ValueMap>(data_); }
    bool is_scalar() const { return !is_list() && !is_map(); }

    // Accessors throw std::bad_variant_access on a kind mismatch.
    const std::string& as_string() const { return std::get<std::string>(data_); }
    bool as_bool() const { return std::get<bool>(data_); }
    int64_t as_integer() const { return std::get<int64_t>(data_); }
    double as_float() const { return std::get<double>(data_); }
    const List& as_list() const { return std::get<List>(data_); }
    List& as_list() { return std::get<List>(data_); }
    const ValueMap& as_map() const { return std::get<ValueMap>(data_); }
    ValueMap& as_map() { return std::get<ValueMap>(data_); }

    template <class Visitor>
    decltype(auto) visit(Visitor&& visitor) const {
        return std::visit(std::forward<Visitor>(visitor), data_);
    }

    // False when some List in the tree mixes Maps with non-Map elements.
    bool is_homogeneous() const;

    bool operator==(const Value& other) const { return data_ == other.data_; }
    bool operator!=(const Value& other) const { return !(*this == other); }

private:
    // Alternative order matches Kind.
    std::variant<std::string, bool, int64_t, double, List, ValueMap> data_;
};

std::string kind_to_string(Value::Kind kind);

// Debug/text form of a value (not HCL).
std::string to_display_string(const Value& value);

inline ValueMap::ValueMap(std::initializer_list<Entry> entries) {
    for (const auto& e : entries) set(e.first, e.second);
}

}
