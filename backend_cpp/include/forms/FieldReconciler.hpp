#pragma once
#include <cstdint>
#include <optional>
#include <string>
#include <utility>
#include <vector>
#include "model/Value.hpp"
#include "model/ValueJson.hpp"

namespace terrascope {

enum class EditorKind { TOGGLE, INTEGER, REAL, TEXT, CHOICE };

inline std::string editor_kind_to_string(EditorKind k) {
    switch (k) {
        case EditorKind::TOGGLE: return "toggle";
        case EditorKind::INTEGER: return "integer";
        case EditorKind::REAL: return "real";
        case EditorKind::TEXT: return "text";
        case EditorKind::CHOICE: return "choice";
        default: return "text";
    }
}

struct FieldEditor {
    EditorKind kind = EditorKind::TEXT;
    std::string label;                    // "Account Tier"
    int64_t min = -2147483648LL;          // INTEGER / REAL bounds
    int64_t max = 2147483647LL;
    std::vector<std::string> options;     // CHOICE only
    std::string selected;                 // CHOICE only

    ordered_json to_json() const;
};

// Editable leaves of one resource: dotted path -> scalar, plus the labels of
// the nested maps (groups) in the order they were met.
class FlatFieldSet {
public:
    using Field = std::pair<std::string, Value>;

    // Replaces in place when the path exists, appends otherwise.
    void set(const std::string& path, Value value);
    void add_group(const std::string& key);

    const Value* find(const std::string& path) const;
    bool contains(const std::string& path) const { return find(path) != nullptr; }

    size_t size() const { return fields_.size(); }
    bool empty() const { return fields_.empty(); }

    const std::vector<Field>& fields() const { return fields_; }
    const std::vector<std::string>& groups() const { return groups_; }

    // {"bucket": "x", "tags.Env": "Dev"}; throws std::invalid_argument on a
    // non-object body or a non-scalar value.
    static FlatFieldSet from_json(const ordered_json& j);
    ordered_json to_json() const;

private:
    std::vector<Field> fields_;
    std::vector<std::string> groups_;
};

// "tags.Env" -> {"tags", "Env"}; "bucket" -> {"bucket", ""}. First dot only.
std::pair<std::string, std::string> split_path(const std::string& path);

// One scalar entry per leaf; scalar children of top-level maps become
// "<parent>.<child>". Lists and maps nested two levels deep are not exposed.
FlatFieldSet flatten(const ValueMap& config);

// Inverse of flatten.
ValueMap reassemble(const FlatFieldSet& fields);

// Overlays reassembled edits onto the current config, keeping every subtree
// the edits do not address.
ValueMap merge_edits(const ValueMap& current, const FlatFieldSet& edits);

std::string field_label(const std::string& key);

FieldEditor editor_for(const std::string& key, const Value& value);

// Error text when the value cannot be stored through the editor.
std::optional<std::string> validate_edit(const FieldEditor& editor, const Value& value);

// Integer into a REAL editor becomes a Float; everything else passes through.
Value coerce_edit(const FieldEditor& editor, const Value& value);

}
