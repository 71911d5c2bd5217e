#include "forms/FieldReconciler.hpp"
#include <algorithm>
#include <cctype>
#include <stdexcept>
#include <unordered_map>

namespace terrascope {

namespace {

const std::unordered_map<std::string, std::vector<std::string>>& known_choices() {
    static const std::unordered_map<std::string, std::vector<std::string>> choices = {
        {"instance_type", {"t2.micro", "t2.small", "t2.medium", "t3.micro", "t3.small", "t3.medium"}},
        {"account_tier", {"Standard", "Premium"}},
        {"account_replication_type", {"LRS", "GRS", "RAGRS", "ZRS", "GZRS", "RAGZRS"}},
        // AWS regions
        {"region", {"us-east-1", "us-east-2", "us-west-1", "us-west-2",
                    "eu-west-1", "eu-west-2", "eu-central-1",
                    "ap-northeast-1", "ap-northeast-2", "ap-southeast-1", "ap-southeast-2"}},
        // Azure locations
        {"location", {"East US", "East US 2", "Central US", "West US", "West US 2",
                      "North Europe", "West Europe", "UK South", "UK West",
                      "East Asia", "Southeast Asia", "Australia East"}}
    };
    return choices;
}

bool ends_with(const std::string& s, const std::string& suffix) {
    return s.size() >= suffix.size() &&
           s.compare(s.size() - suffix.size(), suffix.size(), suffix) == 0;
}

bool is_choice_key(const std::string& key) {
    if (known_choices().count(key)) return true;
    if (key == "tier" || key == "size" || key == "type") return true;
    return ends_with(key, "_type") || ends_with(key, "_tier") || ends_with(key, "_size");
}

}

// --- FieldEditor ---

ordered_json FieldEditor::to_json() const {
    ordered_json j = {{"kind", editor_kind_to_string(kind)}, {"label", label}};
    if (kind == EditorKind::INTEGER || kind == EditorKind::REAL) {
        j["min"] = min;
        j["max"] = max;
    }
    if (kind == EditorKind::CHOICE) {
        j["options"] = options;
        j["selected"] = selected;
    }
    return j;
}

// --- FlatFieldSet ---

void FlatFieldSet::set(const std::string& path, Value value) {
    auto it = std::find_if(fields_.begin(), fields_.end(),
                           [&](const Field& f) { return f.first == path; });
    if (it != fields_.end()) {
        it->second = std::move(value);
    } else {
        fields_.emplace_back(path, std::move(value));
    }
}

void FlatFieldSet::add_group(const std::string& key) {
    if (std::find(groups_.begin(), groups_.end(), key) == groups_.end()) {
        groups_.push_back(key);
    }
}

const Value* FlatFieldSet::find(const std::string& path) const {
    auto it = std::find_if(fields_.begin(), fields_.end(),
                           [&](const Field& f) { return f.first == path; });
    return it == fields_.end() ? nullptr : &it->second;
}

FlatFieldSet FlatFieldSet::from_json(const ordered_json& j) {
    if (!j.is_object()) {
        throw std::invalid_argument("field edits must be a JSON object of path -> value");
    }
    FlatFieldSet set;
    for (auto it = j.begin(); it != j.end(); ++it) {
        Value v = value_from_json(it.value());
        if (!v.is_scalar()) {
            throw std::invalid_argument("field '" + it.key() + "' must hold a scalar value");
        }
        set.set(it.key(), std::move(v));
    }
    return set;
}

ordered_json FlatFieldSet::to_json() const {
    ordered_json j = ordered_json::object();
    for (const auto& [path, value] : fields_) j[path] = value_to_json(value);
    return j;
}

// --- Flatten / Reassemble ---

std::pair<std::string, std::string> split_path(const std::string& path) {
    auto dot = path.find('.');
    if (dot == std::string::npos) return {path, ""};
    return {path.substr(0, dot), path.substr(dot + 1)};
}

FlatFieldSet flatten(const ValueMap& config) {
    FlatFieldSet fields;
    for (const auto& [key, value] : config) {
        if (value.is_map()) {
            fields.add_group(key);
            for (const auto& [child_key, child] : value.as_map()) {
                if (child.is_scalar()) fields.set(key + "." + child_key, child);
            }
        } else if (value.is_scalar()) {
            fields.set(key, value);
        }
    }
    return fields;
}

ValueMap reassemble(const FlatFieldSet& fields) {
    ValueMap config;
    for (const auto& [path, value] : fields.fields()) {
        if (path.find('.') == std::string::npos) {
            config.set(path, value);
            continue;
        }

        auto [parent_key, child_key] = split_path(path);
        Value* parent = config.find(parent_key);
        if (!parent || !parent->is_map()) {
            config.set(parent_key, ValueMap{});
            parent = config.find(parent_key);
        }
        parent->as_map().set(child_key, value);
    }

    // Groups with no editable children still exist as (empty) maps
    for (const auto& group : fields.groups()) {
        if (!config.contains(group)) config.set(group, ValueMap{});
    }
    return config;
}

ValueMap merge_edits(const ValueMap& current, const FlatFieldSet& edits) {
    ValueMap merged = current;
    for (const auto& [key, patch] : reassemble(edits)) {
        Value* existing = merged.find(key);
        if (patch.is_map() && existing && existing->is_map()) {
            for (const auto& [child_key, child] : patch.as_map()) {
                existing->as_map().set(child_key, child);
            }
        } else {
            merged.set(key, patch);
        }
    }
    return merged;
}

// --- Editors ---

std::string field_label(const std::string& key) {
    std::string label;
    label.reserve(key.size());
    bool prev_alpha = false;
    for (unsigned char c : key) {
        if (c == '_') {
            label += ' ';
            prev_alpha = false;
            continue;
        }
        bool alpha = std::isalpha(c) != 0;
        if (alpha) {
            label += static_cast<char>(prev_alpha ? std::tolower(c) : std::toupper(c));
        } else {
            label += static_cast<char>(c);
        }
        prev_alpha = alpha;
    }
    return label;
}

FieldEditor editor_for(const std::string& key, const Value& value) {
    FieldEditor editor;
    editor.label = field_label(key);

    switch (value.kind()) {
        case Value::Kind::BOOLEAN:
            editor.kind = EditorKind::TOGGLE;
            break;
        case Value::Kind::INTEGER:
            editor.kind = EditorKind::INTEGER;
            break;
        case Value::Kind::FLOAT:
            editor.kind = EditorKind::REAL;
            break;
        case Value::Kind::STRING: {
            if (!is_choice_key(key)) {
                editor.kind = EditorKind::TEXT;
                break;
            }
            editor.kind = EditorKind::CHOICE;
            const auto& current = value.as_string();
            auto known = known_choices().find(key);
            if (known != known_choices().end()) editor.options = known->second;

            // Unknown current value is kept and selectable
            if (std::find(editor.options.begin(), editor.options.end(), current) == editor.options.end()) {
                editor.options.insert(editor.options.begin(), current);
            }
            editor.selected = current;
            break;
        }
        case Value::Kind::LIST:
        case Value::Kind::MAP:
            editor.kind = EditorKind::TEXT;
            break;
    }
    return editor;
}

std::optional<std::string> validate_edit(const FieldEditor& editor, const Value& value) {
    switch (editor.kind) {
        case EditorKind::TOGGLE:
            if (!value.is_bool()) return "expected a boolean, got " + kind_to_string(value.kind());
            return std::nullopt;
        case EditorKind::INTEGER: {
            if (!value.is_integer()) return "expected an integer, got " + kind_to_string(value.kind());
            int64_t i = value.as_integer();
            if (i < editor.min || i > editor.max) {
                return "value " + std::to_string(i) + " outside [" + std::to_string(editor.min) +
                       ", " + std::to_string(editor.max) + "]";
            }
            return std::nullopt;
        }
        case EditorKind::REAL: {
            if (!value.is_float() && !value.is_integer()) {
                return "expected a number, got " + kind_to_string(value.kind());
            }
            double d = value.is_float() ? value.as_float() : static_cast<double>(value.as_integer());
            if (!(d >= static_cast<double>(editor.min) && d <= static_cast<double>(editor.max))) {
                return "value " + to_display_string(value) + " outside [" + std::to_string(editor.min) +
                       ", " + std::to_string(editor.max) + "]";
            }
            return std::nullopt;
        }
        case EditorKind::TEXT:
            if (!value.is_string()) return "expected a string, got " + kind_to_string(value.kind());
            return std::nullopt;
        case EditorKind::CHOICE:
            if (!value.is_string()) return "expected a string, got " + kind_to_string(value.kind());
            if (std::find(editor.options.begin(), editor.options.end(), value.as_string()) == editor.options.end()) {
                return "'" + value.as_string() + "' is not one of the available options";
            }
            return std::nullopt;
    }
    return std::nullopt;
}

Value coerce_edit(const FieldEditor& editor, const Value& value) {
    if (editor.kind == EditorKind::REAL && value.is_integer()) {
        return Value(static_cast<double>(value.as_integer()));
    }
    return value;
}

}
