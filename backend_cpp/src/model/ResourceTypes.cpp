#include "model/ResourceTypes.hpp"
#include <algorithm>
#include <cctype>

namespace terrascope {

std::string sanitize_identifier(const std::string& name) {
    std::string out;
    out.reserve(name.size());
    for (unsigned char c : name) {
        out += std::isalnum(c) ? static_cast<char>(std::tolower(c)) : '_';
    }
    return out;
}

std::string safe_resource_name(const std::string& name) {
    std::string out = name;
    std::replace(out.begin(), out.end(), '-', '_');
    std::replace(out.begin(), out.end(), ' ', '_');
    std::transform(out.begin(), out.end(), out.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return out;
}

std::vector<std::string> missing_required_fields(const ResourceTemplate& tmpl, const ValueMap& config) {
    std::vector<std::string> missing;
    for (const auto& field : tmpl.required_fields) {
        const Value* v = config.find(field);
        if (!v || (v->is_string() && v->as_string().empty())) {
            missing.push_back(field);
        }
    }
    return missing;
}

}
