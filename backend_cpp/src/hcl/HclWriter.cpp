#include "hcl/HclWriter.hpp"
#include <algorithm>
#include <fstream>
#include <sstream>
#include <spdlog/spdlog.h>
#include <spdlog/fmt/fmt.h>

namespace terrascope {

namespace fs = std::filesystem;

namespace {

const char* const kReferencePrefixes[] = {"var.", "local.", "module.", "data."};

std::string spaces(int indent) {
    return std::string(static_cast<size_t>(std::max(indent, 0)), ' ');
}

}

HclWriter::HclWriter(const std::string& output_dir) : output_dir_(output_dir) {
    std::error_code ec;
    fs::create_directories(output_dir_, ec);
    if (ec) {
        spdlog::error("❌ Cannot create output directory {}: {}", output_dir_.string(), ec.message());
    }
}

// --- VALUE FORMATTING ---

bool HclWriter::is_reference(const std::string& s) {
    for (const char* prefix : kReferencePrefixes) {
        if (s.rfind(prefix, 0) == 0) return true;
    }
    return false;
}

std::string HclWriter::quote(const std::string& s) {
    std::string out;
    out.reserve(s.size() + 2);
    out += '"';
    for (char c : s) {
        switch (c) {
            case '"': out += "\\\""; break;
            case '\\': out += "\\\\"; break;
            case '\n': out += "\\n"; break;
            case '\r': out += "\\r"; break;
            case '\t': out += "\\t"; break;
            default: out += c;
        }
    }
    out += '"';
    return out;
}

std::string HclWriter::format_float(double d) {
    std::string text = fmt::format("{}", d);
    // Keep the literal recognisably fractional: 2 -> 2.0
    if (text.find_first_of(".eEn") == std::string::npos) text += ".0";
    return text;
}

bool HclWriter::is_block_list(const Value::List& items) {
    return !items.empty() &&
           std::all_of(items.begin(), items.end(), [](const Value& v) { return v.is_map(); });
}

std::string HclWriter::format_inline(const Value& value) {
    switch (value.kind()) {
        case Value::Kind::STRING: {
            const auto& s = value.as_string();
            return is_reference(s) ? s : quote(s);
        }
        case Value::Kind::BOOLEAN:
            return value.as_bool() ? "true" : "false";
        case Value::Kind::INTEGER:
            return std::to_string(value.as_integer());
        case Value::Kind::FLOAT:
            return format_float(value.as_float());
        case Value::Kind::LIST: {
            std::string out = "[";
            const auto& items = value.as_list();
            for (size_t i = 0; i < items.size(); ++i) {
                if (i) out += ", ";
                out += format_inline(items[i]);
            }
            return out + "]";
        }
        case Value::Kind::MAP: {
            // Only reachable for a list that mixes maps with scalars.
            const auto& map = value.as_map();
            if (map.empty()) return "{}";
            std::string out = "{ ";
            bool first = true;
            for (const auto& [key, child] : map) {
                if (!first) out += ", ";
                out += key + " = " + format_inline(child);
                first = false;
            }
            return out + " }";
        }
    }
    return "";
}

std::string HclWriter::format_block(const std::string& key, const ValueMap& body, int indent) {
    std::string result = spaces(indent) + key + " {\n";
    for (const auto& [nested_key, nested_value] : body) {
        result += format_attribute(nested_key, nested_value, indent + 2);
    }
    result += spaces(indent) + "}\n";
    return result;
}

std::string HclWriter::format_attribute(const std::string& key, const Value& value, int indent) {
    if (value.is_map()) {
        return format_block(key, value.as_map(), indent);
    }

    if (value.is_list()) {
        const auto& items = value.as_list();
        if (items.empty()) return spaces(indent) + key + " = []\n";

        // Repeated nested blocks: one `key { ... }` per element
        if (is_block_list(items)) {
            std::string result;
            for (const auto& item : items) result += format_block(key, item.as_map(), indent);
            return result;
        }
    }

    return spaces(indent) + key + " = " + format_inline(value) + "\n";
}

// --- BLOCKS ---

std::string HclWriter::create_terraform_block(const std::optional<BackendConfig>& backend) {
    std::string block = "terraform {\n";
    block += "  required_version = " + quote(kRequiredVersion) + "\n";

    if (backend && !backend->backend_type.empty() && !backend->settings.empty()) {
        block += "  backend " + quote(backend->backend_type) + " {\n";
        for (const auto& [key, value] : backend->settings) {
            block += format_attribute(key, value, 4);
        }
        block += "  }\n";
    }

    block += "}\n";
    return block;
}

std::string HclWriter::create_provider_block(const ProviderConfig& provider) {
    std::string block = "provider " + quote(provider.provider_name) + " {\n";
    for (const auto& [key, value] : provider.settings) {
        block += format_attribute(key, value, 2);
    }
    block += "}\n";
    return block;
}

std::string HclWriter::create_resource_block(const ResourceConfig& resource) {
    std::string block = "resource " + quote(resource.resource_type) + " " +
                        quote(safe_resource_name(resource.resource_name)) + " {\n";
    for (const auto& [key, value] : resource.config) {
        block += format_attribute(key, value, 2);
    }
    block += "}\n";
    return block;
}

std::string HclWriter::render(const std::vector<ResourceConfig>& resources,
                              const ProviderList& providers,
                              const std::optional<BackendConfig>& backend) {
    std::vector<std::string> blocks;
    if (backend) blocks.push_back(create_terraform_block(backend));
    for (const auto& p : providers) blocks.push_back(create_provider_block(p));
    for (const auto& r : resources) blocks.push_back(create_resource_block(r));

    std::stringstream ss;
    for (size_t i = 0; i < blocks.size(); ++i) {
        if (i) ss << "\n";
        ss << blocks[i];
    }
    return ss.str();
}

// --- OUTPUT ---

OpResult HclWriter::write_terraform_file(const std::string& filename, const std::string& content) const {
    fs::path file_path = output_dir_ / filename;
    try {
        std::error_code ec;
        fs::create_directories(output_dir_, ec);

        std::ofstream out(file_path, std::ios::trunc);
        if (!out.is_open()) {
            spdlog::error("❌ Error writing file {}: cannot open for writing", file_path.string());
            return OpResult::fail(ErrorKind::WRITE, "Cannot open " + file_path.string() + " for writing");
        }
        out << content;
        out.close();
        if (out.fail()) {
            spdlog::error("❌ Error writing file {}: write failed", file_path.string());
            return OpResult::fail(ErrorKind::WRITE, "Write failed for " + file_path.string());
        }
    } catch (const std::exception& e) {
        spdlog::error("❌ Error writing file {}: {}", file_path.string(), e.what());
        return OpResult::fail(ErrorKind::WRITE, e.what());
    }

    spdlog::info("💾 Wrote {} ({} bytes)", file_path.string(), content.size());
    return OpResult::ok(file_path.string());
}

OpResult HclWriter::generate_main_tf(const std::vector<ResourceConfig>& resources,
                                     const ProviderList& providers,
                                     const std::optional<BackendConfig>& backend,
                                     const std::string& filename) const {
    return write_terraform_file(filename, render(resources, providers, backend));
}

}
