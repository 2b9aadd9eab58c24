#include "sprocket/loader/metadata_store.hpp"

#include <filesystem>
#include <fstream>
#include <sstream>

#include <yaml-cpp/yaml.h>

#include "sprocket/error.hpp"
#include "sprocket/logging.hpp"

namespace fs = std::filesystem;

namespace sprocket {
namespace loader {

namespace {

// =============================================================================
// Encoding
// =============================================================================

YAML::Node optional_node(const std::optional<std::string>& value) {
    return value ? YAML::Node(*value) : YAML::Node(YAML::NodeType::Null);
}

YAML::Node list_node(const std::vector<std::string>& values) {
    YAML::Node node(YAML::NodeType::Sequence);
    for (const auto& v : values) node.push_back(v);
    return node;
}

YAML::Node extended_node(const ExtendedParameter& p) {
    YAML::Node node;
    node["name"] = p.name;
    node["data_type"] = p.data_type;
    node["delimiter"] = std::string(1, p.delimiter);
    node["enclosure"] = std::string(1, p.enclosure);
    node["escape"] = std::string(1, p.escape);
    return node;
}

YAML::Node metadata_node(const BuildMetadata& m) {
    YAML::Node node;
    node["routine_name"] = m.routine_name;
    node["routine_type"] = m.routine_type;
    node["designation"] = designation_name(m.designation);
    node["table_name"] = designation_table(m.designation);
    node["columns"] = list_node(designation_columns(m.designation));
    node["fields"] = list_node(m.fields);
    node["column_types"] = list_node(m.column_types);
    node["timestamp"] = m.timestamp;

    YAML::Node replace(YAML::NodeType::Map);
    for (const auto& [token, value] : m.replace) replace[token] = value;
    node["replace"] = replace;

    YAML::Node parameters(YAML::NodeType::Sequence);
    for (const auto& p : m.parameters) {
        YAML::Node param;
        param["name"] = p.name;
        param["data_type"] = p.data_type;
        param["numeric_precision"] = optional_node(p.numeric_precision);
        param["numeric_scale"] = optional_node(p.numeric_scale);
        param["character_set_name"] = optional_node(p.character_set_name);
        param["collation_name"] = optional_node(p.collation_name);
        param["dtd_identifier"] = p.dtd_identifier;
        param["data_type_descriptor"] = p.data_type_descriptor;
        if (p.extended) param["extended"] = extended_node(*p.extended);
        parameters.push_back(param);
    }
    node["parameters"] = parameters;

    YAML::Node doc;
    doc["short_description"] = m.doc.short_description;
    doc["long_description"] = m.doc.long_description;
    YAML::Node doc_params(YAML::NodeType::Sequence);
    for (const auto& p : m.doc.parameters) {
        YAML::Node param;
        param["name"] = p.name;
        param["semantic_type"] = p.semantic_type;
        param["data_type_descriptor"] = p.data_type_descriptor;
        param["description"] = optional_node(p.description);
        doc_params.push_back(param);
    }
    doc["parameters"] = doc_params;
    node["doc"] = doc;

    YAML::Node extended(YAML::NodeType::Map);
    for (const auto& [name, p] : m.extended_parameters) extended[name] = extended_node(p);
    node["extended_parameters"] = extended;

    return node;
}

// =============================================================================
// Decoding
// =============================================================================

std::string get_string(const YAML::Node& node, const char* key) {
    const YAML::Node value = node[key];
    if (!value || value.IsNull()) return "";
    return value.as<std::string>();
}

std::optional<std::string> get_optional(const YAML::Node& node, const char* key) {
    const YAML::Node value = node[key];
    if (!value || value.IsNull()) return std::nullopt;
    return value.as<std::string>();
}

std::vector<std::string> get_list(const YAML::Node& node, const char* key) {
    std::vector<std::string> values;
    const YAML::Node list = node[key];
    if (!list) return values;
    for (const auto& item : list) values.push_back(item.as<std::string>());
    return values;
}

char get_char(const YAML::Node& node, const char* key, char def) {
    std::string value = get_string(node, key);
    return value.empty() ? def : value[0];
}

ExtendedParameter extended_from_node(const YAML::Node& node) {
    ExtendedParameter p;
    p.name = get_string(node, "name");
    p.data_type = get_string(node, "data_type");
    p.delimiter = get_char(node, "delimiter", ',');
    p.enclosure = get_char(node, "enclosure", '"');
    p.escape = get_char(node, "escape", '\\');
    return p;
}

BuildMetadata metadata_from_node(const YAML::Node& node) {
    BuildMetadata m;
    m.routine_name = get_string(node, "routine_name");
    m.routine_type = get_string(node, "routine_type");
    m.designation = make_designation(get_string(node, "designation"),
                                     get_string(node, "table_name"),
                                     get_list(node, "columns"));
    m.fields = get_list(node, "fields");
    m.column_types = get_list(node, "column_types");
    m.timestamp = node["timestamp"] ? node["timestamp"].as<int64_t>() : 0;

    if (const YAML::Node replace = node["replace"]) {
        for (const auto& item : replace) {
            m.replace[item.first.as<std::string>()] = item.second.as<std::string>();
        }
    }

    if (const YAML::Node parameters = node["parameters"]) {
        for (const auto& item : parameters) {
            CatalogParameter p;
            p.name = get_string(item, "name");
            p.data_type = get_string(item, "data_type");
            p.numeric_precision = get_optional(item, "numeric_precision");
            p.numeric_scale = get_optional(item, "numeric_scale");
            p.character_set_name = get_optional(item, "character_set_name");
            p.collation_name = get_optional(item, "collation_name");
            p.dtd_identifier = get_string(item, "dtd_identifier");
            p.data_type_descriptor = get_string(item, "data_type_descriptor");
            if (item["extended"]) p.extended = extended_from_node(item["extended"]);
            m.parameters.push_back(std::move(p));
        }
    }

    if (const YAML::Node doc = node["doc"]) {
        m.doc.short_description = get_string(doc, "short_description");
        m.doc.long_description = get_string(doc, "long_description");
        if (const YAML::Node params = doc["parameters"]) {
            for (const auto& item : params) {
                ParameterDoc p;
                p.name = get_string(item, "name");
                p.semantic_type = get_string(item, "semantic_type");
                p.data_type_descriptor = get_string(item, "data_type_descriptor");
                p.description = get_optional(item, "description");
                m.doc.parameters.push_back(std::move(p));
            }
        }
    }

    if (const YAML::Node extended = node["extended_parameters"]) {
        for (const auto& item : extended) {
            m.extended_parameters[item.first.as<std::string>()] = extended_from_node(item.second);
        }
    }

    return m;
}

} // namespace

// =============================================================================
// MetadataStore
// =============================================================================

std::string MetadataStore::dump() const {
    YAML::Node routines(YAML::NodeType::Map);
    for (const auto& [name, metadata] : records_) {
        routines[name] = metadata_node(metadata);
    }
    YAML::Node root;
    root["routines"] = routines;

    YAML::Emitter out;
    out << root;
    return std::string(out.c_str()) + "\n";
}

void MetadataStore::parse(const std::string& yaml) {
    std::map<std::string, BuildMetadata> records;
    try {
        YAML::Node root = YAML::Load(yaml);
        if (const YAML::Node routines = root["routines"]) {
            for (const auto& item : routines) {
                records[item.first.as<std::string>()] = metadata_from_node(item.second);
            }
        }
    } catch (const YAML::Exception& e) {
        throw IOError("Malformed metadata file '" + path_ + "'", e.what(),
                      "Remove the file to force a full reload");
    }
    records_ = std::move(records);
}

void MetadataStore::load() {
    if (!fs::exists(path_)) {
        LOG_DEBUG("No metadata file '", path_, "', starting empty");
        records_.clear();
        return;
    }

    std::ifstream file(path_);
    if (!file) {
        throw IOError("Cannot open metadata file '" + path_ + "'");
    }
    std::stringstream buffer;
    buffer << file.rdbuf();
    parse(buffer.str());
}

void MetadataStore::save() const {
    fs::path target(path_);
    if (target.has_parent_path()) {
        std::error_code ec;
        fs::create_directories(target.parent_path(), ec);
    }

    std::string tmp = path_ + ".tmp";
    {
        std::ofstream file(tmp, std::ios::trunc);
        if (!file) {
            throw IOError("Cannot write metadata file '" + tmp + "'");
        }
        file << dump();
        if (!file) {
            throw IOError("Failed writing metadata file '" + tmp + "'");
        }
    }

    std::error_code ec;
    fs::rename(tmp, target, ec);
    if (ec) {
        throw IOError("Cannot rename '" + tmp + "' to '" + path_ + "'", ec.message());
    }
}

std::optional<BuildMetadata> MetadataStore::get(const std::string& routine_name) const {
    auto it = records_.find(routine_name);
    if (it == records_.end()) return std::nullopt;
    return it->second;
}

void MetadataStore::put(const BuildMetadata& metadata) {
    records_[metadata.routine_name] = metadata;
}

void MetadataStore::erase(const std::string& routine_name) {
    records_.erase(routine_name);
}

std::vector<std::string> MetadataStore::routine_names() const {
    std::vector<std::string> names;
    for (const auto& entry : records_) names.push_back(entry.first);
    return names;
}

} // namespace loader
} // namespace sprocket
