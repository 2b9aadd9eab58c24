#include "sprocket/types.hpp"

#include <fstream>
#include <sstream>
#include <sys/stat.h>

#include "sprocket/error.hpp"

namespace sprocket {

// =============================================================================
// RoutineSource
// =============================================================================

int64_t file_mtime(const std::string& path) {
    struct stat st;
    if (::stat(path.c_str(), &st) != 0) {
        throw IOError("Cannot stat file '" + path + "'");
    }
    return static_cast<int64_t>(st.st_mtime);
}

std::string routine_name_from_path(const std::string& path, const std::string& extension) {
    size_t slash = path.find_last_of("/\\");
    std::string base = (slash == std::string::npos) ? path : path.substr(slash + 1);
    if (!extension.empty() && base.size() > extension.size() &&
        base.compare(base.size() - extension.size(), extension.size(), extension) == 0) {
        base.resize(base.size() - extension.size());
    }
    return base;
}

std::vector<std::string> split_lines(const std::string& text) {
    std::vector<std::string> lines;
    size_t start = 0;
    while (true) {
        size_t nl = text.find('\n', start);
        if (nl == std::string::npos) {
            lines.push_back(text.substr(start));
            break;
        }
        lines.push_back(text.substr(start, nl - start));
        start = nl + 1;
    }
    return lines;
}

RoutineSource RoutineSource::read(const std::string& path, const std::string& extension) {
    std::ifstream file(path, std::ios::binary);
    if (!file) {
        throw IOError("Cannot open source file '" + path + "'");
    }
    std::stringstream buffer;
    buffer << file.rdbuf();

    return from_text(path, extension, buffer.str(), file_mtime(path));
}

RoutineSource RoutineSource::from_text(const std::string& path, const std::string& extension,
                                       const std::string& text, int64_t mtime) {
    RoutineSource source;
    source.path = path;
    source.extension = extension;
    source.routine_name = routine_name_from_path(path, extension);
    source.text = text;
    source.lines = split_lines(text);
    source.mtime = mtime;
    return source;
}

// =============================================================================
// Designation
// =============================================================================

namespace {

template<class... Ts> struct overloaded : Ts... { using Ts::operator()...; };
template<class... Ts> overloaded(Ts...) -> overloaded<Ts...>;

} // namespace

std::string designation_name(const Designation& designation) {
    return std::visit(overloaded{
        [](const PlainDesignation& d) { return d.name; },
        [](const BulkInsert&) { return std::string("bulk_insert"); },
        [](const RowsWithKey&) { return std::string("rows_with_key"); },
        [](const RowsWithIndex&) { return std::string("rows_with_index"); },
    }, designation);
}

std::vector<std::string> designation_columns(const Designation& designation) {
    return std::visit(overloaded{
        [](const PlainDesignation&) { return std::vector<std::string>{}; },
        [](const BulkInsert& d) { return d.columns; },
        [](const RowsWithKey& d) { return d.columns; },
        [](const RowsWithIndex& d) { return d.columns; },
    }, designation);
}

std::string designation_table(const Designation& designation) {
    if (const auto* bulk = std::get_if<BulkInsert>(&designation)) {
        return bulk->table;
    }
    return {};
}

Designation make_designation(const std::string& name, const std::string& table,
                             const std::vector<std::string>& columns) {
    if (name == "bulk_insert") return BulkInsert{table, columns};
    if (name == "rows_with_key") return RowsWithKey{columns};
    if (name == "rows_with_index") return RowsWithIndex{columns};
    return PlainDesignation{name};
}

bool operator==(const PlainDesignation& a, const PlainDesignation& b) {
    return a.name == b.name;
}

bool operator==(const BulkInsert& a, const BulkInsert& b) {
    return a.table == b.table && a.columns == b.columns;
}

bool operator==(const RowsWithKey& a, const RowsWithKey& b) {
    return a.columns == b.columns;
}

bool operator==(const RowsWithIndex& a, const RowsWithIndex& b) {
    return a.columns == b.columns;
}

// =============================================================================
// Equality
// =============================================================================

bool ExtendedParameter::operator==(const ExtendedParameter& other) const {
    return name == other.name && data_type == other.data_type &&
           delimiter == other.delimiter && enclosure == other.enclosure &&
           escape == other.escape;
}

bool CatalogParameter::operator==(const CatalogParameter& other) const {
    return name == other.name && data_type == other.data_type &&
           numeric_precision == other.numeric_precision &&
           numeric_scale == other.numeric_scale &&
           character_set_name == other.character_set_name &&
           collation_name == other.collation_name &&
           dtd_identifier == other.dtd_identifier &&
           data_type_descriptor == other.data_type_descriptor &&
           extended == other.extended;
}

bool ParameterDoc::operator==(const ParameterDoc& other) const {
    return name == other.name && semantic_type == other.semantic_type &&
           data_type_descriptor == other.data_type_descriptor &&
           description == other.description;
}

bool RoutineDoc::operator==(const RoutineDoc& other) const {
    return short_description == other.short_description &&
           long_description == other.long_description &&
           parameters == other.parameters;
}

bool BuildMetadata::operator==(const BuildMetadata& other) const {
    return routine_name == other.routine_name && routine_type == other.routine_type &&
           designation == other.designation && parameters == other.parameters &&
           fields == other.fields && column_types == other.column_types &&
           timestamp == other.timestamp && replace == other.replace &&
           doc == other.doc && extended_parameters == other.extended_parameters;
}

} // namespace sprocket
