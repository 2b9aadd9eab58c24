// =============================================================================
// types.hpp - Data model of the routine loader
// =============================================================================
// A routine source file is compiled into a BuildMetadata record. The record of
// the previous run drives the staleness decision of the next one.
// =============================================================================

#pragma once

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace sprocket {

// =============================================================================
// RoutineSource - immutable view of one source file
// =============================================================================

struct RoutineSource {
    std::string path;               // Path as given by the caller
    std::string extension;          // e.g. ".psql"
    std::string routine_name;       // File name minus extension
    std::string text;               // Raw source
    std::vector<std::string> lines; // text split on '\n'
    int64_t mtime = 0;              // Seconds since the epoch

    // Reads the file and its modification time. Throws IOError.
    static RoutineSource read(const std::string& path, const std::string& extension);

    // Builds a source from memory (the file need not exist).
    static RoutineSource from_text(const std::string& path, const std::string& extension,
                                   const std::string& text, int64_t mtime);
};

// Modification time of a file in seconds since the epoch. Throws IOError.
int64_t file_mtime(const std::string& path);

// Routine name for a source path: basename minus the extension.
std::string routine_name_from_path(const std::string& path, const std::string& extension);

std::vector<std::string> split_lines(const std::string& text);

// =============================================================================
// Placeholders
// =============================================================================

// Caller supplied substitution table keyed by the uppercased token, e.g.
// "@MAX_LENGTH@" or "@USR.USR_NAME%TYPE@".
using ReplacePairs = std::map<std::string, std::string>;

// Tokens found in one source (as written) -> resolved value.
using PlaceholderSet = std::map<std::string, std::string>;

// =============================================================================
// Designation - calling convention of a routine
// =============================================================================

struct PlainDesignation {
    std::string name;   // none, row0, row1, rows, singleton0, function, log, ...
};

struct BulkInsert {
    std::string table;
    std::vector<std::string> columns;
};

struct RowsWithKey {
    std::vector<std::string> columns;
};

struct RowsWithIndex {
    std::vector<std::string> columns;
};

using Designation = std::variant<PlainDesignation, BulkInsert, RowsWithKey, RowsWithIndex>;

std::string designation_name(const Designation& designation);
std::vector<std::string> designation_columns(const Designation& designation);
std::string designation_table(const Designation& designation);

// Rebuilds a designation from its persisted name, table and columns.
Designation make_designation(const std::string& name, const std::string& table,
                             const std::vector<std::string>& columns);

bool operator==(const PlainDesignation& a, const PlainDesignation& b);
bool operator==(const BulkInsert& a, const BulkInsert& b);
bool operator==(const RowsWithKey& a, const RowsWithKey& b);
bool operator==(const RowsWithIndex& a, const RowsWithIndex& b);

// =============================================================================
// Parameters
// =============================================================================

// A parameter whose value is a list encoded in a single string.
struct ExtendedParameter {
    std::string name;
    std::string data_type;      // e.g. "list_of_int"
    char delimiter = ',';
    char enclosure = '"';
    char escape = '\\';

    bool operator==(const ExtendedParameter& other) const;
};

using ExtendedParameters = std::map<std::string, ExtendedParameter>;

struct CatalogParameter {
    std::string name;
    std::string data_type;                      // Base type from the catalog, e.g. "varchar"
    std::optional<std::string> numeric_precision;
    std::optional<std::string> numeric_scale;
    std::optional<std::string> character_set_name;
    std::optional<std::string> collation_name;
    std::string dtd_identifier;                 // e.g. "varchar(20)"
    std::string data_type_descriptor;           // dtd + character set + collation
    std::optional<ExtendedParameter> extended;  // Merged -- param: declaration

    // Type used for the semantic type: the list type of an extended
    // parameter, otherwise the catalog type.
    const std::string& effective_type() const {
        return extended ? extended->data_type : data_type;
    }

    bool operator==(const CatalogParameter& other) const;
};

// =============================================================================
// Catalog and session state
// =============================================================================

// Row of information_schema.ROUTINES for an existing routine.
struct RoutineCatalogEntry {
    std::string routine_type;           // "procedure" or "function"
    std::string sql_mode;
    std::string character_set_client;
    std::string collation_connection;
};

struct SessionSettings {
    std::string sql_mode;
    std::string character_set;
    std::string collation;
};

// =============================================================================
// Documentation
// =============================================================================

struct ParameterDoc {
    std::string name;
    std::string semantic_type;          // "int", "float", "string", "string|int[]"
    std::string data_type_descriptor;
    std::optional<std::string> description;

    bool operator==(const ParameterDoc& other) const;
};

struct RoutineDoc {
    std::string short_description;
    std::string long_description;
    std::vector<ParameterDoc> parameters;

    bool operator==(const RoutineDoc& other) const;
};

// =============================================================================
// BuildMetadata - persisted per routine between runs
// =============================================================================

struct BuildMetadata {
    std::string routine_name;
    std::string routine_type;
    Designation designation = PlainDesignation{"none"};
    std::vector<CatalogParameter> parameters;
    std::vector<std::string> fields;        // Bulk insert: table column names
    std::vector<std::string> column_types;  // Bulk insert: table column base types
    int64_t timestamp = 0;                  // Source mtime
    PlaceholderSet replace;
    RoutineDoc doc;
    ExtendedParameters extended_parameters;

    bool operator==(const BuildMetadata& other) const;
    bool operator!=(const BuildMetadata& other) const { return !(*this == other); }
};

} // namespace sprocket
