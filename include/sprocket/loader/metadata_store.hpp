#pragma once

#include <map>
#include <optional>
#include <string>
#include <vector>

#include "sprocket/types.hpp"

namespace sprocket {
namespace loader {

/**
 * @brief Persists the BuildMetadata of all routines between runs.
 *
 * The records are kept in a YAML document keyed by routine name. This is the
 * input of the wrapper generator.
 */
class MetadataStore {
public:
    explicit MetadataStore(const std::string& path) : path_(path) {}

    /**
     * @brief Reads the document. A missing file gives an empty store.
     * @throws IOError if the file cannot be parsed.
     */
    void load();

    /**
     * @brief Writes the document via a temporary file renamed over the target.
     * @throws IOError if the file cannot be written.
     */
    void save() const;

    std::optional<BuildMetadata> get(const std::string& routine_name) const;
    void put(const BuildMetadata& metadata);
    void erase(const std::string& routine_name);

    std::vector<std::string> routine_names() const;
    size_t size() const { return records_.size(); }
    const std::string& path() const { return path_; }

    // YAML text of the whole store
    std::string dump() const;
    // Replaces the records by those in 'yaml'. Throws IOError.
    void parse(const std::string& yaml);

private:
    std::string path_;
    std::map<std::string, BuildMetadata> records_;
};

} // namespace loader
} // namespace sprocket
