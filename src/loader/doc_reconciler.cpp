#include "sprocket/loader/doc_reconciler.hpp"

#include <set>

#include "sprocket/loader/type_mapper.hpp"

namespace sprocket {
namespace loader {

DocReconciliation reconcile_documentation(const std::vector<CatalogParameter>& parameters,
                                          const DocBlock& doc_block) {
    DocReconciliation result;
    result.doc.short_description = doc_block.short_description;
    result.doc.long_description = doc_block.long_description;

    std::vector<ParamTag> documented = doc_block.param_tags();

    std::set<std::string> documented_names;
    for (const auto& tag : documented) {
        documented_names.insert(tag.name);
    }

    std::set<std::string> catalog_names;
    for (const auto& param : parameters) {
        catalog_names.insert(param.name);

        ParameterDoc doc;
        doc.name = param.name;
        doc.semantic_type = parameter_semantic_type(param);
        doc.data_type_descriptor = param.data_type_descriptor;
        for (const auto& tag : documented) {
            if (tag.name == param.name) {
                doc.description = tag.description;
                break;
            }
        }
        result.doc.parameters.push_back(std::move(doc));
    }

    for (const auto& param : parameters) {
        if (!documented_names.count(param.name)) {
            result.warnings.push_back("parameter '" + param.name + "' is missing from doc block");
        }
    }

    for (const auto& tag : documented) {
        if (!catalog_names.count(tag.name)) {
            result.warnings.push_back("unknown parameter '" + tag.name + "' found in doc block");
        }
    }

    return result;
}

} // namespace loader
} // namespace sprocket
