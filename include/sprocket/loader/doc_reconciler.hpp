#pragma once

#include <string>
#include <vector>

#include "sprocket/loader/doc_block.hpp"
#include "sprocket/types.hpp"

namespace sprocket {
namespace loader {

struct DocReconciliation {
    RoutineDoc doc;
    std::vector<std::string> warnings;  // Advisory only
};

/**
 * @brief Pairs each parameter with its semantic type, descriptor and
 *        documented description, and cross-checks parameter names.
 *
 * One warning for each parameter missing from the doc block and one for
 * each doc block parameter unknown to the catalog.
 *
 * @throws UnsupportedTypeError if a parameter type cannot be mapped.
 */
DocReconciliation reconcile_documentation(const std::vector<CatalogParameter>& parameters,
                                          const DocBlock& doc_block);

} // namespace loader
} // namespace sprocket
