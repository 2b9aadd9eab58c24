#include "sprocket/error.hpp"

#include <sstream>

#include "sprocket/util/strings.hpp"

namespace sprocket {

std::string ResultError::compose(const std::vector<int>& expected, int actual,
                                 const std::string& query) {
    std::string q = util::trim(query);

    std::ostringstream ss;
    ss << "Wrong number of rows selected.\n";
    ss << "Expected number of rows: ";
    for (size_t i = 0; i < expected.size(); ++i) {
        if (i > 0) ss << ", ";
        ss << expected[i];
    }
    ss << ".\n";
    ss << "Actual number of rows: " << actual << ".\n";
    ss << "Query:" << (q.find('\n') != std::string::npos ? "\n" : " ") << q;
    return ss.str();
}

} // namespace sprocket
