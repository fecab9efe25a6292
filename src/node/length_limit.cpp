#include "safepath/length_limit.hpp"

#include "safepath/char_filter.hpp"

namespace safepath {

Result<std::string> enforce_length(const std::string& node,
                                   const std::string& source,
                                   bool trim_to_limit) {
    if (code_point_length(node) <= kMaxNodeLength) {
        return Result<std::string>::ok(node);
    }
    if (trim_to_limit) {
        return Result<std::string>::ok(truncate_code_points(node, kMaxNodeLength));
    }
    return Result<std::string>::err(Error(
        ErrorCode::LENGTH_EXCEEDED,
        "Node '" + source + "' has more than " + std::to_string(kMaxNodeLength) +
            " characters"));
}

} // namespace safepath
