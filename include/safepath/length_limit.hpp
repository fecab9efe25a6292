#pragma once

#include "safepath/result.hpp"
#include "safepath/types.hpp"

#include <string>

namespace safepath {

/**
 * @brief Cap a node at kMaxNodeLength code points
 * @param node Node after filtering and trimming
 * @param source Node as the caller supplied it, quoted in the error
 * @param trim_to_limit Truncate instead of failing
 * @return The node, possibly truncated, or LENGTH_EXCEEDED
 */
Result<std::string> enforce_length(const std::string& node,
                                   const std::string& source,
                                   bool trim_to_limit);

} // namespace safepath
