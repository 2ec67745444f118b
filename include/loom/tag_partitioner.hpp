#pragma once

#include <string_view>
#include <vector>

#include "loom/types.hpp"

namespace loom
{
// Moves every node tagged with the tag in front of the untagged ones,
// keeping the relative order within both groups
[[nodiscard]] std::vector<node_data> partition_by_tag(std::vector<node_data> children, std::string_view tag);
} // namespace loom
