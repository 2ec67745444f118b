#pragma once

#include <algorithm>
#include <optional>
#include <vector>

#include "loom/error.hpp"
#include "loom/types.hpp"

namespace loom
{
struct path_query
{
    // Exclusive lower end of the path, the walk stops at the root-level node when absent
    std::optional<node_id> from;
    node_id to;
};

// Collects the nodes between query.from and query.to in root-to-leaf order
//
// Lookup must have the signature: const node_data* lookup(const node_id&);
// The walk starts at query.to and follows parent links. It stops before the node equal to
// query.from, which is excluded, or after the root-level node when query.from is absent.
// max_steps bounds the walk so that damaged links can't make it loop forever.
template <typename Lookup>
[[nodiscard]] result<std::vector<node_data>> resolve_path(const path_query& query, Lookup lookup, size_t max_steps)
{
    const node_data* current = lookup(query.to);
    if (!current)
        return error::not_found("node " + query.to.str());

    std::vector<node_data> path;

    for (size_t steps = 0; current; ++steps)
    {
        if (steps > max_steps)
            return error::invalid_range("parent chain of " + query.to.str() + " does not terminate");

        if (query.from && current->id == *query.from)
            break;

        path.push_back(*current);

        if (!current->parent_id)
        {
            // Left the tree without meeting the lower end
            if (query.from)
                return error::invalid_range(query.from->str() + " is not an ancestor of " + query.to.str());
            break;
        }

        const node_id parent = *current->parent_id;
        current = lookup(parent);

        // A dangling parent link means the lower end can't be reached either
        if (!current)
            return error::invalid_range("parent " + parent.str() + " of " + path.back().id.str() + " is missing");
    }

    std::reverse(path.begin(), path.end());
    return std::move(path);
}

// Number of nodes from the root-level ancestor down to the node, root-level nodes have depth 1
template <typename Lookup>
[[nodiscard]] result<size_t> node_depth(const node_id& id, Lookup lookup, size_t max_steps)
{
    const node_data* current = lookup(id);
    if (!current)
        return error::not_found("node " + id.str());

    size_t depth = 1;
    while (current->parent_id)
    {
        if (depth > max_steps)
            return error::invalid_range("parent chain of " + id.str() + " does not terminate");

        const node_id parent = *current->parent_id;
        current = lookup(parent);
        if (!current)
            return error::invalid_range("parent " + parent.str() + " is missing");

        ++depth;
    }

    return depth;
}
} // namespace loom
