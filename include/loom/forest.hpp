#pragma once

#include <optional>
#include <vector>

#include "loom/error.hpp"
#include "loom/node_store.hpp"
#include "loom/options.hpp"
#include "loom/path_resolver.hpp"
#include "loom/types.hpp"

namespace loom
{
struct path_result
{
    root_data root;
    std::vector<node_data> path; // Root-to-leaf order
};

// Branching conversation store
//
// Tree-aware facade over node_store, the entry point for front ends.
// The forest holds no notion of a current node, callers pass positions in explicitly.
class forest final
{
  public:
    [[nodiscard]] static result<forest> open(const forest_options& options);

    explicit forest(node_store store);

    forest(const forest& other) = delete;
    forest(forest&& other) = default;

    forest& operator=(const forest& rhs) = delete;
    forest& operator=(forest&& rhs) = default;

    [[nodiscard]] result<root_data> create_root(root_config config);

    // Starts a new branch directly under the root
    [[nodiscard]] result<node_data> create_message_node(const root_id& root, message msg,
                                                        node_metadata metadata = {});

    // Appends a reply under the parent
    [[nodiscard]] result<node_data> create_message_node(const node_id& parent, message msg,
                                                        node_metadata metadata = {});

    [[nodiscard]] std::optional<node_data> get_node(const node_id& id) const;

    [[nodiscard]] std::optional<root_data> get_root(const root_id& id) const;

    [[nodiscard]] std::vector<root_data> list_roots() const;

    // Creation order, empty if the node is unknown or a leaf
    [[nodiscard]] std::vector<node_data> get_children(const node_id& id) const;

    [[nodiscard]] std::vector<node_data> get_root_nodes(const root_id& id) const;

    // The node itself together with its alternatives, in creation order
    [[nodiscard]] result<std::vector<node_data>> get_siblings(const node_id& id) const;

    // Fails with invalid_range if query.from is not an ancestor of query.to
    [[nodiscard]] result<path_result> get_path(const path_query& query) const;

    [[nodiscard]] result<size_t> depth(const node_id& id) const;

    [[nodiscard]] result<node_data> update_node_metadata(const node_id& id, node_metadata metadata);

    [[nodiscard]] const node_store& store() const noexcept
    {
        return store_;
    }

  private:
    node_store store_;
};
} // namespace loom
