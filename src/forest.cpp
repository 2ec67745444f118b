#include "loom/forest.hpp"

#include "loom/log.hpp"

namespace loom
{
forest::forest(node_store store) : store_(std::move(store))
{
}

result<forest> forest::open(const forest_options& options)
{
    result<node_store> store = node_store::open(options);
    if (!store)
        return std::move(store).error();

    return forest(std::move(store).value());
}

result<root_data> forest::create_root(root_config config)
{
    return store_.create_root(std::move(config));
}

result<node_data> forest::create_message_node(const root_id& root, message msg, node_metadata metadata)
{
    return store_.create_node(root, std::move(msg), std::move(metadata));
}

result<node_data> forest::create_message_node(const node_id& parent, message msg, node_metadata metadata)
{
    return store_.create_node(parent, std::move(msg), std::move(metadata));
}

std::optional<node_data> forest::get_node(const node_id& id) const
{
    return store_.get_node(id);
}

std::optional<root_data> forest::get_root(const root_id& id) const
{
    return store_.get_root(id);
}

std::vector<root_data> forest::list_roots() const
{
    return store_.list_roots();
}

std::vector<node_data> forest::get_children(const node_id& id) const
{
    return store_.get_children(id);
}

std::vector<node_data> forest::get_root_nodes(const root_id& id) const
{
    return store_.get_root_nodes(id);
}

result<std::vector<node_data>> forest::get_siblings(const node_id& id) const
{
    const node_data* n = store_.find_node(id);
    if (!n)
        return error::not_found("node " + id.str());

    if (n->parent_id)
        return store_.get_children(*n->parent_id);

    return store_.get_root_nodes(n->root);
}

result<path_result> forest::get_path(const path_query& query) const
{
    const auto lookup = [this](const node_id& id) { return store_.find_node(id); };

    result<std::vector<node_data>> path = resolve_path(query, lookup, store_.node_count());
    if (!path)
    {
        LOOM_LOG_DEBUG("path query to {} failed: {}", query.to.str(), path.error().message());
        return std::move(path).error();
    }

    // The walk starts at query.to, which exists, so its root is the owner of the whole path
    const node_data* to = store_.find_node(query.to);
    std::optional<root_data> root = store_.get_root(to->root);
    if (!root)
        return error::not_found("root " + to->root.str()).with_context("node", query.to.str());

    return path_result{std::move(root.value()), std::move(path).value()};
}

result<size_t> forest::depth(const node_id& id) const
{
    const auto lookup = [this](const node_id& node) { return store_.find_node(node); };
    return node_depth(id, lookup, store_.node_count());
}

result<node_data> forest::update_node_metadata(const node_id& id, node_metadata metadata)
{
    return store_.update_node_metadata(id, std::move(metadata));
}
} // namespace loom
