#include "loom/tag_partitioner.hpp"

#include <iterator>

namespace loom
{
std::vector<node_data> partition_by_tag(std::vector<node_data> children, std::string_view tag)
{
    std::vector<node_data> partitioned;
    partitioned.reserve(children.size());

    std::vector<node_data> untagged;

    for (node_data& child : children)
    {
        if (child.metadata.has_tag(tag))
            partitioned.push_back(std::move(child));
        else
            untagged.push_back(std::move(child));
    }

    partitioned.insert(partitioned.end(), std::make_move_iterator(untagged.begin()),
                       std::make_move_iterator(untagged.end()));

    return partitioned;
}
} // namespace loom
