#include <catch2/catch_test_macros.hpp>

#include "loom/tag_partitioner.hpp"
#include "test_support.hpp"

using namespace loom;
using namespace test_support;

namespace
{
node_data child(uint64_t seq, bool unread)
{
    node_data n;
    n.id = node_id(seq);
    n.root = root_id(1);
    n.parent_id = node_id(1000);
    n.message = assistant("reply " + std::to_string(seq));
    if (unread)
        n.metadata = tagged({tags::unread, "starred"});
    return n;
}

std::vector<node_id> ids_of(const std::vector<node_data>& nodes)
{
    std::vector<node_id> ids;
    for (const node_data& n : nodes)
        ids.push_back(n.id);
    return ids;
}
} // namespace

TEST_CASE("Tagged nodes move to the front in stable order", "[tag_partitioner]")
{
    const std::vector<node_data> children{child(1, false), child(2, true), child(3, false), child(4, true)};

    const std::vector<node_data> partitioned = partition_by_tag(children, tags::unread);
    CHECK(ids_of(partitioned) == std::vector<node_id>{node_id(2), node_id(4), node_id(1), node_id(3)});

    // Nodes are moved as a whole, nothing else changes
    CHECK(partitioned[0] == children[1]);
    CHECK(partitioned[3] == children[2]);
}

TEST_CASE("Partitioning keeps the order when nothing or everything is tagged", "[tag_partitioner]")
{
    SECTION("No tagged nodes")
    {
        const std::vector<node_data> children{child(1, false), child(2, false), child(3, false)};
        CHECK(ids_of(partition_by_tag(children, tags::unread)) == ids_of(children));
    }

    SECTION("Only tagged nodes")
    {
        const std::vector<node_data> children{child(1, true), child(2, true)};
        CHECK(ids_of(partition_by_tag(children, tags::unread)) == ids_of(children));
    }

    SECTION("No nodes")
    {
        CHECK(partition_by_tag({}, tags::unread).empty());
    }
}

TEST_CASE("Any tag can drive the partition", "[tag_partitioner]")
{
    std::vector<node_data> children{child(1, false), child(2, false), child(3, false)};
    children[2].metadata = tagged({"starred"});

    CHECK(ids_of(partition_by_tag(children, "starred")) == std::vector<node_id>{node_id(3), node_id(1), node_id(2)});
    CHECK(ids_of(partition_by_tag(children, "missing")) == ids_of(children));
}
