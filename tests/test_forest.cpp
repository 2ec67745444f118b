#include <catch2/catch_test_macros.hpp>

#include <algorithm>

#include "loom/forest.hpp"
#include "loom/tag_partitioner.hpp"
#include "test_support.hpp"

using namespace loom;
using namespace test_support;

namespace
{
std::vector<node_id> ids_of(const std::vector<node_data>& nodes)
{
    std::vector<node_id> ids;
    for (const node_data& n : nodes)
        ids.push_back(n.id);
    return ids;
}
} // namespace

TEST_CASE("A conversation can be continued and read back", "[forest]")
{
    temp_dir dir;
    result<forest> f = forest::open(options_for(dir.path()));
    REQUIRE(f);

    const root_data root = f->create_root(config_for("gpt-4")).value();
    const node_data n1 = f->create_message_node(root.id, user("hi")).value();
    const node_data n2 = f->create_message_node(n1.id, assistant("hello")).value();

    result<path_result> path = f->get_path({std::nullopt, n2.id});
    REQUIRE(path);
    CHECK(path->root.id == root.id);
    CHECK(path->root.config.model == "gpt-4");
    REQUIRE(path->path.size() == 2);
    CHECK(path->path[0].message.content == "hi");
    CHECK(path->path[0].message.role == role::user);
    CHECK(path->path[1].message.content == "hello");
    CHECK(path->path[1].message.role == role::assistant);

    CHECK(ids_of(f->get_children(n1.id)) == std::vector<node_id>{n2.id});
    CHECK(f->get_children(n2.id).empty());
}

TEST_CASE("Parent and child links agree", "[forest]")
{
    temp_dir dir;
    result<forest> f = forest::open(options_for(dir.path()));
    REQUIRE(f);

    const root_id root = f->create_root(config_for("gpt-4"))->id;
    const node_id first = f->create_message_node(root, user("q"))->id;
    const node_id a1 = f->create_message_node(first, assistant("a1"))->id;
    const node_id a2 = f->create_message_node(first, assistant("a2"))->id;
    const node_id follow_up = f->create_message_node(a2, user("why?"))->id;

    for (const node_id& id : {first, a1, a2, follow_up})
    {
        const node_data n = f->get_node(id).value();
        CHECK(n.root == root);
        for (const node_data& child : f->get_children(id))
            CHECK(child.parent_id == id);
        if (n.parent_id)
        {
            const std::vector<node_id> siblings = ids_of(f->get_children(*n.parent_id));
            CHECK(std::count(siblings.begin(), siblings.end(), id) == 1);
        }
    }
}

TEST_CASE("Siblings are the alternatives at the same position", "[forest]")
{
    temp_dir dir;
    result<forest> f = forest::open(options_for(dir.path()));
    REQUIRE(f);

    const root_id root = f->create_root(config_for("gpt-4"))->id;
    const node_id q1 = f->create_message_node(root, user("q1"))->id;
    const node_id q2 = f->create_message_node(root, user("q2"))->id;
    const node_id a1 = f->create_message_node(q1, assistant("a1"))->id;
    const node_id a2 = f->create_message_node(q1, assistant("a2"))->id;

    SECTION("Under a parent")
    {
        result<std::vector<node_data>> siblings = f->get_siblings(a2);
        REQUIRE(siblings);
        CHECK(ids_of(siblings.value()) == std::vector<node_id>{a1, a2});
    }

    SECTION("At the top of a root")
    {
        result<std::vector<node_data>> siblings = f->get_siblings(q1);
        REQUIRE(siblings);
        CHECK(ids_of(siblings.value()) == std::vector<node_id>{q1, q2});
        CHECK(ids_of(f->get_root_nodes(root)) == std::vector<node_id>{q1, q2});
    }

    SECTION("Of an unknown node")
    {
        CHECK(f->get_siblings(node_id(77)).code() == error_code::not_found);
    }
}

TEST_CASE("Paths can start below the root-level node", "[forest]")
{
    temp_dir dir;
    result<forest> f = forest::open(options_for(dir.path()));
    REQUIRE(f);

    const root_id root = f->create_root(config_for("gpt-4"))->id;
    std::vector<node_id> chain{f->create_message_node(root, user("0"))->id};
    for (int i = 1; i < 5; i++)
        chain.push_back(f->create_message_node(chain.back(), i % 2 ? assistant(std::to_string(i)) : user(std::to_string(i)))->id);

    result<path_result> tail = f->get_path({chain[1], chain[4]});
    REQUIRE(tail);
    CHECK(ids_of(tail->path) == std::vector<node_id>{chain[2], chain[3], chain[4]});

    result<path_result> empty = f->get_path({chain[3], chain[3]});
    REQUIRE(empty);
    CHECK(empty->path.empty());

    const node_id branch = f->create_message_node(chain[1], user("other"))->id;
    CHECK(f->get_path({chain[3], branch}).code() == error_code::invalid_range);
    CHECK(f->get_path({std::nullopt, node_id(1234)}).code() == error_code::not_found);
}

TEST_CASE("Depth counts the nodes down from the root-level node", "[forest]")
{
    temp_dir dir;
    result<forest> f = forest::open(options_for(dir.path()));
    REQUIRE(f);

    const root_id root = f->create_root(config_for("gpt-4"))->id;
    const node_id top = f->create_message_node(root, user("a"))->id;
    const node_id mid = f->create_message_node(top, assistant("b"))->id;
    const node_id leaf = f->create_message_node(mid, user("c"))->id;

    CHECK(f->depth(top).value() == 1);
    CHECK(f->depth(leaf).value() == 3);
    CHECK(f->depth(leaf).value() == f->get_path({std::nullopt, leaf})->path.size());
    CHECK(f->depth(node_id(99)).code() == error_code::not_found);
}

TEST_CASE("Unread replies are listed first until they are read", "[forest]")
{
    temp_dir dir;
    result<forest> f = forest::open(options_for(dir.path()));
    REQUIRE(f);

    const root_id root = f->create_root(config_for("gpt-4"))->id;
    const node_id q = f->create_message_node(root, user("q"))->id;
    const node_id seen = f->create_message_node(q, assistant("seen"))->id;
    const node_id fresh = f->create_message_node(q, assistant("fresh"), tagged({tags::unread}))->id;

    CHECK(ids_of(partition_by_tag(f->get_children(q), tags::unread)) == std::vector<node_id>{fresh, seen});

    const node_data visited = f->get_node(fresh).value();
    REQUIRE(f->update_node_metadata(fresh, visited.metadata.without_tag(tags::unread)));

    CHECK_FALSE(f->get_node(fresh)->metadata.has_tag(tags::unread));
    CHECK(ids_of(partition_by_tag(f->get_children(q), tags::unread)) == std::vector<node_id>{seen, fresh});
}

TEST_CASE("Roots are listed with their configuration", "[forest]")
{
    temp_dir dir;
    {
        result<forest> f = forest::open(options_for(dir.path()));
        REQUIRE(f);
        REQUIRE(f->create_root(config_for("gpt-4")));
        REQUIRE(f->create_root(config_for("claude-3-opus-20240229")));
    }

    result<forest> f = forest::open(options_for(dir.path()));
    REQUIRE(f);

    const std::vector<root_data> roots = f->list_roots();
    REQUIRE(roots.size() == 2);
    CHECK(roots[0].config.model == "gpt-4");
    CHECK(roots[1].config.model == "claude-3-opus-20240229");
    CHECK(f->get_root(roots[1].id) == roots[1]);
    CHECK(f->store().root_count() == 2);
}
