#include <catch2/catch_test_macros.hpp>

#include <filesystem>
#include <fstream>

#include "loom/detail/durable_file.hpp"
#include "loom/forest.hpp"
#include "loom/node_store.hpp"
#include "loom/record_codec.hpp"
#include "test_support.hpp"

using namespace loom;
using namespace test_support;

namespace
{
struct seeded_store
{
    root_data root;
    node_data first;
    std::filesystem::path journal;
    std::filesystem::path nodes_dir;
};

// Leaves a closed store holding one root and one root-level node
seeded_store seed(const std::filesystem::path& dir)
{
    result<node_store> store = node_store::open(options_for(dir));
    REQUIRE(store);

    seeded_store seeded;
    seeded.root = store->create_root(config_for("gpt-4")).value();
    seeded.first = store->create_node(seeded.root.id, user("hi")).value();
    seeded.journal = store->journal_path();
    seeded.nodes_dir = dir / node_store::nodes_dir_name;
    return seeded;
}

// The records a crash would have left behind when replying to the parent
detail::journal reply_to(const node_data& parent, const node_id& id)
{
    node_data reply;
    reply.id = id;
    reply.root = parent.root;
    reply.parent_id = parent.id;
    reply.message = assistant("hello");

    node_data updated = parent;
    updated.child_ids.push_back(id);

    detail::journal txn;
    txn.nodes = {reply, updated};
    return txn;
}

std::vector<uint8_t> encode(const detail::journal& txn)
{
    std::vector<uint8_t> buffer;
    detail::serializer s;
    REQUIRE(s.serialize_journal(txn, buffer));
    return buffer;
}

std::vector<uint8_t> encode(const node_data& n)
{
    std::vector<uint8_t> buffer;
    detail::serializer s;
    REQUIRE(s.serialize_node(n, buffer));
    return buffer;
}

std::filesystem::path record_path(const seeded_store& seeded, const node_id& id)
{
    return seeded.nodes_dir / (id.str() + node_store::node_file_extension);
}

// A non-empty directory where a write wants its temp file makes that write fail
std::filesystem::path block_write_of(const std::filesystem::path& target)
{
    std::filesystem::path blocker = target;
    blocker += detail::temp_suffix;
    std::filesystem::create_directories(blocker / "occupied");
    return blocker;
}
} // namespace

TEST_CASE("Committed journals are replayed on open", "[recovery]")
{
    temp_dir dir;
    const seeded_store seeded = seed(dir.path());

    REQUIRE(detail::write_file_atomic(seeded.journal, encode(reply_to(seeded.first, node_id(2))), false));

    result<node_store> store = node_store::open(options_for(dir.path()));
    REQUIRE(store);

    const std::optional<node_data> reply = store->get_node(node_id(2));
    REQUIRE(reply);
    CHECK(reply->parent_id == seeded.first.id);
    CHECK(reply->message.content == "hello");

    const std::vector<node_data> children = store->get_children(seeded.first.id);
    REQUIRE(children.size() == 1);
    CHECK(children[0].id == node_id(2));

    CHECK_FALSE(std::filesystem::exists(seeded.journal));

    SECTION("Allocation continues after the replayed node")
    {
        result<node_data> next = store->create_node(node_id(2), user("thanks"));
        REQUIRE(next);
        CHECK(next->id == node_id(3));
    }
}

TEST_CASE("Replaying a journal twice is harmless", "[recovery]")
{
    temp_dir dir;
    const seeded_store seeded = seed(dir.path());
    const std::vector<uint8_t> journal = encode(reply_to(seeded.first, node_id(2)));

    // Crash after the records were written but before the journal was removed
    REQUIRE(detail::write_file_atomic(seeded.journal, journal, false));
    REQUIRE(node_store::open(options_for(dir.path())));
    REQUIRE(detail::write_file_atomic(seeded.journal, journal, false));

    result<node_store> store = node_store::open(options_for(dir.path()));
    REQUIRE(store);
    CHECK(store->node_count() == 2);
    CHECK(store->get_node(seeded.first.id)->child_ids == std::vector<node_id>{node_id(2)});
}

TEST_CASE("Torn journals are discarded", "[recovery]")
{
    temp_dir dir;
    const seeded_store seeded = seed(dir.path());

    std::vector<uint8_t> journal = encode(reply_to(seeded.first, node_id(2)));
    journal.resize(journal.size() - 5);
    REQUIRE(detail::write_file_atomic(seeded.journal, journal, false));

    result<node_store> store = node_store::open(options_for(dir.path()));
    REQUIRE(store);

    CHECK_FALSE(store->get_node(node_id(2)));
    CHECK(store->get_children(seeded.first.id).empty());
    CHECK(store->node_count() == 1);
    CHECK_FALSE(std::filesystem::exists(seeded.journal));
}

TEST_CASE("Interrupted writes are cleaned up", "[recovery]")
{
    temp_dir dir;
    const seeded_store seeded = seed(dir.path());

    std::filesystem::path leftover = record_path(seeded, node_id(2));
    leftover += detail::temp_suffix;
    {
        const std::vector<uint8_t> half = encode(reply_to(seeded.first, node_id(2)).nodes[0]);
        std::ofstream(leftover, std::ios::binary).write(reinterpret_cast<const char*>(half.data()),
                                                        static_cast<std::streamsize>(half.size() / 2));
    }

    result<node_store> store = node_store::open(options_for(dir.path()));
    REQUIRE(store);
    CHECK_FALSE(std::filesystem::exists(leftover));
    CHECK(store->node_count() == 1);
}

TEST_CASE("A node written without its parent is detected", "[recovery]")
{
    temp_dir dir;
    const seeded_store seeded = seed(dir.path());

    // Only the first half of the transaction reached its record file
    const node_data orphan = reply_to(seeded.first, node_id(2)).nodes[0];
    REQUIRE(detail::write_file_atomic(record_path(seeded, orphan.id), encode(orphan), false));

    SECTION("Verification rejects the store")
    {
        result<node_store> store = node_store::open(options_for(dir.path()));
        REQUIRE(store.is_err());
        CHECK(store.code() == error_code::io_error);
        REQUIRE(store.error().context("node"));
        CHECK(*store.error().context("node") == "N2");
    }

    SECTION("Verification can be turned off")
    {
        forest_options options = options_for(dir.path());
        options.verify_on_open = false;
        CHECK(node_store::open(options));
    }
}

TEST_CASE("A child pointing to a missing parent is detected", "[recovery]")
{
    temp_dir dir;
    const seeded_store seeded = seed(dir.path());

    node_data orphan = reply_to(seeded.first, node_id(2)).nodes[0];
    orphan.parent_id = node_id(40);
    REQUIRE(detail::write_file_atomic(record_path(seeded, orphan.id), encode(orphan), false));

    result<node_store> store = node_store::open(options_for(dir.path()));
    REQUIRE(store.is_err());
    CHECK(store.code() == error_code::io_error);
}

TEST_CASE("Damaged records fail the open", "[recovery]")
{
    temp_dir dir;
    const seeded_store seeded = seed(dir.path());
    const std::filesystem::path record = record_path(seeded, seeded.first.id);

    SECTION("Garbage content")
    {
        std::ofstream(record, std::ios::binary | std::ios::trunc) << "garbage";
    }

    SECTION("Record filed under another id")
    {
        std::filesystem::copy_file(record, record_path(seeded, node_id(9)));
    }

    result<node_store> store = node_store::open(options_for(dir.path()));
    REQUIRE(store.is_err());
    CHECK(store.code() == error_code::io_error);
}

TEST_CASE("A failed journal write leaves the store unchanged", "[recovery]")
{
    temp_dir dir;
    const seeded_store seeded = seed(dir.path());

    result<forest> f = forest::open(options_for(dir.path()));
    REQUIRE(f);

    const std::filesystem::path blocker = block_write_of(seeded.journal);

    result<node_data> reply = f->create_message_node(seeded.first.id, assistant("hello"));
    REQUIRE(reply.is_err());
    CHECK(reply.code() == error_code::io_error);

    CHECK(f->get_children(seeded.first.id).empty());
    CHECK(f->store().node_count() == 1);
    CHECK_FALSE(std::filesystem::exists(seeded.journal));

    SECTION("The store stays writable")
    {
        std::filesystem::remove_all(blocker);
        CHECK(f->create_message_node(seeded.first.id, assistant("hello")));
        CHECK(f->get_children(seeded.first.id).size() == 1);
    }
}

TEST_CASE("A committed but unapplied journal makes the store read-only", "[recovery]")
{
    temp_dir dir;
    const seeded_store seeded = seed(dir.path());
    const node_id next = node_id(2);

    std::filesystem::path blocker;
    {
        result<forest> f = forest::open(options_for(dir.path()));
        REQUIRE(f);

        blocker = block_write_of(record_path(seeded, next));

        // The journal is durable, so the call reports success
        result<node_data> reply = f->create_message_node(seeded.first.id, assistant("hello"));
        REQUIRE(reply);
        CHECK(reply->id == next);
        CHECK(std::filesystem::exists(seeded.journal));
        CHECK(f->get_children(seeded.first.id).size() == 1);

        CHECK(f->create_message_node(next, user("thanks")).code() == error_code::io_error);
        CHECK(f->create_root(config_for("gpt-4")).code() == error_code::io_error);
        CHECK(f->update_node_metadata(next, tagged({"starred"})).code() == error_code::io_error);
        CHECK(f->store().node_count() == 2);
    }

    std::filesystem::remove_all(blocker);

    result<forest> f = forest::open(options_for(dir.path()));
    REQUIRE(f);
    CHECK_FALSE(std::filesystem::exists(seeded.journal));
    CHECK(f->store().node_count() == 2);

    result<path_result> path = f->get_path({std::nullopt, next});
    REQUIRE(path);
    REQUIRE(path->path.size() == 2);
    CHECK(path->path[0].id == seeded.first.id);
    CHECK(path->path[1].message.content == "hello");

    const std::vector<node_data> children = f->get_children(seeded.first.id);
    REQUIRE(children.size() == 1);
    CHECK(children[0].id == next);

    CHECK(f->create_message_node(next, user("thanks")));
}
