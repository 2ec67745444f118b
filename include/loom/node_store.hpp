#pragma once

#include <filesystem>
#include <map>
#include <optional>
#include <unordered_map>
#include <vector>

#include "loom/detail/durable_file.hpp"
#include "loom/error.hpp"
#include "loom/options.hpp"
#include "loom/record_codec.hpp"
#include "loom/types.hpp"

namespace loom
{
// Durable keyed storage of roots and nodes
//
// Every record lives in its own file and is mirrored in an in-memory arena.
// Mutations go through a journal, so that a new node and its updated parent
// become durable together or not at all. Reads never touch the disk.
class node_store final
{
  public:
    static constexpr const char* lock_file_name = "LOCK";
    static constexpr const char* journal_file_name = "journal";
    static constexpr const char* nodes_dir_name = "nodes";
    static constexpr const char* roots_dir_name = "roots";
    static constexpr const char* node_file_extension = ".node";
    static constexpr const char* root_file_extension = ".root";

    // Acquires the directory lock, recovers an interrupted transaction and loads all records
    [[nodiscard]] static result<node_store> open(const forest_options& options);

    node_store(const node_store& other) = delete;
    node_store(node_store&& other) = default;

    node_store& operator=(const node_store& rhs) = delete;
    node_store& operator=(node_store&& rhs) = default;

    ~node_store();

    [[nodiscard]] result<root_data> create_root(root_config config);

    // Creates a root-level node of the given root
    [[nodiscard]] result<node_data> create_node(const root_id& root, message msg, node_metadata metadata = {});

    // Creates a node under the given parent, appending it to the parent's child list
    [[nodiscard]] result<node_data> create_node(const node_id& parent, message msg, node_metadata metadata = {});

    [[nodiscard]] std::optional<node_data> get_node(const node_id& id) const;

    [[nodiscard]] std::optional<root_data> get_root(const root_id& id) const;

    // Creation order, empty if the node is unknown or has no children
    [[nodiscard]] std::vector<node_data> get_children(const node_id& id) const;

    // Root-level nodes of the root in creation order
    [[nodiscard]] std::vector<node_data> get_root_nodes(const root_id& id) const;

    [[nodiscard]] std::vector<root_data> list_roots() const;

    // Replaces the metadata as a whole
    [[nodiscard]] result<node_data> update_node_metadata(const node_id& id, node_metadata metadata);

    // Arena lookup without a copy, the pointer is invalidated by the next mutation
    [[nodiscard]] const node_data* find_node(const node_id& id) const;

    [[nodiscard]] size_t node_count() const noexcept
    {
        return nodes_.size();
    }

    [[nodiscard]] size_t root_count() const noexcept
    {
        return roots_.size();
    }

    [[nodiscard]] const std::filesystem::path& data_dir() const noexcept
    {
        return options_.data_dir;
    }

    [[nodiscard]] std::filesystem::path node_record_path(const node_id& id) const;
    [[nodiscard]] std::filesystem::path root_record_path(const root_id& id) const;
    [[nodiscard]] std::filesystem::path journal_path() const;

  private:
    node_store(forest_options options, detail::directory_lock lock);

    status prepare_layout();
    status recover_journal();
    status apply_journal(const detail::journal& txn);
    status load_records();
    status verify() const;

    result<node_data> insert_node(const root_id& root, const std::optional<node_id>& parent, message msg,
                                  node_metadata metadata);
    status commit(const detail::journal& txn);
    void publish(detail::journal txn);
    status check_writable() const;

    forest_options options_;
    detail::directory_lock lock_;

    std::unordered_map<node_id, node_data> nodes_;
    std::map<root_id, root_data> roots_;
    std::unordered_map<root_id, std::vector<node_id>> root_nodes_;

    uint64_t next_node_seq_ = 1;
    uint64_t next_root_seq_ = 1;

    // Set when a committed journal could not be applied; the next open replays it
    bool journal_pending_ = false;
};
} // namespace loom
