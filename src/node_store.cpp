#include "loom/node_store.hpp"

#include <algorithm>
#include <string>

#include "loom/log.hpp"

namespace loom
{
namespace
{
bool has_suffix(const std::string& str, const std::string& suffix)
{
    return str.size() >= suffix.size() && str.compare(str.size() - suffix.size(), suffix.size(), suffix) == 0;
}

error corrupt_record(const std::filesystem::path& filepath)
{
    return error::io("corrupt record").with_context("path", filepath.string());
}

error inconsistent(const std::string& what, const node_id& id)
{
    return error::io("inconsistent store: " + what).with_context("node", id.str());
}

// Removes leftovers of writes interrupted before their rename
status remove_temp_files(const std::filesystem::path& dir)
{
    std::error_code ec;
    std::filesystem::directory_iterator it(dir, ec);
    if (ec)
        return error::io("cannot list directory: " + ec.message()).with_context("path", dir.string());

    for (; it != std::filesystem::directory_iterator(); it.increment(ec))
    {
        if (ec)
            return error::io("cannot list directory: " + ec.message()).with_context("path", dir.string());

        const std::filesystem::path& entry = it->path();
        if (!has_suffix(entry.filename().string(), detail::temp_suffix))
            continue;

        LOOM_LOG_WARN("removing interrupted write {}", entry.string());

        std::error_code remove_ec;
        std::filesystem::remove(entry, remove_ec);
        if (remove_ec)
            return error::io("cannot remove file: " + remove_ec.message()).with_context("path", entry.string());
    }

    if (ec)
        return error::io("cannot list directory: " + ec.message()).with_context("path", dir.string());

    return {};
}

// Calls f(id, path) for every record file named "<id><extension>" in the directory
template <typename Id, typename Function>
status for_each_record_file(const std::filesystem::path& dir, const std::string& extension, Function f)
{
    std::error_code ec;
    std::filesystem::directory_iterator it(dir, ec);
    if (ec)
        return error::io("cannot list directory: " + ec.message()).with_context("path", dir.string());

    for (; it != std::filesystem::directory_iterator(); it.increment(ec))
    {
        if (ec)
            return error::io("cannot list directory: " + ec.message()).with_context("path", dir.string());

        const std::filesystem::path& entry = it->path();
        const std::string filename = entry.filename().string();

        std::optional<Id> id;
        if (has_suffix(filename, extension))
            id = Id::parse(std::string_view(filename).substr(0, filename.size() - extension.size()));

        if (!id)
        {
            LOOM_LOG_WARN("ignoring unexpected file {}", entry.string());
            continue;
        }

        if (status st = f(*id, entry); !st)
            return st;
    }

    if (ec)
        return error::io("cannot list directory: " + ec.message()).with_context("path", dir.string());

    return {};
}
} // namespace

node_store::node_store(forest_options options, detail::directory_lock lock)
    : options_(std::move(options)),
      lock_(std::move(lock))
{
}

node_store::~node_store()
{
    if (lock_.held())
        LOOM_LOG_INFO("closed store at {}", options_.data_dir.string());
}

result<node_store> node_store::open(const forest_options& options)
{
    if (options.data_dir.empty())
        return error::validation("data directory is not set");

    std::error_code ec;
    if (!std::filesystem::is_directory(options.data_dir, ec))
    {
        if (!options.create_if_missing)
            return error::not_found("data directory " + options.data_dir.string());

        std::filesystem::create_directories(options.data_dir, ec);
        if (ec)
            return error::io("cannot create data directory: " + ec.message())
                .with_context("path", options.data_dir.string());
    }

    result<detail::directory_lock> lock = detail::directory_lock::acquire(options.data_dir / lock_file_name);
    if (!lock)
    {
        LOOM_LOG_ERROR("cannot open store at {}: {}", options.data_dir.string(), lock.error().message());
        return std::move(lock).error();
    }

    node_store store(options, std::move(lock).value());

    const auto fail = [&](status st) -> result<node_store> {
        LOOM_LOG_ERROR("cannot open store at {}: {}", options.data_dir.string(), st.error().message());
        return std::move(st).error();
    };

    if (status st = store.prepare_layout(); !st)
        return fail(std::move(st));

    if (status st = store.recover_journal(); !st)
        return fail(std::move(st));

    if (status st = store.load_records(); !st)
        return fail(std::move(st));

    if (options.verify_on_open)
    {
        if (status st = store.verify(); !st)
            return fail(std::move(st));
    }

    LOOM_LOG_INFO("opened store at {} with {} root(s) and {} node(s)", options.data_dir.string(), store.root_count(),
                  store.node_count());

    return std::move(store);
}

std::filesystem::path node_store::node_record_path(const node_id& id) const
{
    return options_.data_dir / nodes_dir_name / (id.str() + node_file_extension);
}

std::filesystem::path node_store::root_record_path(const root_id& id) const
{
    return options_.data_dir / roots_dir_name / (id.str() + root_file_extension);
}

std::filesystem::path node_store::journal_path() const
{
    return options_.data_dir / journal_file_name;
}

status node_store::prepare_layout()
{
    for (const char* subdir : {nodes_dir_name, roots_dir_name})
    {
        std::error_code ec;
        std::filesystem::create_directories(options_.data_dir / subdir, ec);
        if (ec)
            return error::io("cannot create directory: " + ec.message())
                .with_context("path", (options_.data_dir / subdir).string());
    }

    for (const std::filesystem::path& dir :
         {options_.data_dir, options_.data_dir / nodes_dir_name, options_.data_dir / roots_dir_name})
    {
        if (status st = remove_temp_files(dir); !st)
            return st;
    }

    return {};
}

status node_store::recover_journal()
{
    const std::filesystem::path path = journal_path();

    std::error_code ec;
    if (!std::filesystem::exists(path, ec))
        return {};

    result<std::vector<uint8_t>> bytes = detail::read_file(path);
    if (!bytes)
        return std::move(bytes).error();

    detail::serializer s;
    const std::optional<detail::journal> txn = s.deserialize_journal(bytes.value());

    // A damaged journal was never committed, none of its records were applied
    if (!txn)
    {
        LOOM_LOG_WARN("discarding incomplete journal {}", path.string());
        return detail::remove_file(path, options_.sync_writes);
    }

    LOOM_LOG_WARN("replaying journal with {} root(s) and {} node(s)", txn->roots.size(), txn->nodes.size());

    if (status st = apply_journal(*txn); !st)
        return st;

    return detail::remove_file(path, options_.sync_writes);
}

status node_store::apply_journal(const detail::journal& txn)
{
    detail::serializer s;

    for (const root_data& r : txn.roots)
    {
        std::vector<uint8_t> buffer;
        if (!s.serialize_root(r, buffer))
            return error::io("cannot encode root").with_context("root", r.id.str());

        if (status st = detail::write_file_atomic(root_record_path(r.id), buffer, options_.sync_writes); !st)
            return st;
    }

    for (const node_data& n : txn.nodes)
    {
        std::vector<uint8_t> buffer;
        if (!s.serialize_node(n, buffer))
            return error::io("cannot encode node").with_context("node", n.id.str());

        if (status st = detail::write_file_atomic(node_record_path(n.id), buffer, options_.sync_writes); !st)
            return st;
    }

    return {};
}

status node_store::load_records()
{
    detail::serializer s;

    status st = for_each_record_file<root_id>(
        options_.data_dir / roots_dir_name, root_file_extension,
        [&](const root_id& id, const std::filesystem::path& filepath) -> status {
            result<std::vector<uint8_t>> bytes = detail::read_file(filepath);
            if (!bytes)
                return std::move(bytes).error();

            std::optional<root_data> r = s.deserialize_root(bytes.value());
            if (!r || r->id != id)
                return corrupt_record(filepath);

            next_root_seq_ = std::max(next_root_seq_, id.seq() + 1);
            roots_.emplace(id, std::move(r.value()));
            return {};
        });
    if (!st)
        return st;

    st = for_each_record_file<node_id>(
        options_.data_dir / nodes_dir_name, node_file_extension,
        [&](const node_id& id, const std::filesystem::path& filepath) -> status {
            result<std::vector<uint8_t>> bytes = detail::read_file(filepath);
            if (!bytes)
                return std::move(bytes).error();

            std::optional<node_data> n = s.deserialize_node(bytes.value());
            if (!n || n->id != id)
                return corrupt_record(filepath);

            next_node_seq_ = std::max(next_node_seq_, id.seq() + 1);
            nodes_.emplace(id, std::move(n.value()));
            return {};
        });
    if (!st)
        return st;

    for (const auto& [id, n] : nodes_)
    {
        if (n.root_level())
            root_nodes_[n.root].push_back(id);
    }

    // Sequence numbers grow monotonically, so sorting restores creation order
    for (auto& [root, ids] : root_nodes_)
        std::sort(ids.begin(), ids.end());

    return {};
}

status node_store::verify() const
{
    for (const auto& [id, n] : nodes_)
    {
        if (roots_.find(n.root) == roots_.end())
            return inconsistent("unknown root " + n.root.str(), id);

        if (n.parent_id)
        {
            const auto parent = nodes_.find(*n.parent_id);
            if (parent == nodes_.end())
                return inconsistent("missing parent " + n.parent_id->str(), id);

            // Parents are created before their children
            if (!(*n.parent_id < id))
                return inconsistent("parent " + n.parent_id->str() + " is not older than its child", id);

            if (parent->second.root != n.root)
                return inconsistent("parent " + n.parent_id->str() + " belongs to another root", id);

            const auto& siblings = parent->second.child_ids;
            const auto count = std::count(siblings.begin(), siblings.end(), id);
            if (count != 1)
                return inconsistent("listed " + std::to_string(count) + " times by parent " + n.parent_id->str(), id);
        }

        for (const node_id& child_id : n.child_ids)
        {
            const auto child = nodes_.find(child_id);
            if (child == nodes_.end())
                return inconsistent("missing child " + child_id.str(), id);

            if (child->second.parent_id != id)
                return inconsistent("child " + child_id.str() + " points to another parent", id);
        }
    }

    return {};
}

status node_store::check_writable() const
{
    if (journal_pending_)
        return error::io("a committed transaction is waiting to be replayed, reopen the store");

    return {};
}

status node_store::commit(const detail::journal& txn)
{
    std::vector<uint8_t> buffer;
    buffer.reserve(512);

    detail::serializer s;
    if (!s.serialize_journal(txn, buffer))
        return error::io("cannot encode journal");

    const std::filesystem::path path = journal_path();

    if (status st = detail::write_file_atomic(path, buffer, options_.sync_writes); !st)
    {
        // Undo a rename that may have happened before the failure
        std::error_code ec;
        std::filesystem::remove(path, ec);
        if (ec)
        {
            journal_pending_ = true;
            LOOM_LOG_CRITICAL("cannot remove journal {} after failed commit: {}", path.string(), ec.message());
        }

        LOOM_LOG_ERROR("commit failed: {}", st.error().message());
        return st;
    }

    // The transaction is durable from here on, a failure below is repaired by the next open
    status st = apply_journal(txn);
    if (st)
        st = detail::remove_file(path, options_.sync_writes);

    if (!st)
    {
        journal_pending_ = true;
        LOOM_LOG_ERROR("journal {} committed but not applied, store is read-only until reopened: {}", path.string(),
                       st.error().message());
    }

    return {};
}

void node_store::publish(detail::journal txn)
{
    for (root_data& r : txn.roots)
    {
        next_root_seq_ = std::max(next_root_seq_, r.id.seq() + 1);
        roots_.insert_or_assign(r.id, std::move(r));
    }

    for (node_data& n : txn.nodes)
    {
        const bool created = nodes_.find(n.id) == nodes_.end();
        if (created && n.root_level())
            root_nodes_[n.root].push_back(n.id);

        next_node_seq_ = std::max(next_node_seq_, n.id.seq() + 1);
        nodes_.insert_or_assign(n.id, std::move(n));
    }
}

result<root_data> node_store::create_root(root_config config)
{
    if (status st = check_writable(); !st)
        return std::move(st).error();

    if (status st = validate(config); !st)
        return std::move(st).error();

    root_data r;
    r.id = root_id(next_root_seq_);
    r.config = std::move(config);
    r.created_at = now();

    detail::journal txn;
    txn.roots.push_back(r);

    if (status st = commit(txn); !st)
        return std::move(st).error();

    publish(std::move(txn));

    LOOM_LOG_DEBUG("created root {} for model {}", r.id.str(), r.config.model);
    return std::move(r);
}

result<node_data> node_store::create_node(const root_id& root, message msg, node_metadata metadata)
{
    if (roots_.find(root) == roots_.end())
        return error::not_found("root " + root.str());

    return insert_node(root, std::nullopt, std::move(msg), std::move(metadata));
}

result<node_data> node_store::create_node(const node_id& parent, message msg, node_metadata metadata)
{
    const auto it = nodes_.find(parent);
    if (it == nodes_.end())
        return error::not_found("node " + parent.str());

    return insert_node(it->second.root, parent, std::move(msg), std::move(metadata));
}

result<node_data> node_store::insert_node(const root_id& root, const std::optional<node_id>& parent, message msg,
                                          node_metadata metadata)
{
    if (status st = check_writable(); !st)
        return std::move(st).error();

    if (status st = validate(msg); !st)
        return std::move(st).error();

    if (status st = validate(metadata); !st)
        return std::move(st).error();

    node_data n;
    n.id = node_id(next_node_seq_);
    n.root = root;
    n.parent_id = parent;
    n.message = std::move(msg);
    n.metadata = std::move(metadata);

    detail::journal txn;
    txn.nodes.push_back(n);

    if (parent)
    {
        node_data updated_parent = nodes_.at(*parent);
        updated_parent.child_ids.push_back(n.id);
        txn.nodes.push_back(std::move(updated_parent));
    }

    if (status st = commit(txn); !st)
        return std::move(st).error();

    publish(std::move(txn));

    LOOM_LOG_DEBUG("created node {} ({}) under {}", n.id.str(), to_string(n.message.role),
                   parent ? parent->str() : root.str());
    return std::move(n);
}

result<node_data> node_store::update_node_metadata(const node_id& id, node_metadata metadata)
{
    if (status st = check_writable(); !st)
        return std::move(st).error();

    const auto it = nodes_.find(id);
    if (it == nodes_.end())
        return error::not_found("node " + id.str());

    if (status st = validate(metadata); !st)
        return std::move(st).error();

    // Nothing to write, the stored state already matches
    if (it->second.metadata == metadata)
        return it->second;

    node_data updated = it->second;
    updated.metadata = std::move(metadata);

    detail::journal txn;
    txn.nodes.push_back(updated);

    if (status st = commit(txn); !st)
        return std::move(st).error();

    publish(std::move(txn));

    LOOM_LOG_DEBUG("updated metadata of node {}", id.str());
    return std::move(updated);
}

std::optional<node_data> node_store::get_node(const node_id& id) const
{
    const node_data* n = find_node(id);
    return n ? std::make_optional(*n) : std::nullopt;
}

const node_data* node_store::find_node(const node_id& id) const
{
    const auto it = nodes_.find(id);
    return it != nodes_.end() ? &it->second : nullptr;
}

std::optional<root_data> node_store::get_root(const root_id& id) const
{
    const auto it = roots_.find(id);
    return it != roots_.end() ? std::make_optional(it->second) : std::nullopt;
}

std::vector<node_data> node_store::get_children(const node_id& id) const
{
    std::vector<node_data> children;

    const node_data* n = find_node(id);
    if (!n)
        return children;

    children.reserve(n->child_ids.size());
    for (const node_id& child_id : n->child_ids)
    {
        if (const node_data* child = find_node(child_id))
            children.push_back(*child);
    }

    return children;
}

std::vector<node_data> node_store::get_root_nodes(const root_id& id) const
{
    std::vector<node_data> nodes;

    const auto it = root_nodes_.find(id);
    if (it == root_nodes_.end())
        return nodes;

    nodes.reserve(it->second.size());
    for (const node_id& node : it->second)
    {
        if (const node_data* n = find_node(node))
            nodes.push_back(*n);
    }

    return nodes;
}

std::vector<root_data> node_store::list_roots() const
{
    std::vector<root_data> roots;
    roots.reserve(roots_.size());

    for (const auto& [id, r] : roots_)
        roots.push_back(r);

    return roots;
}
} // namespace loom
