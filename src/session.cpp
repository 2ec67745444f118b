#include "loom/session.hpp"

#include <string>
#include <string_view>

#include "loom/detail/durable_file.hpp"
#include "loom/log.hpp"

namespace loom
{
session_pointer::session_pointer(std::filesystem::path data_dir, bool sync_writes)
    : data_dir_(std::move(data_dir)),
      sync_writes_(sync_writes)
{
}

std::filesystem::path session_pointer::path() const
{
    return data_dir_ / file_name;
}

std::optional<node_id> session_pointer::load() const
{
    result<std::vector<uint8_t>> bytes = detail::read_file(path());
    if (!bytes)
    {
        if (bytes.code() != error_code::not_found)
            LOOM_LOG_WARN("cannot read session pointer: {}", bytes.error().message());
        return std::nullopt;
    }

    std::string_view text(reinterpret_cast<const char*>(bytes->data()), bytes->size());

    // Tolerate a trailing newline left by hand edits
    while (!text.empty() && (text.back() == '\n' || text.back() == '\r' || text.back() == ' '))
        text.remove_suffix(1);

    std::optional<node_id> id = node_id::parse(text);
    if (!id)
        LOOM_LOG_WARN("ignoring malformed session pointer '{}'", std::string(text));

    return id;
}

status session_pointer::save(const node_id& id) const
{
    const std::string text = id.str();
    return detail::write_file_atomic(path(), std::vector<uint8_t>(text.begin(), text.end()), sync_writes_);
}
} // namespace loom
