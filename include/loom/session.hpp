#pragma once

#include <filesystem>
#include <optional>

#include "loom/error.hpp"
#include "loom/ids.hpp"

namespace loom
{
// Last visited node of a front end session, kept next to the store's records
// so that the next session can resume where this one stopped
class session_pointer final
{
  public:
    static constexpr const char* file_name = "current-node-id";

    explicit session_pointer(std::filesystem::path data_dir, bool sync_writes = true);

    // Absent if nothing was saved yet or the file doesn't hold a node id
    [[nodiscard]] std::optional<node_id> load() const;

    [[nodiscard]] status save(const node_id& id) const;

    [[nodiscard]] std::filesystem::path path() const;

  private:
    std::filesystem::path data_dir_;
    bool sync_writes_;
};
} // namespace loom
