#pragma once

#include <filesystem>

namespace loom
{
struct forest_options
{
    // Holds the records of one conversation forest
    std::filesystem::path data_dir;

    // Otherwise opening a missing directory fails with not_found
    bool create_if_missing = true;

    // Skipping fsync trades durability for speed, e.g. in tests and bulk imports
    bool sync_writes = true;

    // Check parent/child links across all records while opening
    bool verify_on_open = true;
};
} // namespace loom
