#pragma once

#include <cstdint>
#include <filesystem>
#include <vector>

#include "loom/error.hpp"

namespace loom
{
namespace detail
{
constexpr const char* temp_suffix = ".tmp";

// Writes data next to the target, flushes it and renames it over the target,
// so readers observe either the old or the new content and never a mix
[[nodiscard]] status write_file_atomic(const std::filesystem::path& target, const std::vector<uint8_t>& data,
                                       bool sync);

[[nodiscard]] result<std::vector<uint8_t>> read_file(const std::filesystem::path& filepath);

// Makes renames and unlinks within the directory durable
[[nodiscard]] status sync_directory(const std::filesystem::path& dir, bool sync);

[[nodiscard]] status remove_file(const std::filesystem::path& filepath, bool sync);

// Exclusive advisory lock on a file inside the data directory, held until destruction
class directory_lock final
{
  public:
    [[nodiscard]] static result<directory_lock> acquire(const std::filesystem::path& lock_path);

    directory_lock(const directory_lock& other) = delete;
    directory_lock(directory_lock&& other) noexcept;

    directory_lock& operator=(const directory_lock& rhs) = delete;
    directory_lock& operator=(directory_lock&& rhs) noexcept;

    ~directory_lock();

    [[nodiscard]] bool held() const noexcept
    {
        return fd_ >= 0;
    }

  private:
    explicit directory_lock(int fd) noexcept : fd_(fd)
    {
    }

    void release() noexcept;

    int fd_ = -1;
};
} // namespace detail
} // namespace loom
