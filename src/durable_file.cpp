#include "loom/detail/durable_file.hpp"

#include <cerrno>
#include <cstring>
#include <fstream>
#include <string>

#include <fcntl.h>
#include <sys/file.h>
#include <unistd.h>

namespace loom
{
namespace detail
{
namespace
{
error errno_error(const std::string& what, const std::filesystem::path& filepath, int err)
{
    return error::io(what + ": " + std::strerror(err)).with_context("path", filepath.string());
}

status write_all(int fd, const std::vector<uint8_t>& data, const std::filesystem::path& filepath)
{
    size_t written = 0;
    while (written < data.size())
    {
        const ssize_t n = ::write(fd, data.data() + written, data.size() - written);
        if (n < 0)
        {
            if (errno == EINTR)
                continue;
            return errno_error("write failed", filepath, errno);
        }
        written += static_cast<size_t>(n);
    }

    return {};
}
} // namespace

status write_file_atomic(const std::filesystem::path& target, const std::vector<uint8_t>& data, bool sync)
{
    std::filesystem::path temp_path = target;
    temp_path += temp_suffix;

    const int fd = ::open(temp_path.c_str(), O_WRONLY | O_CREAT | O_TRUNC | O_CLOEXEC, 0644);
    if (fd < 0)
        return errno_error("cannot create file", temp_path, errno);

    status st = write_all(fd, data, temp_path);
    if (st && sync && ::fsync(fd) != 0)
        st = errno_error("fsync failed", temp_path, errno);

    if (::close(fd) != 0 && st)
        st = errno_error("close failed", temp_path, errno);

    if (!st)
    {
        std::error_code ec;
        std::filesystem::remove(temp_path, ec);
        return st;
    }

    std::error_code ec;
    std::filesystem::rename(temp_path, target, ec);
    if (ec)
    {
        std::filesystem::remove(temp_path, ec);
        return error::io("rename failed: " + ec.message()).with_context("path", target.string());
    }

    return sync_directory(target.parent_path(), sync);
}

result<std::vector<uint8_t>> read_file(const std::filesystem::path& filepath)
{
    std::error_code ec;
    if (!std::filesystem::is_regular_file(filepath, ec))
        return error::not_found(filepath.string());

    std::ifstream ifs(filepath, std::ios::binary | std::ios::ate);

    if (!ifs)
        return error::io("cannot open file").with_context("path", filepath.string());

    const auto end = ifs.tellg();
    ifs.seekg(0, std::ios::beg);

    const auto size = static_cast<size_t>(end - ifs.tellg());

    std::vector<uint8_t> buffer(size);

    if (size > 0 && !ifs.read(reinterpret_cast<char*>(buffer.data()), static_cast<std::streamsize>(buffer.size())))
        return error::io("cannot read file").with_context("path", filepath.string());

    return buffer;
}

status sync_directory(const std::filesystem::path& dir, bool sync)
{
    if (!sync)
        return {};

    const int fd = ::open(dir.c_str(), O_RDONLY | O_DIRECTORY | O_CLOEXEC);
    if (fd < 0)
        return errno_error("cannot open directory", dir, errno);

    status st;
    if (::fsync(fd) != 0)
        st = errno_error("directory fsync failed", dir, errno);

    ::close(fd);
    return st;
}

status remove_file(const std::filesystem::path& filepath, bool sync)
{
    std::error_code ec;
    std::filesystem::remove(filepath, ec);
    if (ec)
        return error::io("cannot remove file: " + ec.message()).with_context("path", filepath.string());

    return sync_directory(filepath.parent_path(), sync);
}

result<directory_lock> directory_lock::acquire(const std::filesystem::path& lock_path)
{
    const int fd = ::open(lock_path.c_str(), O_RDWR | O_CREAT | O_CLOEXEC, 0644);
    if (fd < 0)
        return errno_error("cannot open lock file", lock_path, errno);

    // flock() locks belong to the open file description, so a second open of the
    // same directory conflicts even from within this process
    if (::flock(fd, LOCK_EX | LOCK_NB) != 0)
    {
        const int err = errno;
        ::close(fd);

        if (err == EWOULDBLOCK)
            return error::busy("data directory is in use by another store").with_context("path",
                                                                                         lock_path.string());

        return errno_error("cannot lock data directory", lock_path, err);
    }

    return directory_lock(fd);
}

directory_lock::directory_lock(directory_lock&& other) noexcept : fd_(other.fd_)
{
    other.fd_ = -1;
}

directory_lock& directory_lock::operator=(directory_lock&& rhs) noexcept
{
    if (this != &rhs)
    {
        release();
        fd_ = rhs.fd_;
        rhs.fd_ = -1;
    }

    return *this;
}

directory_lock::~directory_lock()
{
    release();
}

void directory_lock::release() noexcept
{
    if (fd_ < 0)
        return;

    ::flock(fd_, LOCK_UN);
    ::close(fd_);
    fd_ = -1;
}
} // namespace detail
} // namespace loom
