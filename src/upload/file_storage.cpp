#include "rus/upload/file_storage.hpp"

#include "rus/upload/types.hpp"

#include <spdlog/spdlog.h>

#include <array>
#include <cerrno>
#include <cstring>

#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>

namespace rus::upload {
namespace fs = std::filesystem;

namespace {

constexpr std::size_t kCopyBlockSize = 64 * 1024;

/**
 * @brief Owns a POSIX file descriptor, closes it on scope exit
 */
class FileDescriptor {
public:
    explicit FileDescriptor(int fd) : fd_(fd) {}
    ~FileDescriptor() {
        if (fd_ >= 0) {
            ::close(fd_);
        }
    }

    FileDescriptor(const FileDescriptor&) = delete;
    FileDescriptor& operator=(const FileDescriptor&) = delete;

    int get() const { return fd_; }
    bool valid() const { return fd_ >= 0; }

private:
    int fd_;
};

Error errno_error(int err, const std::string& what) {
    const std::string message = what + ": " + std::strerror(err);
    switch (err) {
        case ENOSPC:
#ifdef EDQUOT
        case EDQUOT:
#endif
            return Error(ErrorKind::StorageFull, message);
        case EAGAIN:
        case EINTR:
        case EBUSY:
        case ETXTBSY:
            return Error(ErrorKind::StorageUnavailable, message);
        case ENOENT:
            return Error(ErrorKind::NotFound, message);
        default:
            return Error(ErrorKind::Internal, message);
    }
}

Result<std::uint64_t> file_size(int fd, const std::string& id) {
    struct stat st {};
    if (::fstat(fd, &st) != 0) {
        return Err<std::uint64_t>(errno_error(errno, "stat " + id));
    }
    return Ok<std::uint64_t>(static_cast<std::uint64_t>(st.st_size));
}

Result<void> write_all(int fd, std::uint64_t offset, const std::uint8_t* data, std::size_t len,
                       const std::string& id) {
    std::size_t written = 0;
    while (written < len) {
        const ssize_t n = ::pwrite(fd, data + written, len - written,
                                   static_cast<off_t>(offset + written));
        if (n < 0) {
            return Err<void>(errno_error(errno, "write " + id));
        }
        written += static_cast<std::size_t>(n);
    }
    return Ok();
}

Result<void> read_all(int fd, std::uint64_t offset, std::uint8_t* out, std::size_t len,
                      const std::string& id) {
    std::size_t done = 0;
    while (done < len) {
        const ssize_t n = ::pread(fd, out + done, len - done, static_cast<off_t>(offset + done));
        if (n < 0) {
            return Err<void>(errno_error(errno, "read " + id));
        }
        if (n == 0) {
            return Err<void>(Error(ErrorKind::InvalidOffset, "Unexpected end of data for " + id));
        }
        done += static_cast<std::size_t>(n);
    }
    return Ok();
}

} // namespace

FileStorage::FileStorage(fs::path root)
    : root_(std::move(root)) {
    fs::create_directories(root_);
}

Result<fs::path> FileStorage::data_path(const std::string& id) const {
    // Ids end up in file names, never accept anything we did not generate
    if (!is_valid_upload_id(id)) {
        return fail<fs::path>(ErrorKind::NotFound, "Invalid upload id: " + id);
    }
    return Ok(root_ / id);
}

Result<void> FileStorage::create(const std::string& id) {
    auto path = data_path(id);
    if (path.is_error()) {
        return Err<void>(path.error());
    }

    FileDescriptor fd(::open(path.value().c_str(), O_WRONLY | O_CREAT | O_TRUNC | O_CLOEXEC, 0644));
    if (!fd.valid()) {
        return Err<void>(errno_error(errno, "create " + id));
    }
    if (::fsync(fd.get()) != 0) {
        return Err<void>(errno_error(errno, "fsync " + id));
    }
    return Ok();
}

Result<std::size_t> FileStorage::write(const std::string& id,
                                       std::uint64_t offset,
                                       const std::uint8_t* data,
                                       std::size_t len) {
    auto path = data_path(id);
    if (path.is_error()) {
        return Err<std::size_t>(path.error());
    }

    FileDescriptor fd(::open(path.value().c_str(), O_WRONLY | O_CLOEXEC));
    if (!fd.valid()) {
        return Err<std::size_t>(errno_error(errno, "open " + id));
    }

    auto size = file_size(fd.get(), id);
    if (size.is_error()) {
        return Err<std::size_t>(size.error());
    }
    if (offset > size.value()) {
        return Err<std::size_t>(Error(ErrorKind::InvalidOffset,
            "Write at " + std::to_string(offset) + " past end of data (" +
            std::to_string(size.value()) + ") for " + id));
    }

    if (auto res = write_all(fd.get(), offset, data, len, id); res.is_error()) {
        return Err<std::size_t>(res.error());
    }

    // Drop whatever an earlier, uncommitted attempt left behind
    if (::ftruncate(fd.get(), static_cast<off_t>(offset + len)) != 0) {
        return Err<std::size_t>(errno_error(errno, "truncate " + id));
    }

    if (::fsync(fd.get()) != 0) {
        return Err<std::size_t>(errno_error(errno, "fsync " + id));
    }

    return Ok<std::size_t>(len);
}

Result<std::uint64_t> FileStorage::read_length(const std::string& id) {
    auto path = data_path(id);
    if (path.is_error()) {
        return Err<std::uint64_t>(path.error());
    }

    FileDescriptor fd(::open(path.value().c_str(), O_RDONLY | O_CLOEXEC));
    if (!fd.valid()) {
        return Err<std::uint64_t>(errno_error(errno, "open " + id));
    }
    return file_size(fd.get(), id);
}

Result<std::vector<std::uint8_t>> FileStorage::read(const std::string& id,
                                                    std::uint64_t offset,
                                                    std::uint64_t length) {
    using Bytes = std::vector<std::uint8_t>;

    auto path = data_path(id);
    if (path.is_error()) {
        return Err<Bytes>(path.error());
    }

    FileDescriptor fd(::open(path.value().c_str(), O_RDONLY | O_CLOEXEC));
    if (!fd.valid()) {
        return Err<Bytes>(errno_error(errno, "open " + id));
    }

    auto size = file_size(fd.get(), id);
    if (size.is_error()) {
        return Err<Bytes>(size.error());
    }
    if (offset > size.value() || length > size.value() - offset) {
        return Err<Bytes>(Error(ErrorKind::InvalidOffset,
            "Range " + std::to_string(offset) + "+" + std::to_string(length) +
            " outside stored data for " + id));
    }

    Bytes out(static_cast<std::size_t>(length));
    if (auto res = read_all(fd.get(), offset, out.data(), out.size(), id); res.is_error()) {
        return Err<Bytes>(res.error());
    }
    return Ok(std::move(out));
}

Result<std::uint64_t> FileStorage::concatenate(const std::string& target,
                                               const std::vector<std::string>& parents) {
    auto target_path = data_path(target);
    if (target_path.is_error()) {
        return Err<std::uint64_t>(target_path.error());
    }

    FileDescriptor out(::open(target_path.value().c_str(),
                              O_WRONLY | O_CREAT | O_TRUNC | O_CLOEXEC, 0644));
    if (!out.valid()) {
        return Err<std::uint64_t>(errno_error(errno, "create " + target));
    }

    std::array<std::uint8_t, kCopyBlockSize> block{};
    std::uint64_t total = 0;

    for (const auto& parent : parents) {
        auto parent_path = data_path(parent);
        if (parent_path.is_error()) {
            return Err<std::uint64_t>(parent_path.error());
        }

        FileDescriptor in(::open(parent_path.value().c_str(), O_RDONLY | O_CLOEXEC));
        if (!in.valid()) {
            return Err<std::uint64_t>(errno_error(errno, "open " + parent));
        }

        while (true) {
            const ssize_t n = ::read(in.get(), block.data(), block.size());
            if (n < 0) {
                return Err<std::uint64_t>(errno_error(errno, "read " + parent));
            }
            if (n == 0) {
                break;
            }
            if (auto res = write_all(out.get(), total, block.data(), static_cast<std::size_t>(n), target);
                res.is_error()) {
                return Err<std::uint64_t>(res.error());
            }
            total += static_cast<std::uint64_t>(n);
        }
    }

    if (::fsync(out.get()) != 0) {
        return Err<std::uint64_t>(errno_error(errno, "fsync " + target));
    }

    spdlog::debug("Concatenated {} parts into {} ({} bytes)", parents.size(), target, total);
    return Ok<std::uint64_t>(total);
}

Result<void> FileStorage::remove(const std::string& id) {
    auto path = data_path(id);
    if (path.is_error()) {
        // Nothing with that name can exist
        return Ok();
    }

    if (::unlink(path.value().c_str()) != 0 && errno != ENOENT) {
        return Err<void>(errno_error(errno, "remove " + id));
    }
    return Ok();
}

} // namespace rus::upload
