#include "storage/local_storage.hpp"

#include <fcntl.h>
#include <spdlog/spdlog.h>
#include <sys/file.h>
#include <sys/stat.h>
#include <unistd.h>
#include <algorithm>
#include <cerrno>
#include <chrono>
#include <cstdio>
#include <cstring>
#include <random>
#include <string>
#include <string_view>
#include <system_error>
#include <utility>

namespace FileCache::Storage
{

namespace fs = std::filesystem;

namespace
{

// RAII for file descriptors
class FileDescriptorGuard
{
    private:
    int fd_;

    public:
    explicit FileDescriptorGuard(int fd = -1) noexcept : fd_(fd) {}
    ~FileDescriptorGuard()
    {
        if (fd_ >= 0) {
            if (::close(fd_) == -1) {
                spdlog::error(
                    "~FileDescriptorGuard: Failed to close fd {}: {}", fd_, std::strerror(errno)
                );
            }
        }
    }
    FileDescriptorGuard(const FileDescriptorGuard&)            = delete;
    FileDescriptorGuard& operator=(const FileDescriptorGuard&) = delete;
    FileDescriptorGuard(FileDescriptorGuard&& other) noexcept : fd_(other.release()) {}
    FileDescriptorGuard& operator=(FileDescriptorGuard&& other) noexcept
    {
        reset(other.release());
        return *this;
    }
    int get() const noexcept { return fd_; }
    int release() noexcept { return std::exchange(fd_, -1); }
    void reset(int new_fd = -1) noexcept
    {
        if (fd_ >= 0 && fd_ != new_fd) {
            if (::close(fd_) == -1) {
                spdlog::error(
                    "~FileDescriptorGuard.reset: Failed to close fd {}: {}", fd_,
                    std::strerror(errno)
                );
            }
        }
        fd_ = new_fd;
    }
    explicit operator bool() const noexcept { return fd_ >= 0; }
};

std::error_code ErrnoToErrorCode(int err_no) { return make_error_code(ErrnoToStorageErrc(err_no)); }

bool IsWithin(const fs::path& base, const fs::path& candidate)
{
    auto mismatch = std::mismatch(base.begin(), base.end(), candidate.begin(), candidate.end());
    return mismatch.first == base.end();
}

StorageResult<void> WriteFully(int fd, std::span<const std::byte> data)
{
    std::size_t written = 0;
    while (written < data.size()) {
        const ssize_t res = ::write(fd, data.data() + written, data.size() - written);
        if (res < 0) {
            if (errno == EINTR)
                continue;
            return std::unexpected(ErrnoToErrorCode(errno));
        }
        written += static_cast<std::size_t>(res);
    }
    return {};
}

struct timespec ToTimespec(TimePoint tp)
{
    const auto ns = std::chrono::duration_cast<std::chrono::nanoseconds>(tp.time_since_epoch());
    struct timespec ts{};
    ts.tv_sec  = static_cast<time_t>(ns.count() / 1'000'000'000);
    ts.tv_nsec = static_cast<long>(ns.count() % 1'000'000'000);
    if (ts.tv_nsec < 0) {
        ts.tv_sec -= 1;
        ts.tv_nsec += 1'000'000'000;
    }
    return ts;
}

constexpr std::string_view TEMP_MARKER = ".tmp.";

std::string TemporarySiblingName(const fs::path& target)
{
    thread_local std::mt19937_64 rng{std::random_device{}()};
    char suffix[17];
    std::snprintf(suffix, sizeof(suffix), "%016llx", static_cast<unsigned long long>(rng()));
    return "." + target.filename().string() + std::string(TEMP_MARKER) +
           std::to_string(::getpid()) + "." + suffix;
}

void FsyncDirectory(const fs::path& dir)
{
    const int dfd = ::open(dir.c_str(), O_RDONLY | O_DIRECTORY | O_CLOEXEC);
    if (dfd < 0) {
        spdlog::warn("FsyncDirectory: cannot open '{}': {}", dir.string(), std::strerror(errno));
        return;
    }
    FileDescriptorGuard dfd_guard(dfd);
    if (::fsync(dfd) == -1) {
        spdlog::warn("FsyncDirectory: fsync '{}' failed: {}", dir.string(), std::strerror(errno));
    }
}

//------------------------------------------------------------------------------//
// Directory listing cursor
//------------------------------------------------------------------------------//

class LocalStorageListing : public IStorageListing
{
    public:
    LocalStorageListing(fs::path base_path, fs::path dir_full_path, std::string extension)
        : base_path_(std::move(base_path)),
          dir_full_path_(std::move(dir_full_path)),
          extension_(std::move(extension))
    {
    }

    StorageResult<void> Restart() override
    {
        std::error_code ec;
        it_ = fs::directory_iterator(
            dir_full_path_, fs::directory_options::skip_permission_denied, ec
        );
        if (ec) {
            if (ec == std::errc::no_such_file_or_directory) {
                // A scope nobody has written to yet lists as empty.
                it_ = fs::directory_iterator();
                return {};
            }
            it_ = fs::directory_iterator();
            return std::unexpected(MapFilesystemError(ec));
        }
        return {};
    }

    StorageResult<std::optional<ListedEntry>> Next() override
    {
        while (it_ != fs::directory_iterator()) {
            const fs::path full_path = it_->path();

            std::error_code ec;
            it_.increment(ec);
            if (ec) {
                spdlog::warn(
                    "LocalStorageListing: iteration of '{}' failed: {}", dir_full_path_.string(),
                    ec.message()
                );
                it_ = fs::directory_iterator();
                return std::unexpected(MapFilesystemError(ec));
            }

            const std::string name = full_path.filename().string();
            if (name.empty() || name.front() == '.')
                continue;
            if (!extension_.empty() &&
                (name.size() <= extension_.size() || !name.ends_with(extension_)))
                continue;

            struct stat stbuf{};
            if (::lstat(full_path.c_str(), &stbuf) == -1) {
                const int stat_errno = errno;
                if (stat_errno == ENOENT) {
                    // Deleted after enumeration
                    continue;
                }
                return std::unexpected(ErrnoToErrorCode(stat_errno));
            }
            if (!S_ISREG(stbuf.st_mode))
                continue;

            return ListedEntry{full_path.lexically_relative(base_path_), stbuf};
        }
        return std::optional<ListedEntry>{};
    }

    private:
    fs::path base_path_;
    fs::path dir_full_path_;
    std::string extension_;
    fs::directory_iterator it_;
};

}  // namespace

LocalStorage::LocalStorage(std::filesystem::path base_path) : base_path_(std::move(base_path)) {}

std::filesystem::path LocalStorage::RelativeToAbsPath(
    const std::filesystem::path& relative_path
) const
{
    if (relative_path.is_absolute())
        return {};

    std::error_code ec;
    auto full = fs::weakly_canonical(base_path_ / relative_path, ec);
    if (ec)
        return {};

    auto base_can = fs::weakly_canonical(base_path_, ec);
    if (ec)
        return {};

    if (!IsWithin(base_can, full)) {
        return {};
    }
    return full;
}

std::filesystem::path LocalStorage::GetValidatedFullPath(
    const std::filesystem::path& relative_path
) const
{
    auto full_path = RelativeToAbsPath(relative_path);
    if (full_path.empty()) {
        spdlog::warn("Rejected path outside cache root: '{}'", relative_path.string());
        return {};
    }
    return full_path;
}

StorageResult<void> LocalStorage::EnsureParentDirectory(const std::filesystem::path& full_path
) const
{
    const auto parent_path = full_path.parent_path();
    std::error_code ec;
    if (!std::filesystem::exists(parent_path, ec)) {
        if (!std::filesystem::create_directories(parent_path, ec) &&
            (ec || !std::filesystem::is_directory(parent_path))) {
            return std::unexpected(
                MapFilesystemError(ec ? ec : std::make_error_code(std::errc::io_error))
            );
        }
    } else if (ec) {
        return std::unexpected(MapFilesystemError(ec));
    }
    return {};
}

StorageResult<void> LocalStorage::Initialize()
{
    std::error_code ec;

    if (!std::filesystem::exists(base_path_, ec)) {
        if (!std::filesystem::create_directories(base_path_, ec)) {
            if (ec) {
                return std::unexpected(MapFilesystemError(ec));
            }
            if (!std::filesystem::is_directory(base_path_, ec)) {
                return std::unexpected(
                    MapFilesystemError(ec ? ec : std::make_error_code(std::errc::io_error))
                );
            }
        }
    } else if (ec) {
        return std::unexpected(MapFilesystemError(ec));
    } else if (!std::filesystem::is_directory(base_path_, ec)) {
        return std::unexpected(make_error_code(StorageErrc::NotADirectory));
    }

    spdlog::debug("LocalStorage initialized at '{}'", base_path_.string());
    return {};
}

StorageResult<Bytes> LocalStorage::ReadAll(const std::filesystem::path& relative_path) const
{
    auto full_path = GetValidatedFullPath(relative_path);
    if (full_path.empty())
        return std::unexpected(make_error_code(StorageErrc::InvalidPath));

    int fd = ::open(full_path.c_str(), O_RDONLY | O_CLOEXEC);
    if (fd < 0) {
        int open_errno = errno;
        if (open_errno == ENOENT)
            return std::unexpected(make_error_code(StorageErrc::FileNotFound));
        return std::unexpected(ErrnoToErrorCode(open_errno));
    }
    FileDescriptorGuard fd_guard(fd);

    struct stat st{};
    if (::fstat(fd, &st) == -1) {
        return std::unexpected(ErrnoToErrorCode(errno));
    }
    if (!S_ISREG(st.st_mode)) {
        return std::unexpected(make_error_code(StorageErrc::IsADirectory));
    }

    Bytes contents(static_cast<std::size_t>(st.st_size));
    std::size_t total = 0;
    while (true) {
        if (total == contents.size()) {
            contents.resize(contents.size() + 4096);
        }
        const ssize_t bytes_read = ::read(fd, contents.data() + total, contents.size() - total);
        if (bytes_read < 0) {
            if (errno == EINTR)
                continue;
            return std::unexpected(ErrnoToErrorCode(errno));
        }
        if (bytes_read == 0)
            break;
        total += static_cast<std::size_t>(bytes_read);
    }
    contents.resize(total);
    return contents;
}

StorageResult<std::size_t> LocalStorage::Read(
    const std::filesystem::path& relative_path, off_t offset, std::span<std::byte> buffer
) const
{
    auto full_path = GetValidatedFullPath(relative_path);
    if (full_path.empty())
        return std::unexpected(make_error_code(StorageErrc::InvalidPath));
    if (offset < 0)
        return std::unexpected(make_error_code(StorageErrc::IOError));

    int fd = ::open(full_path.c_str(), O_RDONLY | O_CLOEXEC);
    if (fd < 0) {
        int open_errno = errno;
        if (open_errno == EISDIR)
            return std::unexpected(make_error_code(Storage::StorageErrc::IsADirectory));
        if (open_errno == ENOENT)
            return std::unexpected(make_error_code(Storage::StorageErrc::FileNotFound));
        return std::unexpected(ErrnoToErrorCode(open_errno));
    }
    FileDescriptorGuard fd_guard(fd);

    std::size_t total = 0;
    while (total < buffer.size()) {
        ssize_t bytes_read = ::pread(
            fd, buffer.data() + total, buffer.size() - total, offset + static_cast<off_t>(total)
        );
        if (bytes_read < 0) {
            if (errno == EINTR)
                continue;
            return std::unexpected(ErrnoToErrorCode(errno));
        }
        if (bytes_read == 0)
            break;
        total += static_cast<std::size_t>(bytes_read);
    }
    return total;
}

StorageResult<void> LocalStorage::WriteAtomic(
    const std::filesystem::path& relative_path, std::span<const std::byte> data,
    std::optional<TimePoint> modification_time
)
{
    const auto full_path = GetValidatedFullPath(relative_path);
    if (full_path.empty())
        return std::unexpected(make_error_code(StorageErrc::InvalidPath));

    if (auto res = EnsureParentDirectory(full_path); !res) {
        return std::unexpected(res.error());
    }

    const fs::path temp_path = full_path.parent_path() / TemporarySiblingName(full_path);

    constexpr mode_t default_mode = S_IRUSR | S_IWUSR | S_IRGRP | S_IROTH;
    const int fd =
        ::open(temp_path.c_str(), O_WRONLY | O_CREAT | O_EXCL | O_CLOEXEC, default_mode);
    if (fd < 0) {
        const int open_errno = errno;
        spdlog::error(
            "WriteAtomic: cannot create temporary '{}': {}", temp_path.string(),
            std::strerror(open_errno)
        );
        return std::unexpected(ErrnoToErrorCode(open_errno));
    }
    FileDescriptorGuard fd_guard(fd);

    auto discard_temp = [&temp_path]() {
        if (::unlink(temp_path.c_str()) == -1 && errno != ENOENT) {
            spdlog::warn(
                "WriteAtomic: failed to remove temporary '{}': {}", temp_path.string(),
                std::strerror(errno)
            );
        }
    };

    if (auto res = WriteFully(fd, data); !res) {
        spdlog::error("WriteAtomic: write to '{}' failed: {}", temp_path.string(),
                      res.error().message());
        discard_temp();
        return std::unexpected(res.error());
    }

    if (modification_time.has_value()) {
        const struct timespec ts = ToTimespec(*modification_time);
        const struct timespec times[2] = {ts, ts};
        if (::futimens(fd, times) == -1) {
            spdlog::warn(
                "WriteAtomic: futimens on '{}' failed: {}", temp_path.string(),
                std::strerror(errno)
            );
        }
    }

    if (::fsync(fd) == -1) {
        const int sync_errno = errno;
        discard_temp();
        return std::unexpected(ErrnoToErrorCode(sync_errno));
    }
    if (::close(fd_guard.release()) == -1) {
        const int close_errno = errno;
        discard_temp();
        return std::unexpected(ErrnoToErrorCode(close_errno));
    }

    if (::rename(temp_path.c_str(), full_path.c_str()) == -1) {
        const int rename_errno = errno;
        spdlog::error(
            "WriteAtomic: rename '{}' -> '{}' failed: {}", temp_path.string(), full_path.string(),
            std::strerror(rename_errno)
        );
        discard_temp();
        return std::unexpected(ErrnoToErrorCode(rename_errno));
    }

    FsyncDirectory(full_path.parent_path());
    return {};
}

StorageResult<void> LocalStorage::Remove(const std::filesystem::path& relative_path)
{
    const auto full_path = GetValidatedFullPath(relative_path);
    if (full_path.empty())
        return std::unexpected(make_error_code(StorageErrc::InvalidPath));

    std::error_code ec;
    if (fs::equivalent(full_path, base_path_, ec)) {
        return {};
    }

    if (::unlink(full_path.c_str()) == -1) {
        const int unlink_errno = errno;
        if (unlink_errno == ENOENT) {
            return {};
        }
        return std::unexpected(ErrnoToErrorCode(unlink_errno));
    }
    return {};
}

StorageResult<std::size_t> LocalStorage::RemoveStaleTemporaries(
    const std::filesystem::path& relative_dir, TimePoint older_than
)
{
    const auto dir_full_path = GetValidatedFullPath(relative_dir);
    if (dir_full_path.empty())
        return std::unexpected(make_error_code(StorageErrc::InvalidPath));

    std::error_code ec;
    fs::directory_iterator it(dir_full_path, fs::directory_options::skip_permission_denied, ec);
    if (ec) {
        if (ec == std::errc::no_such_file_or_directory)
            return std::size_t{0};
        return std::unexpected(MapFilesystemError(ec));
    }

    const struct timespec cutoff = ToTimespec(older_than);
    std::size_t removed          = 0;
    for (; it != fs::directory_iterator(); it.increment(ec)) {
        const fs::path full_path = it->path();
        const std::string name   = full_path.filename().string();
        if (name.empty() || name.front() != '.' || name.find(TEMP_MARKER) == std::string::npos)
            continue;

        struct stat stbuf{};
        if (::lstat(full_path.c_str(), &stbuf) == -1 || !S_ISREG(stbuf.st_mode))
            continue;
        const bool stale = stbuf.st_mtim.tv_sec < cutoff.tv_sec ||
                           (stbuf.st_mtim.tv_sec == cutoff.tv_sec &&
                            stbuf.st_mtim.tv_nsec < cutoff.tv_nsec);
        if (!stale)
            continue;

        if (::unlink(full_path.c_str()) == -1) {
            const int unlink_errno = errno;
            if (unlink_errno == ENOENT)
                continue;
            spdlog::warn(
                "RemoveStaleTemporaries: cannot remove '{}': {}", full_path.string(),
                std::strerror(unlink_errno)
            );
            return std::unexpected(ErrnoToErrorCode(unlink_errno));
        }
        spdlog::debug("RemoveStaleTemporaries: removed '{}'", full_path.string());
        ++removed;
    }
    if (ec) {
        return std::unexpected(MapFilesystemError(ec));
    }
    return removed;
}

StorageResult<bool> LocalStorage::CheckIfFileExists(
    const std::filesystem::path& relative_path
) const
{
    auto full_path = GetValidatedFullPath(relative_path);
    if (full_path.empty()) {
        return std::unexpected(make_error_code(StorageErrc::InvalidPath));
    }

    std::error_code ec;
    bool exists = std::filesystem::exists(full_path, ec);
    if (ec) {
        return std::unexpected(MapFilesystemError(ec));
    }
    return exists;
}

StorageResult<struct stat> LocalStorage::GetAttributes(
    const std::filesystem::path& relative_path
) const
{
    auto full_path = GetValidatedFullPath(relative_path);
    if (full_path.empty()) {
        return std::unexpected(make_error_code(StorageErrc::InvalidPath));
    }

    struct stat stbuf{};
    if (::lstat(full_path.c_str(), &stbuf) == -1) {
        int stat_errno = errno;

        if (stat_errno == ENOENT) {
            return std::unexpected(make_error_code(StorageErrc::FileNotFound));
        }

        return std::unexpected(ErrnoToErrorCode(stat_errno));
    }
    return stbuf;
}

StorageResult<void> LocalStorage::Touch(
    const std::filesystem::path& relative_path, TimePoint modification_time
)
{
    auto full_path = GetValidatedFullPath(relative_path);
    if (full_path.empty()) {
        return std::unexpected(make_error_code(StorageErrc::InvalidPath));
    }

    const struct timespec ts       = ToTimespec(modification_time);
    const struct timespec times[2] = {ts, ts};
    if (::utimensat(AT_FDCWD, full_path.c_str(), times, AT_SYMLINK_NOFOLLOW) == -1) {
        return std::unexpected(ErrnoToErrorCode(errno));
    }
    return {};
}

StorageResult<void> LocalStorage::CreateExclusive(
    const std::filesystem::path& relative_path, std::span<const std::byte> data
)
{
    auto full_path = GetValidatedFullPath(relative_path);
    if (full_path.empty())
        return std::unexpected(make_error_code(StorageErrc::InvalidPath));

    if (auto res = EnsureParentDirectory(full_path); !res) {
        return std::unexpected(res.error());
    }

    constexpr mode_t default_mode = S_IRUSR | S_IWUSR | S_IRGRP | S_IROTH;
    int fd = ::open(full_path.c_str(), O_WRONLY | O_CREAT | O_EXCL | O_CLOEXEC, default_mode);
    if (fd < 0) {
        return std::unexpected(ErrnoToErrorCode(errno));
    }
    FileDescriptorGuard fd_guard(fd);

    if (auto res = WriteFully(fd, data); !res) {
        // Leave nothing half-created behind
        fd_guard.reset();
        if (::unlink(full_path.c_str()) == -1 && errno != ENOENT) {
            spdlog::warn(
                "CreateExclusive: failed to remove partial '{}': {}", full_path.string(),
                std::strerror(errno)
            );
        }
        return std::unexpected(res.error());
    }

    return {};
}

StorageResult<void> LocalStorage::CreateDirectory(const std::filesystem::path& relative_path)
{
    auto full_path = GetValidatedFullPath(relative_path);
    if (full_path.empty())
        return std::unexpected(make_error_code(StorageErrc::InvalidPath));

    std::error_code ec;
    if (!std::filesystem::create_directories(full_path, ec) && ec)
        return std::unexpected(MapFilesystemError(ec));
    if (!std::filesystem::is_directory(full_path, ec))
        return std::unexpected(make_error_code(StorageErrc::NotADirectory));

    return {};
}

StorageResult<void> LocalStorage::Link(
    const std::filesystem::path& from_relative_path, const std::filesystem::path& to_relative_path
)
{
    auto from_full = GetValidatedFullPath(from_relative_path);
    if (from_full.empty())
        return std::unexpected(make_error_code(StorageErrc::InvalidPath));
    auto to_full = GetValidatedFullPath(to_relative_path);
    if (to_full.empty())
        return std::unexpected(make_error_code(StorageErrc::InvalidPath));

    if (auto res = EnsureParentDirectory(to_full); !res) {
        return std::unexpected(res.error());
    }

    if (::link(from_full.c_str(), to_full.c_str()) == -1) {
        return std::unexpected(ErrnoToErrorCode(errno));
    }

    return {};
}

StorageResult<void> LocalStorage::Move(
    const std::filesystem::path& from_relative_path, const std::filesystem::path& to_relative_path
)
{
    auto from_full = GetValidatedFullPath(from_relative_path);
    if (from_full.empty())
        return std::unexpected(make_error_code(StorageErrc::InvalidPath));
    auto to_full = GetValidatedFullPath(to_relative_path);
    if (to_full.empty())
        return std::unexpected(make_error_code(StorageErrc::InvalidPath));

    if (auto res = EnsureParentDirectory(to_full); !res) {
        return std::unexpected(res.error());
    }

    if (::rename(from_full.c_str(), to_full.c_str()) == -1) {
        return std::unexpected(ErrnoToErrorCode(errno));
    }

    return {};
}

StorageResult<std::unique_ptr<IStorageListing>> LocalStorage::List(
    const std::filesystem::path& relative_dir, const std::string& extension
) const
{
    auto full_path =
        relative_dir.empty() ? RelativeToAbsPath(".") : GetValidatedFullPath(relative_dir);
    if (full_path.empty()) {
        return std::unexpected(make_error_code(StorageErrc::InvalidPath));
    }

    std::error_code ec;
    auto base_can = fs::weakly_canonical(base_path_, ec);
    if (ec) {
        return std::unexpected(MapFilesystemError(ec));
    }

    auto listing = std::make_unique<LocalStorageListing>(base_can, full_path, extension);
    if (auto res = listing->Restart(); !res) {
        return std::unexpected(res.error());
    }
    return std::unique_ptr<IStorageListing>(std::move(listing));
}

StorageResult<void> LocalStorage::UpdateLocked(
    const std::filesystem::path& relative_path, const UpdateFn& update
)
{
    auto full_path = GetValidatedFullPath(relative_path);
    if (full_path.empty())
        return std::unexpected(make_error_code(StorageErrc::InvalidPath));

    if (auto res = EnsureParentDirectory(full_path); !res) {
        return std::unexpected(res.error());
    }

    // The .lck sibling is never deleted: removing it would let two processes
    // hold flocks on different inodes for the same file.
    const fs::path lock_path =
        full_path.parent_path() / ("." + full_path.filename().string() + ".lck");
    constexpr mode_t default_mode = S_IRUSR | S_IWUSR | S_IRGRP | S_IROTH;
    int lock_fd = ::open(lock_path.c_str(), O_RDWR | O_CREAT | O_CLOEXEC, default_mode);
    if (lock_fd < 0) {
        return std::unexpected(ErrnoToErrorCode(errno));
    }
    FileDescriptorGuard lock_guard(lock_fd);

    while (::flock(lock_fd, LOCK_EX) == -1) {
        if (errno != EINTR) {
            return std::unexpected(ErrnoToErrorCode(errno));
        }
    }

    std::optional<Bytes> current;
    auto read_res = ReadAll(relative_path);
    if (read_res) {
        current = std::move(read_res.value());
    } else if (read_res.error() != make_error_code(StorageErrc::FileNotFound)) {
        return std::unexpected(read_res.error());
    }

    auto updated = update(current);
    if (!updated) {
        return std::unexpected(updated.error());
    }

    if (updated->empty()) {
        if (current.has_value()) {
            return Remove(relative_path);
        }
        return {};
    }
    return WriteAtomic(relative_path, *updated);
}

}  // namespace FileCache::Storage
