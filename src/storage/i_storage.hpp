#ifndef FILECACHE_SRC_STORAGE_I_STORAGE_HPP_
#define FILECACHE_SRC_STORAGE_I_STORAGE_HPP_

#include "storage/storage_error.hpp"

#include <sys/stat.h>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <expected>
#include <filesystem>
#include <functional>
#include <memory>
#include <optional>
#include <span>
#include <string>
#include <system_error>
#include <vector>

namespace FileCache::Storage
{

namespace fs = std::filesystem;

using Bytes     = std::vector<std::byte>;
using TimePoint = std::chrono::system_clock::time_point;

struct ListedEntry {
    fs::path relative_path;  ///< Relative to the storage root
    struct stat attributes;
};

/**
 * @brief Lazy, restartable cursor over the entry files of one directory.
 *
 * Entries are produced one at a time from the underlying directory traversal,
 * so files deleted concurrently before they are reached are simply never
 * yielded. Iteration always terminates.
 */
class IStorageListing
{
    public:
    virtual ~IStorageListing() = default;

    /// Next entry, std::nullopt at the end, or an error if traversal failed.
    virtual StorageResult<std::optional<ListedEntry>> Next() = 0;
    virtual StorageResult<void> Restart()                    = 0;
};

/// Computes the new contents of a locked file from its current contents
/// (std::nullopt when the file does not exist). An empty result removes the file.
using UpdateFn = std::function<StorageResult<Bytes>(const std::optional<Bytes>& current)>;

class IStorage
{
    public:
    virtual ~IStorage() = default;

    [[nodiscard]] virtual const std::filesystem::path& GetPath() const = 0;

    virtual StorageResult<Bytes> ReadAll(const std::filesystem::path& relative_path) const = 0;

    virtual StorageResult<std::size_t> Read(
        const std::filesystem::path& relative_path, off_t offset, std::span<std::byte> buffer
    ) const = 0;

    /// Replaces the file contents so that readers observe either the old or
    /// the new version, never a mix.
    virtual StorageResult<void> WriteAtomic(
        const std::filesystem::path& relative_path, std::span<const std::byte> data,
        std::optional<TimePoint> modification_time = std::nullopt
    ) = 0;

    virtual StorageResult<void> Remove(const std::filesystem::path& relative_path) = 0;

    virtual StorageResult<bool> CheckIfFileExists(const std::filesystem::path& relative_path
    ) const = 0;

    virtual StorageResult<struct stat> GetAttributes(const std::filesystem::path& relative_path
    ) const = 0;

    virtual StorageResult<void> Touch(
        const std::filesystem::path& relative_path, TimePoint modification_time
    ) = 0;

    /// Creates the file only if it does not exist yet (AlreadyExists otherwise).
    virtual StorageResult<void> CreateExclusive(
        const std::filesystem::path& relative_path, std::span<const std::byte> data
    ) = 0;

    virtual StorageResult<void> Move(
        const fs::path& from_relative_path, const fs::path& to_relative_path
    ) = 0;

    virtual StorageResult<void> Link(
        const fs::path& from_relative_path, const fs::path& to_relative_path
    ) = 0;

    virtual StorageResult<void> CreateDirectory(const std::filesystem::path& relative_path) = 0;

    virtual StorageResult<std::unique_ptr<IStorageListing>> List(
        const std::filesystem::path& relative_dir, const std::string& extension
    ) const = 0;

    virtual StorageResult<void> UpdateLocked(
        const std::filesystem::path& relative_path, const UpdateFn& update
    ) = 0;

    /// Deletes temporaries left in `relative_dir` by writers that died before
    /// renaming them, if last modified before `older_than`. Returns the count.
    virtual StorageResult<std::size_t> RemoveStaleTemporaries(
        const std::filesystem::path& relative_dir, TimePoint older_than
    ) = 0;

    virtual StorageResult<void> Initialize() = 0;

    virtual std::filesystem::path RelativeToAbsPath(const std::filesystem::path& relative_path
    ) const = 0;
};

}  // namespace FileCache::Storage

#endif  // FILECACHE_SRC_STORAGE_I_STORAGE_HPP_
