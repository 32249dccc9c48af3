#ifndef FILECACHE_SRC_STORAGE_STORAGE_ERROR_HPP_
#define FILECACHE_SRC_STORAGE_STORAGE_ERROR_HPP_

#include <cerrno>
#include <expected>
#include <stdexcept>
#include <string>
#include <system_error>
#include <type_traits>

namespace FileCache::Storage
{

//------------------------------------------------------------------------------//
// Error Codes declared for Storage/Cache Operations
//------------------------------------------------------------------------------//

// clang-format off
enum class StorageErrc {
    Success = 0,       // Not an error
    FileNotFound,      // Path does not exist
    PermissionDenied,  // Operation not permitted
    IOError,           // General I/O error during read/write/etc.
    NotSupported,      // Operation is not supported by the filesystem
    OutOfSpace,        // No space left on the storage medium
    AlreadyExists,     // Exclusive create hit an existing file
    NotADirectory,     // Expected a directory, found a file
    IsADirectory,      // Expected a file, found a directory
    NotEmpty,          // Attempted to remove a non-empty directory
    InvalidPath,       // Path escapes the cache root or has an unsafe segment
    InvalidKey,        // Cache key is empty or too long
    CorruptEntry,      // Entry bytes failed to decode
    LockTimeout,       // Lock could not be acquired within the requested window
    EvictionError,     // Failed to evict items to honor the size bound
    MetadataError,     // Error reading or writing auxiliary index/lock files
    UnknownError,      // An unspecified error occurred
};
// clang-format on

std::error_code make_error_code(StorageErrc e);

inline StorageErrc ErrnoToStorageErrc(int err_no)
{
    switch (err_no) {
        case 0:
            return StorageErrc::Success;
        case ENOENT:
            return StorageErrc::FileNotFound;
        case EACCES:
        case EPERM:
        case EROFS:
            return StorageErrc::PermissionDenied;
        case EIO:
            return StorageErrc::IOError;
        case ENOSPC:
        case EDQUOT:
            return StorageErrc::OutOfSpace;
        case EEXIST:
            return StorageErrc::AlreadyExists;
        case ENOTDIR:
            return StorageErrc::NotADirectory;
        case EISDIR:
            return StorageErrc::IsADirectory;
        case ENOTEMPTY:
            return StorageErrc::NotEmpty;
        case ENAMETOOLONG:
            return StorageErrc::InvalidPath;
        case EOPNOTSUPP:
            return StorageErrc::NotSupported;

        default:
            return StorageErrc::UnknownError;
    }
}

//------------------------------------------------------------------------------//
// Error Category Definition (Private Implementation Detail)
//------------------------------------------------------------------------------//
namespace detail
{
class StorageErrorCategory : public std::error_category
{
    public:
    const char* name() const noexcept override { return "FileCache::Storage"; }
    std::string message(int ev) const override
    {
        switch (static_cast<StorageErrc>(ev)) {
            case StorageErrc::Success:
                return "Success";
            case StorageErrc::FileNotFound:
                return "File or directory not found";
            case StorageErrc::PermissionDenied:
                return "Permission denied";
            case StorageErrc::IOError:
                return "Input/output error";
            case StorageErrc::NotSupported:
                return "Operation not supported";
            case StorageErrc::OutOfSpace:
                return "No space left on device";
            case StorageErrc::AlreadyExists:
                return "File already exists";
            case StorageErrc::NotADirectory:
                return "Path is not a directory";
            case StorageErrc::IsADirectory:
                return "Path is a directory";
            case StorageErrc::NotEmpty:
                return "Directory not empty";
            case StorageErrc::InvalidPath:
                return "Invalid path";
            case StorageErrc::InvalidKey:
                return "Invalid cache key";
            case StorageErrc::CorruptEntry:
                return "Cache entry is corrupt";
            case StorageErrc::LockTimeout:
                return "Lock acquisition timed out";
            case StorageErrc::EvictionError:
                return "Cache eviction failed";
            case StorageErrc::MetadataError:
                return "Error reading or writing cache metadata";
            case StorageErrc::UnknownError:
                return "Unknown storage/cache error";
            default:
                return "Unrecognized error code";
        }
    }
};
}  // namespace detail

// Global instance of the category
inline const detail::StorageErrorCategory storage_error_category;

// Make the enum usable with std::error_code
inline std::error_code make_error_code(StorageErrc e)
{
    return {static_cast<int>(e), storage_error_category};
}

// Maps std::filesystem / system error codes onto StorageErrc.
inline std::error_code MapFilesystemError(const std::error_code& ec)
{
    if (!ec)
        return {};
    if (ec.category() == storage_error_category)
        return ec;
    if (ec.category() == std::generic_category() || ec.category() == std::system_category()) {
        return make_error_code(ErrnoToStorageErrc(ec.value()));
    }
    return make_error_code(StorageErrc::UnknownError);
}

//------------------------------------------------------------------------------//
// Custom Exception Type
//------------------------------------------------------------------------------//
class StorageException : public std::runtime_error
{
    private:
    std::error_code ec_;

    public:
    explicit StorageException(std::error_code ec) : std::runtime_error(ec.message()), ec_(ec) {}

    const std::error_code& code() const noexcept { return ec_; }
};

//------------------------------------------------------------------------------//
// Result Type Alias
//------------------------------------------------------------------------------//
template <typename T>
using StorageResult = std::expected<T, std::error_code>;

}  // namespace FileCache::Storage

// Enable std::error_code implicit conversion for StorageErrc
namespace std
{
template <>
struct is_error_code_enum<FileCache::Storage::StorageErrc> : true_type {
};
}  // namespace std

#endif  // FILECACHE_SRC_STORAGE_STORAGE_ERROR_HPP_
