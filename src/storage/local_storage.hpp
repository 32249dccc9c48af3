#ifndef FILECACHE_SRC_STORAGE_LOCAL_STORAGE_HPP_
#define FILECACHE_SRC_STORAGE_LOCAL_STORAGE_HPP_

#include "storage/i_storage.hpp"

#include <filesystem>
#include <string>
#include <system_error>

namespace FileCache::Storage
{

namespace fs = std::filesystem;

class LocalStorage : public IStorage
{
    public:
    explicit LocalStorage(std::filesystem::path base_path);
    ~LocalStorage() override = default;

    LocalStorage(const LocalStorage&)            = delete;
    LocalStorage& operator=(const LocalStorage&) = delete;
    LocalStorage(LocalStorage&&)                 = delete;
    LocalStorage& operator=(LocalStorage&&)      = delete;

    const std::filesystem::path& GetPath() const override { return base_path_; }

    StorageResult<Bytes> ReadAll(const std::filesystem::path& relative_path) const override;
    StorageResult<std::size_t> Read(
        const std::filesystem::path& relative_path, off_t offset, std::span<std::byte> buffer
    ) const override;
    StorageResult<void> WriteAtomic(
        const std::filesystem::path& relative_path, std::span<const std::byte> data,
        std::optional<TimePoint> modification_time = std::nullopt
    ) override;
    StorageResult<void> Remove(const std::filesystem::path& relative_path) override;

    StorageResult<bool> CheckIfFileExists(const std::filesystem::path& relative_path
    ) const override;
    StorageResult<struct stat> GetAttributes(const std::filesystem::path& relative_path
    ) const override;
    StorageResult<void> Touch(
        const std::filesystem::path& relative_path, TimePoint modification_time
    ) override;

    StorageResult<void> CreateExclusive(
        const std::filesystem::path& relative_path, std::span<const std::byte> data
    ) override;
    StorageResult<void> Move(
        const std::filesystem::path& from_relative_path,
        const std::filesystem::path& to_relative_path
    ) override;
    StorageResult<void> Link(
        const std::filesystem::path& from_relative_path,
        const std::filesystem::path& to_relative_path
    ) override;
    StorageResult<void> CreateDirectory(const std::filesystem::path& relative_path) override;

    StorageResult<std::unique_ptr<IStorageListing>> List(
        const std::filesystem::path& relative_dir, const std::string& extension
    ) const override;

    StorageResult<void> UpdateLocked(
        const std::filesystem::path& relative_path, const UpdateFn& update
    ) override;
    StorageResult<std::size_t> RemoveStaleTemporaries(
        const std::filesystem::path& relative_dir, TimePoint older_than
    ) override;

    StorageResult<void> Initialize() override;

    std::filesystem::path RelativeToAbsPath(const std::filesystem::path& relative_path
    ) const override;

    private:
    std::filesystem::path GetValidatedFullPath(const std::filesystem::path& relative_path) const;
    StorageResult<void> EnsureParentDirectory(const std::filesystem::path& full_path) const;

    fs::path base_path_;
};

}  // namespace FileCache::Storage

#endif  // FILECACHE_SRC_STORAGE_LOCAL_STORAGE_HPP_
