#ifndef FILECACHE_SRC_CACHE_TAG_INDEX_HPP_
#define FILECACHE_SRC_CACHE_TAG_INDEX_HPP_

#include "cache/key_codec.hpp"
#include "storage/i_storage.hpp"
#include "storage/storage_error.hpp"

#include <compare>
#include <cstddef>
#include <filesystem>
#include <memory>
#include <set>
#include <string>
#include <vector>

namespace FileCache::Cache
{

/// One entry referenced by a tag document.
struct EntryRef {
    std::string scope;     ///< Scope path relative to the root, generic form
    std::string key;       ///< Full key, including the scope's key prefix
    std::string location;  ///< Entry file relative to the root, generic form

    auto operator<=>(const EntryRef&) const = default;
};

/**
 * @brief Persistent tag -> entries association.
 *
 * Each tag owns one JSON document under `.filecache/tags`, named by the
 * SHA-256 of the tag. Every mutation goes through IStorage::UpdateLocked so
 * concurrent processes attaching to the same tag never lose references.
 */
class TagIndex
{
    public:
    explicit TagIndex(std::shared_ptr<Storage::IStorage> storage);

    StorageResult<void> Attach(const std::string& tag, const EntryRef& ref);
    StorageResult<void> Detach(const std::string& tag, const EntryRef& ref);

    StorageResult<std::set<EntryRef>> KeysFor(const std::string& tag) const;

    /// Removes every entry still labelled with one of `tags`, then drops the
    /// tag documents. Returns the number of entry files removed.
    StorageResult<std::size_t> Flush(const std::vector<std::string>& tags);

    /// Forgets every reference whose scope is exactly `scope_path`.
    StorageResult<std::size_t> DropScope(const std::string& scope_path);

    /// Names of all tags that currently have a document.
    StorageResult<std::vector<std::string>> ListTags() const;

    static std::filesystem::path TagsDirectory();

    private:
    StorageResult<std::filesystem::path> DocumentLocation(const std::string& tag) const;

    std::shared_ptr<Storage::IStorage> storage_;
};

}  // namespace FileCache::Cache

#endif  // FILECACHE_SRC_CACHE_TAG_INDEX_HPP_
