#ifndef FILECACHE_SRC_CACHE_KEY_CODEC_HPP_
#define FILECACHE_SRC_CACHE_KEY_CODEC_HPP_

#include "storage/storage_error.hpp"

#include <cstddef>
#include <filesystem>
#include <string>
#include <string_view>
#include <utility>

namespace FileCache::Cache
{

namespace fs = std::filesystem;

template <typename T>
using StorageResult = Storage::StorageResult<T>;

/**
 * @brief Immutable description of where a group of entries lives.
 *
 * A scope is a relative directory under the cache root plus the key prefix and
 * file extension applied to every entry in it. Derivation functions return new
 * scopes; a Scope is never modified after construction.
 */
class Scope
{
    public:
    Scope(std::string extension, std::string key_prefix)
        : extension_(std::move(extension)), key_prefix_(std::move(key_prefix))
    {
    }

    /// Nested scope: `sub` may contain several '/'-separated segments.
    StorageResult<Scope> WithPath(std::string_view sub) const;
    Scope WithPrefix(std::string key_prefix) const;

    const fs::path& GetPath() const { return path_; }
    std::string GetPathString() const { return path_.generic_string(); }
    const std::string& GetKeyPrefix() const { return key_prefix_; }
    const std::string& GetExtension() const { return extension_; }

    bool operator==(const Scope& other) const = default;

    static bool IsValidSegment(std::string_view segment);

    private:
    fs::path path_;
    std::string extension_;
    std::string key_prefix_;
};

class KeyCodec
{
    public:
    explicit KeyCodec(std::size_t max_key_length) : max_key_length_(max_key_length) {}

    /// Location of the entry for `key` relative to the cache root.
    StorageResult<fs::path> Resolve(const Scope& scope, std::string_view key) const;

    StorageResult<void> ValidateKey(std::string_view key) const;

    std::size_t GetMaxKeyLength() const { return max_key_length_; }

    static StorageResult<std::string> Sha256Hex(std::string_view data);

    private:
    std::size_t max_key_length_;
};

}  // namespace FileCache::Cache

#endif  // FILECACHE_SRC_CACHE_KEY_CODEC_HPP_
