#ifndef FILECACHE_SRC_CACHE_ENTRY_CODEC_HPP_
#define FILECACHE_SRC_CACHE_ENTRY_CODEC_HPP_

#include "cache/clock.hpp"
#include "cache/key_codec.hpp"
#include "storage/i_storage.hpp"
#include "storage/storage_error.hpp"

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <span>
#include <string>
#include <vector>

namespace FileCache::Cache
{

using Storage::Bytes;

struct EntryHeader {
    std::string key;
    SystemTimePoint created_at;
    std::optional<SystemTimePoint> expires_at;  ///< Empty means the entry never expires
    std::vector<std::string> tags;              ///< Sorted, unique
    std::uint64_t payload_length = 0;

    bool IsExpired(SystemTimePoint now) const { return expires_at && now >= *expires_at; }
};

struct CacheEntry {
    EntryHeader header;
    Bytes payload;
    SystemTimePoint last_accessed_at;  ///< Entry file mtime; not part of the encoding
};

/**
 * @brief Binary layout of an entry file.
 *
 * A fixed 48-byte header (magic, version, timestamps, section lengths and two
 * FNV-1a checksums) is followed by a metadata section holding the key and tags,
 * then the opaque payload. Expiry and tags are therefore readable without
 * touching the payload. All integers are little-endian.
 */
class EntryCodec
{
    public:
    static constexpr std::size_t kFixedHeaderSize = 48;
    static constexpr std::uint32_t kMagic         = 0x31454346;  // "FCE1"
    static constexpr std::uint8_t kVersion        = 1;

    static Bytes Encode(const EntryHeader& header, std::span<const std::byte> payload);

    /// Full decode; fails with CorruptEntry on any truncation or mismatch.
    static StorageResult<CacheEntry> Decode(std::span<const std::byte> bytes);

    /// Decodes the header and metadata only. `bytes` may be the whole file or
    /// just its first HeaderLength() bytes.
    static StorageResult<EntryHeader> DecodeHeader(std::span<const std::byte> bytes);

    /// Size of header plus metadata, read from the first kFixedHeaderSize bytes.
    static StorageResult<std::size_t> HeaderLength(std::span<const std::byte> fixed_header);

    static std::uint32_t Checksum(
        std::span<const std::byte> data, std::uint32_t seed = 2166136261u
    );
};

/// Reads only the header and metadata of the entry file at `location`.
StorageResult<EntryHeader> LoadEntryHeader(
    const Storage::IStorage& storage, const std::filesystem::path& location
);

/// Reads and fully decodes the entry file at `location`, filling in
/// last_accessed_at from the file's modification time.
StorageResult<CacheEntry> LoadEntry(
    const Storage::IStorage& storage, const std::filesystem::path& location
);

}  // namespace FileCache::Cache

#endif  // FILECACHE_SRC_CACHE_ENTRY_CODEC_HPP_
