#include "cache/entry_codec.hpp"

#include <spdlog/spdlog.h>
#include <algorithm>
#include <chrono>
#include <cstring>

namespace FileCache::Cache
{

using Storage::make_error_code;
using Storage::StorageErrc;

namespace
{

// Field offsets within the fixed header
constexpr std::size_t kOffMagic           = 0;
constexpr std::size_t kOffVersion         = 4;
constexpr std::size_t kOffCreatedAt       = 8;
constexpr std::size_t kOffExpiresAt       = 16;
constexpr std::size_t kOffMetaLength      = 24;
constexpr std::size_t kOffTagCount        = 28;
constexpr std::size_t kOffPayloadLength   = 32;
constexpr std::size_t kOffPayloadChecksum = 40;
constexpr std::size_t kOffHeaderChecksum  = 44;

constexpr std::int64_t kNeverExpires = -1;

void PutU32(Bytes& out, std::size_t at, std::uint32_t v)
{
    for (int i = 0; i < 4; ++i)
        out[at + i] = static_cast<std::byte>((v >> (8 * i)) & 0xFF);
}

void PutU64(Bytes& out, std::size_t at, std::uint64_t v)
{
    for (int i = 0; i < 8; ++i)
        out[at + i] = static_cast<std::byte>((v >> (8 * i)) & 0xFF);
}

void AppendU32(Bytes& out, std::uint32_t v)
{
    out.resize(out.size() + 4);
    PutU32(out, out.size() - 4, v);
}

void AppendString(Bytes& out, const std::string& s)
{
    AppendU32(out, static_cast<std::uint32_t>(s.size()));
    const auto* p = reinterpret_cast<const std::byte*>(s.data());
    out.insert(out.end(), p, p + s.size());
}

std::uint32_t GetU32(std::span<const std::byte> in, std::size_t at)
{
    std::uint32_t v = 0;
    for (int i = 0; i < 4; ++i)
        v |= static_cast<std::uint32_t>(std::to_integer<std::uint8_t>(in[at + i])) << (8 * i);
    return v;
}

std::uint64_t GetU64(std::span<const std::byte> in, std::size_t at)
{
    std::uint64_t v = 0;
    for (int i = 0; i < 8; ++i)
        v |= static_cast<std::uint64_t>(std::to_integer<std::uint8_t>(in[at + i])) << (8 * i);
    return v;
}

std::unexpected<std::error_code> Corrupt(const char* reason)
{
    spdlog::debug("EntryCodec: corrupt entry ({})", reason);
    return std::unexpected(make_error_code(StorageErrc::CorruptEntry));
}

// Reads a u32-length-prefixed string, advancing `pos`.
bool ReadString(std::span<const std::byte> meta, std::size_t& pos, std::string& out)
{
    if (meta.size() - pos < 4)
        return false;
    const std::uint32_t len = GetU32(meta, pos);
    pos += 4;
    if (meta.size() - pos < len)
        return false;
    out.assign(reinterpret_cast<const char*>(meta.data() + pos), len);
    pos += len;
    return true;
}

}  // namespace

std::uint32_t EntryCodec::Checksum(std::span<const std::byte> data, std::uint32_t seed)
{
    std::uint32_t sum = seed;
    for (std::byte b : data) {
        sum ^= std::to_integer<std::uint8_t>(b);
        sum *= 16777619u;
    }
    return sum;
}

Bytes EntryCodec::Encode(const EntryHeader& header, std::span<const std::byte> payload)
{
    std::vector<std::string> tags = header.tags;
    std::ranges::sort(tags);
    tags.erase(std::unique(tags.begin(), tags.end()), tags.end());

    Bytes meta;
    AppendString(meta, header.key);
    for (const auto& tag : tags) {
        AppendString(meta, tag);
    }

    Bytes out(kFixedHeaderSize, std::byte{0});
    PutU32(out, kOffMagic, kMagic);
    out[kOffVersion] = static_cast<std::byte>(kVersion);
    PutU64(out, kOffCreatedAt, static_cast<std::uint64_t>(ToEpochMillis(header.created_at)));
    const std::int64_t expires =
        header.expires_at ? ToEpochMillis(*header.expires_at) : kNeverExpires;
    PutU64(out, kOffExpiresAt, static_cast<std::uint64_t>(expires));
    PutU32(out, kOffMetaLength, static_cast<std::uint32_t>(meta.size()));
    PutU32(out, kOffTagCount, static_cast<std::uint32_t>(tags.size()));
    PutU64(out, kOffPayloadLength, static_cast<std::uint64_t>(payload.size()));
    PutU32(out, kOffPayloadChecksum, Checksum(payload));

    std::uint32_t header_sum = Checksum(std::span<const std::byte>(out).first(kOffHeaderChecksum));
    header_sum               = Checksum(meta, header_sum);
    PutU32(out, kOffHeaderChecksum, header_sum);

    out.reserve(kFixedHeaderSize + meta.size() + payload.size());
    out.insert(out.end(), meta.begin(), meta.end());
    out.insert(out.end(), payload.begin(), payload.end());
    return out;
}

StorageResult<std::size_t> EntryCodec::HeaderLength(std::span<const std::byte> fixed_header)
{
    if (fixed_header.size() < kFixedHeaderSize)
        return Corrupt("truncated fixed header");
    if (GetU32(fixed_header, kOffMagic) != kMagic)
        return Corrupt("bad magic");
    if (std::to_integer<std::uint8_t>(fixed_header[kOffVersion]) != kVersion)
        return Corrupt("unsupported version");
    return kFixedHeaderSize + static_cast<std::size_t>(GetU32(fixed_header, kOffMetaLength));
}

StorageResult<EntryHeader> EntryCodec::DecodeHeader(std::span<const std::byte> bytes)
{
    auto header_len = HeaderLength(bytes);
    if (!header_len)
        return std::unexpected(header_len.error());
    if (bytes.size() < *header_len)
        return Corrupt("truncated metadata");

    const auto meta = bytes.subspan(kFixedHeaderSize, *header_len - kFixedHeaderSize);
    std::uint32_t header_sum = Checksum(bytes.first(kOffHeaderChecksum));
    header_sum               = Checksum(meta, header_sum);
    if (header_sum != GetU32(bytes, kOffHeaderChecksum))
        return Corrupt("header checksum mismatch");

    EntryHeader header;
    const auto created_ms = static_cast<std::int64_t>(GetU64(bytes, kOffCreatedAt));
    const auto expires_ms = static_cast<std::int64_t>(GetU64(bytes, kOffExpiresAt));
    header.created_at     = FromEpochMillis(created_ms);
    if (expires_ms != kNeverExpires) {
        if (expires_ms < created_ms)
            return Corrupt("expiry precedes creation");
        header.expires_at = FromEpochMillis(expires_ms);
    }
    header.payload_length = GetU64(bytes, kOffPayloadLength);

    std::size_t pos = 0;
    if (!ReadString(meta, pos, header.key))
        return Corrupt("truncated key");
    const std::uint32_t tag_count = GetU32(bytes, kOffTagCount);
    header.tags.reserve(std::min<std::size_t>(tag_count, meta.size() / 4));
    for (std::uint32_t i = 0; i < tag_count; ++i) {
        std::string tag;
        if (!ReadString(meta, pos, tag))
            return Corrupt("truncated tag list");
        header.tags.push_back(std::move(tag));
    }
    if (pos != meta.size())
        return Corrupt("trailing metadata bytes");

    return header;
}

StorageResult<CacheEntry> EntryCodec::Decode(std::span<const std::byte> bytes)
{
    auto header = DecodeHeader(bytes);
    if (!header)
        return std::unexpected(header.error());

    auto header_len = HeaderLength(bytes);
    if (!header_len)
        return std::unexpected(header_len.error());

    const std::size_t available = bytes.size() - *header_len;
    if (header->payload_length != available)
        return Corrupt("payload length mismatch");

    const auto payload = bytes.subspan(*header_len);
    if (Checksum(payload) != GetU32(bytes, kOffPayloadChecksum))
        return Corrupt("payload checksum mismatch");

    CacheEntry entry;
    entry.header = std::move(header.value());
    entry.payload.assign(payload.begin(), payload.end());
    return entry;
}

StorageResult<EntryHeader> LoadEntryHeader(
    const Storage::IStorage& storage, const std::filesystem::path& location
)
{
    Bytes fixed(EntryCodec::kFixedHeaderSize);
    auto read_res = storage.Read(location, 0, fixed);
    if (!read_res)
        return std::unexpected(read_res.error());
    fixed.resize(*read_res);

    auto header_len = EntryCodec::HeaderLength(fixed);
    if (!header_len)
        return std::unexpected(header_len.error());

    // The metadata length comes from the file; bound it by the file size
    // before allocating.
    auto attr = storage.GetAttributes(location);
    if (!attr)
        return std::unexpected(attr.error());
    if (*header_len > static_cast<std::uint64_t>(attr->st_size))
        return Corrupt("metadata length exceeds file size");

    Bytes head(*header_len);
    read_res = storage.Read(location, 0, head);
    if (!read_res)
        return std::unexpected(read_res.error());
    head.resize(*read_res);
    return EntryCodec::DecodeHeader(head);
}

StorageResult<CacheEntry> LoadEntry(
    const Storage::IStorage& storage, const std::filesystem::path& location
)
{
    auto bytes = storage.ReadAll(location);
    if (!bytes)
        return std::unexpected(bytes.error());

    auto entry = EntryCodec::Decode(*bytes);
    if (!entry)
        return std::unexpected(entry.error());

    if (auto attr = storage.GetAttributes(location); attr) {
        entry->last_accessed_at =
            SystemTimePoint(std::chrono::duration_cast<SystemTimePoint::duration>(
                std::chrono::seconds(attr->st_mtim.tv_sec) +
                std::chrono::nanoseconds(attr->st_mtim.tv_nsec)
            ));
    } else {
        entry->last_accessed_at = entry->header.created_at;
    }
    return entry;
}

}  // namespace FileCache::Cache
