#include "cache/entry_codec.hpp"
#include "storage/local_storage.hpp"
#include "test_utils.hpp"

#include <gtest/gtest.h>
#include <chrono>

using namespace FileCache::Cache;
using FileCache::Storage::StorageErrc;
using FileCache::Testing::TempDirectory;

namespace
{

EntryHeader MakeHeader()
{
    EntryHeader header;
    header.key        = "user:1";
    header.created_at = FromEpochMillis(1'700'000'000'000);
    header.expires_at = FromEpochMillis(1'700'000'060'000);
    header.tags       = {"users", "profile"};
    return header;
}

}  // namespace

TEST(EntryCodecTest, RoundTripsBinaryPayload)
{
    Bytes payload;
    for (int i = 0; i < 256; ++i)
        payload.push_back(static_cast<std::byte>(i));

    const Bytes encoded = EntryCodec::Encode(MakeHeader(), payload);
    auto decoded        = EntryCodec::Decode(encoded);
    ASSERT_TRUE(decoded.has_value());
    EXPECT_EQ(decoded->payload, payload);
    EXPECT_EQ(decoded->header.key, "user:1");
    EXPECT_EQ(decoded->header.created_at, FromEpochMillis(1'700'000'000'000));
    ASSERT_TRUE(decoded->header.expires_at.has_value());
    EXPECT_EQ(*decoded->header.expires_at, FromEpochMillis(1'700'000'060'000));
    // Tags come back sorted
    EXPECT_EQ(decoded->header.tags, (std::vector<std::string>{"profile", "users"}));
}

TEST(EntryCodecTest, EmptyPayloadAndNoExpiry)
{
    EntryHeader header = MakeHeader();
    header.expires_at.reset();
    header.tags.clear();

    auto decoded = EntryCodec::Decode(EntryCodec::Encode(header, {}));
    ASSERT_TRUE(decoded.has_value());
    EXPECT_TRUE(decoded->payload.empty());
    EXPECT_FALSE(decoded->header.expires_at.has_value());
    EXPECT_FALSE(decoded->header.IsExpired(FromEpochMillis(4'000'000'000'000)));
}

TEST(EntryCodecTest, HeaderDecodesWithoutPayload)
{
    const Bytes payload(1000, std::byte{0x7f});
    const Bytes encoded = EntryCodec::Encode(MakeHeader(), payload);

    auto len = EntryCodec::HeaderLength(encoded);
    ASSERT_TRUE(len.has_value());
    ASSERT_LT(*len, encoded.size());

    auto header = EntryCodec::DecodeHeader(std::span<const std::byte>(encoded).first(*len));
    ASSERT_TRUE(header.has_value());
    EXPECT_EQ(header->payload_length, 1000u);
    EXPECT_EQ(header->tags.size(), 2u);
}

TEST(EntryCodecTest, TruncationIsCorrupt)
{
    const Bytes encoded = EntryCodec::Encode(MakeHeader(), Bytes(64, std::byte{1}));
    for (std::size_t cut : {std::size_t{0}, std::size_t{10}, std::size_t{47}, encoded.size() - 1}) {
        auto res = EntryCodec::Decode(std::span<const std::byte>(encoded).first(cut));
        ASSERT_FALSE(res.has_value()) << "cut at " << cut;
        EXPECT_EQ(res.error(), StorageErrc::CorruptEntry);
    }
}

TEST(EntryCodecTest, FlippedBitsAreDetected)
{
    Bytes encoded = EntryCodec::Encode(MakeHeader(), Bytes(64, std::byte{1}));

    Bytes payload_flip = encoded;
    payload_flip.back() ^= std::byte{0x01};
    EXPECT_EQ(EntryCodec::Decode(payload_flip).error(), StorageErrc::CorruptEntry);

    Bytes header_flip = encoded;
    header_flip[20] ^= std::byte{0x01};  // inside expires_at
    EXPECT_EQ(EntryCodec::Decode(header_flip).error(), StorageErrc::CorruptEntry);

    Bytes magic_flip = encoded;
    magic_flip[0] ^= std::byte{0xff};
    EXPECT_EQ(EntryCodec::Decode(magic_flip).error(), StorageErrc::CorruptEntry);
}

TEST(EntryCodecTest, OversizedMetadataLengthIsCorrupt)
{
    TempDirectory dir;
    FileCache::Storage::LocalStorage storage(dir.Path());
    ASSERT_TRUE(storage.Initialize().has_value());

    // Valid magic and version, but a metadata length far past the end of the file.
    Bytes fixed = EntryCodec::Encode(MakeHeader(), Bytes{});
    fixed.resize(EntryCodec::kFixedHeaderSize);
    for (std::size_t i = 24; i < 28; ++i)
        fixed[i] = std::byte{0xff};
    ASSERT_TRUE(storage.WriteAtomic("k.cache", fixed).has_value());

    auto header = LoadEntryHeader(storage, "k.cache");
    ASSERT_FALSE(header.has_value());
    EXPECT_EQ(header.error(), StorageErrc::CorruptEntry);
}

TEST(EntryHeaderTest, ExpiryIsInclusive)
{
    EntryHeader header = MakeHeader();
    EXPECT_FALSE(header.IsExpired(FromEpochMillis(1'700'000'059'999)));
    EXPECT_TRUE(header.IsExpired(FromEpochMillis(1'700'000'060'000)));
}
