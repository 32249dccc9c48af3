#include "cache/tag_index.hpp"
#include "app_constants.hpp"
#include "cache/entry_codec.hpp"

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>
#include <algorithm>
#include <utility>

namespace FileCache::Cache
{

using Storage::make_error_code;
using Storage::StorageErrc;
using json = nlohmann::json;

namespace
{

struct TagDocument {
    std::string tag;
    std::set<EntryRef> refs;
};

StorageResult<TagDocument> ParseDocument(const Bytes& bytes)
{
    try {
        const auto j = json::parse(
            reinterpret_cast<const char*>(bytes.data()),
            reinterpret_cast<const char*>(bytes.data()) + bytes.size()
        );
        TagDocument doc;
        doc.tag = j.at("tag").get<std::string>();
        for (const auto& r : j.at("refs")) {
            doc.refs.insert(EntryRef{
                r.at("scope").get<std::string>(), r.at("key").get<std::string>(),
                r.at("location").get<std::string>()
            });
        }
        return doc;
    } catch (const json::exception& e) {
        spdlog::warn("TagIndex: unreadable tag document: {}", e.what());
        return std::unexpected(make_error_code(StorageErrc::MetadataError));
    }
}

Bytes SerializeDocument(const TagDocument& doc)
{
    json refs = json::array();
    for (const auto& ref : doc.refs) {
        refs.push_back({{"scope", ref.scope}, {"key", ref.key}, {"location", ref.location}});
    }
    const std::string text = json{{"tag", doc.tag}, {"refs", refs}}.dump();
    const auto* p          = reinterpret_cast<const std::byte*>(text.data());
    return Bytes(p, p + text.size());
}

// Existing document contents, or an empty document for `tag`. A corrupt
// document is replaced rather than blocking every later write to the tag.
TagDocument CurrentOrEmpty(const std::optional<Bytes>& current, const std::string& tag)
{
    if (current) {
        if (auto doc = ParseDocument(*current); doc)
            return std::move(doc.value());
    }
    return TagDocument{tag, {}};
}

}  // namespace

TagIndex::TagIndex(std::shared_ptr<Storage::IStorage> storage) : storage_(std::move(storage)) {}

std::filesystem::path TagIndex::TagsDirectory()
{
    return std::filesystem::path(Constants::META_DIR_NAME) / Constants::TAGS_DIR_NAME;
}

StorageResult<std::filesystem::path> TagIndex::DocumentLocation(const std::string& tag) const
{
    if (tag.empty()) {
        return std::unexpected(make_error_code(StorageErrc::InvalidKey));
    }
    auto digest = KeyCodec::Sha256Hex(tag);
    if (!digest)
        return std::unexpected(digest.error());
    return TagsDirectory() / (*digest + std::string(Constants::TAG_SUFFIX));
}

StorageResult<void> TagIndex::Attach(const std::string& tag, const EntryRef& ref)
{
    auto location = DocumentLocation(tag);
    if (!location)
        return std::unexpected(location.error());

    return storage_->UpdateLocked(
        *location,
        [&](const std::optional<Bytes>& current) -> StorageResult<Bytes> {
            TagDocument doc = CurrentOrEmpty(current, tag);
            doc.refs.insert(ref);
            return SerializeDocument(doc);
        }
    );
}

StorageResult<void> TagIndex::Detach(const std::string& tag, const EntryRef& ref)
{
    auto location = DocumentLocation(tag);
    if (!location)
        return std::unexpected(location.error());

    return storage_->UpdateLocked(
        *location,
        [&](const std::optional<Bytes>& current) -> StorageResult<Bytes> {
            if (!current)
                return Bytes{};
            TagDocument doc = CurrentOrEmpty(current, tag);
            doc.refs.erase(ref);
            if (doc.refs.empty())
                return Bytes{};
            return SerializeDocument(doc);
        }
    );
}

StorageResult<std::set<EntryRef>> TagIndex::KeysFor(const std::string& tag) const
{
    auto location = DocumentLocation(tag);
    if (!location)
        return std::unexpected(location.error());

    auto bytes = storage_->ReadAll(*location);
    if (!bytes) {
        if (bytes.error() == StorageErrc::FileNotFound)
            return std::set<EntryRef>{};
        return std::unexpected(bytes.error());
    }
    auto doc = ParseDocument(*bytes);
    if (!doc)
        return std::unexpected(doc.error());
    return std::move(doc->refs);
}

StorageResult<std::size_t> TagIndex::Flush(const std::vector<std::string>& tags)
{
    // Documents are only cleared once every labelled entry is gone, so a
    // failed flush leaves the references in place for a retry.
    std::vector<std::pair<std::filesystem::path, std::set<EntryRef>>> snapshots;
    std::set<EntryRef> refs;
    for (const auto& tag : tags) {
        auto location = DocumentLocation(tag);
        if (!location)
            return std::unexpected(location.error());

        auto bytes = storage_->ReadAll(*location);
        if (!bytes) {
            if (bytes.error() == StorageErrc::FileNotFound)
                continue;
            return std::unexpected(bytes.error());
        }
        std::set<EntryRef> tag_refs;
        if (auto doc = ParseDocument(*bytes); doc)
            tag_refs = std::move(doc->refs);
        refs.insert(tag_refs.begin(), tag_refs.end());
        snapshots.emplace_back(std::move(location.value()), std::move(tag_refs));
    }

    std::size_t removed = 0;
    for (const auto& ref : refs) {
        auto header = LoadEntryHeader(*storage_, ref.location);
        if (!header) {
            if (header.error() != StorageErrc::FileNotFound) {
                spdlog::debug(
                    "TagIndex: skipping '{}' during flush: {}", ref.location,
                    header.error().message()
                );
            }
            continue;
        }
        // The entry may have been rewritten without the flushed tags.
        const bool labelled = std::ranges::any_of(tags, [&](const std::string& t) {
            return std::ranges::binary_search(header->tags, t);
        });
        if (!labelled)
            continue;

        if (auto res = storage_->Remove(ref.location); !res) {
            spdlog::error(
                "TagIndex: failed to remove '{}' during flush: {}", ref.location,
                res.error().message()
            );
            return std::unexpected(res.error());
        }
        ++removed;
    }

    // References attached since the snapshot belong to the next generation
    // of the tag and are kept.
    for (const auto& [location, tag_refs] : snapshots) {
        auto res = storage_->UpdateLocked(
            location,
            [&](const std::optional<Bytes>& current) -> StorageResult<Bytes> {
                if (!current)
                    return Bytes{};
                auto doc = ParseDocument(*current);
                if (!doc)
                    return Bytes{};
                for (const auto& ref : tag_refs)
                    doc->refs.erase(ref);
                if (doc->refs.empty())
                    return Bytes{};
                return SerializeDocument(*doc);
            }
        );
        if (!res)
            return std::unexpected(res.error());
    }

    spdlog::debug("TagIndex: flushed {} tag(s), removed {} entr(ies)", tags.size(), removed);
    return removed;
}

StorageResult<std::vector<std::string>> TagIndex::ListTags() const
{
    std::vector<std::string> names;
    auto listing = storage_->List(TagsDirectory(), std::string(Constants::TAG_SUFFIX));
    if (!listing) {
        if (listing.error() == StorageErrc::FileNotFound)
            return names;
        return std::unexpected(listing.error());
    }

    while (true) {
        auto next = (*listing)->Next();
        if (!next)
            return std::unexpected(next.error());
        if (!next->has_value())
            break;

        auto bytes = storage_->ReadAll(next->value().relative_path);
        if (!bytes)
            continue;  // removed concurrently
        if (auto doc = ParseDocument(*bytes); doc)
            names.push_back(std::move(doc->tag));
    }
    std::ranges::sort(names);
    return names;
}

StorageResult<std::size_t> TagIndex::DropScope(const std::string& scope_path)
{
    auto tags = ListTags();
    if (!tags)
        return std::unexpected(tags.error());

    std::size_t dropped = 0;
    for (const auto& tag : *tags) {
        auto location = DocumentLocation(tag);
        if (!location)
            return std::unexpected(location.error());

        auto res = storage_->UpdateLocked(
            *location,
            [&](const std::optional<Bytes>& current) -> StorageResult<Bytes> {
                if (!current)
                    return Bytes{};
                TagDocument doc = CurrentOrEmpty(current, tag);
                dropped += std::erase_if(doc.refs, [&](const EntryRef& ref) {
                    return ref.scope == scope_path;
                });
                if (doc.refs.empty())
                    return Bytes{};
                return SerializeDocument(doc);
            }
        );
        if (!res)
            return std::unexpected(res.error());
    }
    return dropped;
}

}  // namespace FileCache::Cache
