#include "cache/evictor.hpp"
#include "cache/entry_codec.hpp"

#include <spdlog/spdlog.h>

namespace FileCache::Cache
{

using Storage::StorageErrc;

Evictor::Evictor(std::shared_ptr<Storage::IStorage> storage, std::shared_ptr<TagIndex> tag_index)
    : storage_(std::move(storage)), tag_index_(std::move(tag_index))
{
}

StorageResult<EvictionIndex> Evictor::Scan(const Scope& scope) const
{
    EvictionIndex index;
    auto listing = storage_->List(scope.GetPath(), scope.GetExtension());
    if (!listing)
        return std::unexpected(listing.error());

    while (true) {
        auto next = (*listing)->Next();
        if (!next)
            return std::unexpected(next.error());
        if (!next->has_value())
            break;

        const auto& entry = next->value();
        const auto& mtim  = entry.attributes.st_mtim;
        index.insert(EvictionCandidate{
            entry.relative_path.generic_string(),
            SystemTimePoint(std::chrono::duration_cast<SystemTimePoint::duration>(
                std::chrono::seconds(mtim.tv_sec) + std::chrono::nanoseconds(mtim.tv_nsec)
            )),
            static_cast<std::uint64_t>(entry.attributes.st_size)
        });
    }
    return index;
}

StorageResult<std::size_t> Evictor::Enforce(const Scope& scope, std::uint64_t max_items)
{
    auto scanned = Scan(scope);
    if (!scanned)
        return std::unexpected(scanned.error());
    EvictionIndex& index = *scanned;

    if (index.size() <= max_items)
        return 0;

    std::size_t evicted = 0;
    auto& by_access     = index.get<EvictionCandidate::ByLastAccess>();
    while (index.size() > max_items) {
        auto oldest                  = by_access.begin();
        const std::string location   = oldest->location;
        by_access.erase(oldest);

        auto header = LoadEntryHeader(*storage_, location);
        if (!header && header.error() == StorageErrc::FileNotFound) {
            continue;  // already gone
        }

        if (auto res = storage_->Remove(location); !res) {
            spdlog::error(
                "Evictor: failed to remove '{}': {}", location, res.error().message()
            );
            return std::unexpected(res.error());
        }
        ++evicted;

        if (!header)
            continue;
        const EntryRef ref{scope.GetPathString(), header->key, location};
        for (const auto& tag : header->tags) {
            if (auto res = tag_index_->Detach(tag, ref); !res) {
                spdlog::warn(
                    "Evictor: failed to detach tag '{}' from '{}': {}", tag, location,
                    res.error().message()
                );
            }
        }
    }

    spdlog::debug(
        "Evictor: evicted {} entr(ies) from scope '{}' (limit {})", evicted,
        scope.GetPathString(), max_items
    );
    return evicted;
}

}  // namespace FileCache::Cache
