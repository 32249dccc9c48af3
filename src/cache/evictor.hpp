#ifndef FILECACHE_SRC_CACHE_EVICTOR_HPP_
#define FILECACHE_SRC_CACHE_EVICTOR_HPP_

#include "cache/clock.hpp"
#include "cache/key_codec.hpp"
#include "cache/tag_index.hpp"
#include "storage/i_storage.hpp"

#include "boost/multi_index/hashed_index.hpp"
#include "boost/multi_index/indexed_by.hpp"
#include "boost/multi_index/member.hpp"
#include "boost/multi_index/ordered_index.hpp"
#include "boost/multi_index_container.hpp"

#include <cstdint>
#include <memory>
#include <string>

namespace FileCache::Cache
{

namespace bmi = boost::multi_index;

struct EvictionCandidate {
    std::string location;  ///< Relative to the root, generic form
    SystemTimePoint last_accessed_at;
    std::uint64_t size_bytes;

    struct ByLocation {
    };
    struct ByLastAccess {
    };
};

using EvictionIndex = bmi::multi_index_container<
    EvictionCandidate,
    bmi::indexed_by<
        bmi::hashed_unique<
            bmi::tag<EvictionCandidate::ByLocation>,
            bmi::member<EvictionCandidate, std::string, &EvictionCandidate::location>>,
        bmi::ordered_non_unique<
            bmi::tag<EvictionCandidate::ByLastAccess>,
            bmi::member<
                EvictionCandidate, SystemTimePoint, &EvictionCandidate::last_accessed_at>>>>;

/**
 * @brief Least-recently-used eviction for a single scope.
 *
 * The index is rebuilt from a directory scan on every pass, since other
 * processes may have added, touched or removed entries in between.
 */
class Evictor
{
    public:
    Evictor(std::shared_ptr<Storage::IStorage> storage, std::shared_ptr<TagIndex> tag_index);

    /// Entry files directly inside `scope`, indexed by location and last access.
    StorageResult<EvictionIndex> Scan(const Scope& scope) const;

    /// Removes least recently accessed entries until at most `max_items`
    /// remain. Returns the number removed.
    StorageResult<std::size_t> Enforce(const Scope& scope, std::uint64_t max_items);

    private:
    std::shared_ptr<Storage::IStorage> storage_;
    std::shared_ptr<TagIndex> tag_index_;
};

}  // namespace FileCache::Cache

#endif  // FILECACHE_SRC_CACHE_EVICTOR_HPP_
