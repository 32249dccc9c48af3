#include "cache/lock_manager.hpp"
#include "app_constants.hpp"

#include <nlohmann/json.hpp>
#include <spdlog/fmt/fmt.h>
#include <spdlog/spdlog.h>
#include <unistd.h>
#include <array>
#include <random>
#include <thread>

namespace FileCache::Cache
{

using Storage::Bytes;
using Storage::make_error_code;
using Storage::StorageErrc;
using json = nlohmann::json;

namespace
{

struct MarkerInfo {
    std::string token;
    std::optional<std::int64_t> acquired_at_ms;
};

std::optional<MarkerInfo> ParseMarker(const Bytes& bytes)
{
    try {
        const auto j = json::parse(
            reinterpret_cast<const char*>(bytes.data()),
            reinterpret_cast<const char*>(bytes.data()) + bytes.size()
        );
        MarkerInfo info;
        info.token = j.at("token").get<std::string>();
        if (j.contains("acquired_at_ms") && j["acquired_at_ms"].is_number_integer())
            info.acquired_at_ms = j["acquired_at_ms"].get<std::int64_t>();
        return info;
    } catch (const json::exception& e) {
        spdlog::debug("LockManager: unparsable lock marker: {}", e.what());
        return std::nullopt;
    }
}

std::string HostName()
{
    std::array<char, 256> buf{};
    if (::gethostname(buf.data(), buf.size() - 1) != 0)
        return "unknown";
    return std::string(buf.data());
}

}  // namespace

//------------------------------------------------------------------------------//
// LockManager
//------------------------------------------------------------------------------//

LockManager::LockManager(
    std::shared_ptr<Storage::IStorage> storage, std::shared_ptr<IClock> clock,
    std::chrono::seconds default_timeout, std::chrono::milliseconds poll_interval
)
    : storage_(std::move(storage)),
      clock_(std::move(clock)),
      default_timeout_(default_timeout),
      poll_interval_(poll_interval)
{
}

std::filesystem::path LockManager::LocksDirectory()
{
    return std::filesystem::path(Constants::META_DIR_NAME) / Constants::LOCKS_DIR_NAME;
}

StorageResult<std::filesystem::path> LockManager::MarkerLocation(
    const std::string& scope, const std::string& key
) const
{
    std::string id = scope;
    id.push_back('\0');
    id.append(key);
    auto digest = KeyCodec::Sha256Hex(id);
    if (!digest)
        return std::unexpected(digest.error());
    return LocksDirectory() / (*digest + std::string(Constants::LOCK_SUFFIX));
}

std::string LockManager::NewToken() const
{
    thread_local std::mt19937_64 rng{std::random_device{}()};
    return fmt::format("{}-{:016x}", ::getpid(), rng());
}

StorageResult<bool> LockManager::Acquire(
    const std::string& scope, const std::string& key, std::optional<std::chrono::seconds> timeout
)
{
    auto marker = MarkerLocation(scope, key);
    if (!marker)
        return std::unexpected(marker.error());
    const auto effective_timeout = timeout.value_or(default_timeout_);

    const std::string token = NewToken();
    const json content      = {
        {"token", token},
        {"pid", ::getpid()},
        {"host", HostName()},
        {"acquired_at_ms", ToEpochMillis(clock_->Now())},
        {"timeout_s", effective_timeout.count()},
        {"scope", scope},
        {"key", key},
    };
    const std::string text = content.dump();
    const auto* p          = reinterpret_cast<const std::byte*>(text.data());
    const std::span<const std::byte> data(p, text.size());

    // One reclaim attempt: an abandoned marker is moved aside and the
    // exclusive create is retried once.
    for (int attempt = 0; attempt < 2; ++attempt) {
        auto res = storage_->CreateExclusive(*marker, data);
        if (res) {
            std::lock_guard<std::mutex> lock(mutex_);
            held_tokens_[marker->generic_string()] = token;
            spdlog::trace("LockManager: acquired '{}' in scope '{}'", key, scope);
            return true;
        }
        if (res.error() != StorageErrc::AlreadyExists)
            return std::unexpected(res.error());
        if (attempt > 0)
            break;

        auto reclaimed = TryReclaim(*marker, effective_timeout);
        if (!reclaimed)
            return std::unexpected(reclaimed.error());
        if (!*reclaimed)
            break;
    }
    return false;
}

StorageResult<bool> LockManager::TryReclaim(
    const std::filesystem::path& marker, std::chrono::seconds timeout
)
{
    auto bytes = storage_->ReadAll(marker);
    if (!bytes) {
        // Released between our create attempt and now
        if (bytes.error() == StorageErrc::FileNotFound)
            return true;
        return std::unexpected(bytes.error());
    }

    const auto info = ParseMarker(*bytes);
    std::optional<SystemTimePoint> acquired_at;
    if (info && info->acquired_at_ms) {
        acquired_at = FromEpochMillis(*info->acquired_at_ms);
    } else {
        auto attr = storage_->GetAttributes(marker);
        if (!attr) {
            if (attr.error() == StorageErrc::FileNotFound)
                return true;
            return std::unexpected(attr.error());
        }
        acquired_at = SystemTimePoint(std::chrono::duration_cast<SystemTimePoint::duration>(
            std::chrono::seconds(attr->st_mtim.tv_sec) +
            std::chrono::nanoseconds(attr->st_mtim.tv_nsec)
        ));
    }

    if (clock_->Now() - *acquired_at < timeout)
        return false;

    const std::string observed_token = info ? info->token : std::string{};
    const auto tombstone =
        marker.parent_path() / ("." + marker.filename().string() + ".reclaim." + NewToken());
    if (auto res = storage_->Move(marker, tombstone); !res) {
        if (res.error() == StorageErrc::FileNotFound)
            return true;  // another process reclaimed it first
        return std::unexpected(res.error());
    }

    // The marker may have been replaced between the read and the rename.
    auto moved            = storage_->ReadAll(tombstone);
    const auto moved_info = moved ? ParseMarker(*moved) : std::nullopt;
    const std::string moved_token = moved_info ? moved_info->token : std::string{};
    if (moved && moved_token == observed_token) {
        spdlog::info(
            "LockManager: reclaimed abandoned lock marker '{}' (token '{}')", marker.string(),
            observed_token
        );
        if (auto res = storage_->Remove(tombstone); !res) {
            spdlog::warn(
                "LockManager: failed to remove tombstone '{}': {}", tombstone.string(),
                res.error().message()
            );
        }
        return true;
    }

    // Put the live holder's marker back.
    if (auto res = storage_->Link(tombstone, marker); !res) {
        spdlog::warn(
            "LockManager: could not restore lock marker '{}': {}", marker.string(),
            res.error().message()
        );
    }
    if (auto res = storage_->Remove(tombstone); !res) {
        spdlog::warn(
            "LockManager: failed to remove tombstone '{}': {}", tombstone.string(),
            res.error().message()
        );
    }
    return false;
}

StorageResult<bool> LockManager::AcquireBlocking(
    const std::string& scope, const std::string& key, std::optional<std::chrono::seconds> wait
)
{
    const auto deadline = std::chrono::steady_clock::now() + wait.value_or(default_timeout_);
    while (true) {
        auto acquired = Acquire(scope, key);
        if (!acquired || *acquired)
            return acquired;
        if (std::chrono::steady_clock::now() >= deadline) {
            spdlog::debug("LockManager: timed out waiting for '{}' in scope '{}'", key, scope);
            return false;
        }
        std::this_thread::sleep_for(poll_interval_);
    }
}

StorageResult<bool> LockManager::Release(const std::string& scope, const std::string& key)
{
    auto marker = MarkerLocation(scope, key);
    if (!marker)
        return std::unexpected(marker.error());

    std::string token;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = held_tokens_.find(marker->generic_string());
        if (it == held_tokens_.end())
            return false;
        token = std::move(it->second);
        held_tokens_.erase(it);
    }

    auto bytes = storage_->ReadAll(*marker);
    if (!bytes) {
        if (bytes.error() == StorageErrc::FileNotFound)
            return false;
        return std::unexpected(bytes.error());
    }
    const auto info = ParseMarker(*bytes);
    if (!info || info->token != token) {
        spdlog::warn(
            "LockManager: lock on '{}' in scope '{}' was reclaimed by another holder", key, scope
        );
        return false;
    }

    if (auto res = storage_->Remove(*marker); !res)
        return std::unexpected(res.error());
    spdlog::trace("LockManager: released '{}' in scope '{}'", key, scope);
    return true;
}

bool LockManager::IsHeld(const std::string& scope, const std::string& key) const
{
    auto marker = MarkerLocation(scope, key);
    if (!marker)
        return false;
    std::lock_guard<std::mutex> lock(mutex_);
    return held_tokens_.contains(marker->generic_string());
}

//------------------------------------------------------------------------------//
// LockGuard
//------------------------------------------------------------------------------//

LockGuard::~LockGuard()
{
    if (!acquired_)
        return;
    if (auto res = manager_.Release(scope_, key_); !res) {
        spdlog::error(
            "LockGuard: failed to release lock on '{}' in scope '{}': {}", key_, scope_,
            res.error().message()
        );
    }
}

}  // namespace FileCache::Cache
