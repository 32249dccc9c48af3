#include "cache/key_codec.hpp"

#include <openssl/evp.h>
#include <spdlog/spdlog.h>
#include <array>
#include <string>

namespace FileCache::Cache
{

using Storage::make_error_code;
using Storage::StorageErrc;

bool Scope::IsValidSegment(std::string_view segment)
{
    if (segment.empty() || segment.front() == '.') {
        return false;
    }
    for (unsigned char c : segment) {
        const bool allowed = (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') ||
                             (c >= '0' && c <= '9') || c == '_' || c == '-' || c == '.' ||
                             c >= 0x80;
        if (!allowed) {
            return false;
        }
    }
    return true;
}

StorageResult<Scope> Scope::WithPath(std::string_view sub) const
{
    Scope nested = *this;
    std::size_t start = 0;
    while (start <= sub.size()) {
        std::size_t end = sub.find('/', start);
        if (end == std::string_view::npos)
            end = sub.size();
        const std::string_view segment = sub.substr(start, end - start);
        if (!IsValidSegment(segment)) {
            spdlog::warn("Rejected scope segment '{}' in '{}'", segment, sub);
            return std::unexpected(make_error_code(StorageErrc::InvalidPath));
        }
        nested.path_ /= std::string(segment);
        start = end + 1;
    }
    return nested;
}

Scope Scope::WithPrefix(std::string key_prefix) const
{
    Scope prefixed       = *this;
    prefixed.key_prefix_ = std::move(key_prefix);
    return prefixed;
}

StorageResult<void> KeyCodec::ValidateKey(std::string_view key) const
{
    if (key.empty() || key.size() > max_key_length_) {
        spdlog::debug("Invalid cache key of length {} (max {})", key.size(), max_key_length_);
        return std::unexpected(make_error_code(StorageErrc::InvalidKey));
    }
    return {};
}

StorageResult<fs::path> KeyCodec::Resolve(const Scope& scope, std::string_view key) const
{
    if (auto res = ValidateKey(key); !res) {
        return std::unexpected(res.error());
    }

    std::string prefixed;
    prefixed.reserve(scope.GetKeyPrefix().size() + key.size());
    prefixed.append(scope.GetKeyPrefix());
    prefixed.append(key);

    auto digest = Sha256Hex(prefixed);
    if (!digest) {
        return std::unexpected(digest.error());
    }
    return scope.GetPath() / (*digest + scope.GetExtension());
}

StorageResult<std::string> KeyCodec::Sha256Hex(std::string_view data)
{
    std::array<unsigned char, EVP_MAX_MD_SIZE> md{};
    unsigned int md_len = 0;
    if (EVP_Digest(data.data(), data.size(), md.data(), &md_len, EVP_sha256(), nullptr) != 1) {
        spdlog::error("SHA-256 digest computation failed");
        return std::unexpected(make_error_code(StorageErrc::UnknownError));
    }

    static const char* hex = "0123456789abcdef";
    std::string out(static_cast<std::size_t>(md_len) * 2, '0');
    for (unsigned int i = 0; i < md_len; i++) {
        out[2 * i]     = hex[(md[i] >> 4) & 0xF];
        out[2 * i + 1] = hex[md[i] & 0xF];
    }
    return out;
}

}  // namespace FileCache::Cache
