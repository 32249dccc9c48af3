#ifndef FILECACHE_SRC_CONFIG_CONFIG_LOADER_HPP_
#define FILECACHE_SRC_CONFIG_CONFIG_LOADER_HPP_

#include "config/config_types.hpp"

#include <expected>
#include <filesystem>
#include <string>

namespace FileCache::Config
{

//------------------------------------------------------------------------------//
// Error Handling for Configuration Loading
//------------------------------------------------------------------------------//

enum class LoadError {
    FileNotFound,
    JsonParseError,
    ValidationError,
};

using LoadResult   = std::expected<CacheConfig, LoadError>;
using LoadErrorMsg = std::expected<CacheConfig, std::string>;

LoadResult loadConfigFromFile(const std::filesystem::path &file_path);
LoadResult loadConfigFromString(const std::string &json_text);
LoadErrorMsg loadConfigFromFileVerbose(const std::filesystem::path &file_path);

}  // namespace FileCache::Config

#endif  // FILECACHE_SRC_CONFIG_CONFIG_LOADER_HPP_
