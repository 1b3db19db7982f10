#include "cache/result_store.hpp"

#include <fstream>
#include <system_error>
#include <utility>
#include <nlohmann/json.hpp>
#include "cache/result_cache.hpp"
#include "core/logging/logger.hpp"
#include "protocol/command_result_codec.hpp"

namespace inobridge::cache {

using core::errors::BridgeError;
using core::errors::ErrorCategory;
using nlohmann::json;
using protocol::CommandResult;

FileResultStore::FileResultStore(std::filesystem::path cache_directory)
    : cache_directory_(std::move(cache_directory)) {}

std::filesystem::path FileResultStore::record_path(const std::string& key) const {
    return cache_directory_ / (ResultCache::stable_key(key) + ".json");
}

core::errors::Result<bool> FileResultStore::write(const std::string& key,
                                                  const CommandResult& result) {
    std::error_code ec;
    std::filesystem::create_directories(cache_directory_, ec);
    if (ec) {
        return BridgeError{ErrorCategory::Storage,
                           "Unable to create cache directory: " +
                               cache_directory_.string(),
                           "cache_dir_create_failed"};
    }

    const auto path = record_path(key);
    std::ofstream out(path, std::ios::trunc);
    if (!out.is_open()) {
        return BridgeError{ErrorCategory::Storage,
                           "Unable to open cache record: " + path.string(),
                           "cache_open_failed"};
    }

    json payload = result;
    out << payload.dump(2) << "\n";
    if (!out.good()) {
        return BridgeError{ErrorCategory::Storage,
                           "Unable to write cache record: " + path.string(),
                           "cache_write_failed"};
    }
    return true;
}

std::optional<CommandResult> FileResultStore::read(const std::string& key) const {
    const auto path = record_path(key);
    std::error_code ec;
    if (!std::filesystem::exists(path, ec) || ec) {
        return std::nullopt;
    }

    std::ifstream in(path);
    if (!in.is_open()) {
        LOG_WARN("FileResultStore: unable to open cache record " + path.string());
        return std::nullopt;
    }

    try {
        const json payload = json::parse(in);
        return payload.get<CommandResult>();
    } catch (const json::exception& ex) {
        LOG_WARN("FileResultStore: error reading cache record " + path.string() + ": " +
                 ex.what());
        return std::nullopt;
    }
}

core::errors::Result<bool> MemoryResultStore::write(const std::string& key,
                                                    const CommandResult& result) {
    std::lock_guard<std::mutex> lock(mutex_);
    records_[key] = result;
    return true;
}

std::optional<CommandResult> MemoryResultStore::read(const std::string& key) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = records_.find(key);
    if (it == records_.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::size_t MemoryResultStore::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return records_.size();
}

}  // namespace inobridge::cache
