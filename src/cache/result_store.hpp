#pragma once

#include <filesystem>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include "core/errors/bridge_errors.hpp"
#include "protocol/command_contract.hpp"

namespace inobridge::cache {

// Durable key -> record mapping. Writes overwrite; there is no versioning.
class ResultStore {
public:
    virtual ~ResultStore() = default;

    virtual core::errors::Result<bool> write(const std::string& key,
                                             const protocol::CommandResult& result) = 0;

    // nullopt when the key has never been written or the record is unreadable.
    virtual std::optional<protocol::CommandResult> read(const std::string& key) const = 0;
};

// One JSON file per key under a cache directory. Not locked: concurrent
// writers to the same key race and the last one wins.
class FileResultStore final : public ResultStore {
public:
    explicit FileResultStore(std::filesystem::path cache_directory);

    core::errors::Result<bool> write(const std::string& key,
                                     const protocol::CommandResult& result) override;
    std::optional<protocol::CommandResult> read(const std::string& key) const override;

    std::filesystem::path record_path(const std::string& key) const;
    const std::filesystem::path& cache_directory() const { return cache_directory_; }

private:
    std::filesystem::path cache_directory_;
};

class MemoryResultStore final : public ResultStore {
public:
    core::errors::Result<bool> write(const std::string& key,
                                     const protocol::CommandResult& result) override;
    std::optional<protocol::CommandResult> read(const std::string& key) const override;

    std::size_t size() const;

private:
    mutable std::mutex mutex_;
    std::unordered_map<std::string, protocol::CommandResult> records_;
};

}  // namespace inobridge::cache
