#pragma once

#include <cstddef>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include "cache/result_store.hpp"
#include "core/errors/bridge_errors.hpp"
#include "protocol/command_contract.hpp"

namespace inobridge::cache {

inline constexpr const char* kNotYetExecutedMessage =
    "Command not yet executed. Please execute the command in a terminal first, "
    "then store its result with 'inobridge store'.";

// Results keyed by logical command. Memory is consulted before the durable
// store; the two may diverge because the durable store outlives the process.
class ResultCache {
public:
    explicit ResultCache(std::shared_ptr<ResultStore> durable = nullptr);

    // Unconditional overwrite. The in-memory entry is updated even when the
    // durable write fails; the failure is still reported.
    core::errors::Result<bool> save(const std::string& logical_command,
                                    const protocol::CommandResult& result);

    std::optional<protocol::CommandResult> get(const std::string& logical_command);

    // Never fails: a miss yields an unsuccessful sentinel result.
    protocol::CommandResult get_or_report_unexecuted(const std::string& logical_command);

    // Drops the in-memory mapping, as a process restart would.
    void clear_memory();
    std::size_t memory_size() const;

    // FNV-1a 64-bit of the command, 16 lowercase hex digits.
    static std::string stable_key(const std::string& logical_command);

private:
    mutable std::mutex mutex_;
    std::unordered_map<std::string, protocol::CommandResult> memory_;
    std::shared_ptr<ResultStore> durable_;
};

}  // namespace inobridge::cache
