#include "cache/result_cache.hpp"

#include <cstdint>
#include <iomanip>
#include <sstream>
#include <utility>
#include "core/logging/logger.hpp"

namespace inobridge::cache {

using protocol::CommandResult;

ResultCache::ResultCache(std::shared_ptr<ResultStore> durable)
    : durable_(std::move(durable)) {}

std::string ResultCache::stable_key(const std::string& logical_command) {
    std::uint64_t hash = 1469598103934665603ULL;
    for (const char c : logical_command) {
        hash ^= static_cast<unsigned char>(c);
        hash *= 1099511628211ULL;
    }
    std::ostringstream out;
    out << std::hex << std::setw(16) << std::setfill('0') << hash;
    return out.str();
}

core::errors::Result<bool> ResultCache::save(const std::string& logical_command,
                                             const CommandResult& result) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        memory_[logical_command] = result;
    }
    if (!durable_) {
        return true;
    }
    auto written = durable_->write(logical_command, result);
    if (core::errors::is_error(written)) {
        LOG_WARN("ResultCache: durable write failed for '" + logical_command + "': " +
                 core::errors::get_error(written).message);
    }
    return written;
}

std::optional<CommandResult> ResultCache::get(const std::string& logical_command) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = memory_.find(logical_command);
        if (it != memory_.end()) {
            LOG_DEBUG("ResultCache: memory hit for '" + logical_command + "'");
            return it->second;
        }
    }
    if (!durable_) {
        return std::nullopt;
    }

    auto stored = durable_->read(logical_command);
    if (!stored.has_value()) {
        LOG_DEBUG("ResultCache: miss for '" + logical_command + "'");
        return std::nullopt;
    }

    LOG_DEBUG("ResultCache: durable hit for '" + logical_command + "'");
    std::lock_guard<std::mutex> lock(mutex_);
    // A save that landed during the durable read is newer; keep it.
    const auto promoted = memory_.emplace(logical_command, stored.value());
    return promoted.first->second;
}

CommandResult ResultCache::get_or_report_unexecuted(const std::string& logical_command) {
    auto stored = get(logical_command);
    if (stored.has_value()) {
        return stored.value();
    }

    CommandResult sentinel;
    sentinel.logical_command = logical_command;
    sentinel.success = false;
    sentinel.stderr_text = kNotYetExecutedMessage;
    return sentinel;
}

void ResultCache::clear_memory() {
    std::lock_guard<std::mutex> lock(mutex_);
    memory_.clear();
}

std::size_t ResultCache::memory_size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return memory_.size();
}

}  // namespace inobridge::cache
