#include "environment/environment_resolver.hpp"

#include <cstdlib>
#include <pwd.h>
#include <system_error>
#include <unistd.h>
#include <utility>
#include "core/logging/logger.hpp"

extern char** environ;

namespace inobridge::environment {

namespace {

constexpr const char* kTempVariables[] = {"TMPDIR", "TMP", "TEMP"};

}  // namespace

EnvironmentResolver::EnvironmentResolver(std::vector<std::filesystem::path> candidates)
    : candidates_(std::move(candidates)) {}

std::vector<std::filesystem::path> EnvironmentResolver::default_candidates(
    const std::filesystem::path& working_directory,
    const std::filesystem::path& home_directory) {
    return {working_directory / "arduino_cli_temp",
            working_directory / ".arduino_tmp",
            home_directory / ".arduino_cli_temp"};
}

std::filesystem::path EnvironmentResolver::home_directory() {
    const char* home = std::getenv("HOME");
    if (home != nullptr && home[0] != '\0') {
        return home;
    }
    const passwd* entry = getpwuid(getuid());
    if (entry != nullptr && entry->pw_dir != nullptr) {
        return entry->pw_dir;
    }
    return "/";
}

EnvironmentMap EnvironmentResolver::base_environment() {
    EnvironmentMap variables;
    for (char** entry = environ; entry != nullptr && *entry != nullptr; ++entry) {
        const std::string pair(*entry);
        const auto eq = pair.find('=');
        if (eq == std::string::npos || eq == 0) {
            continue;
        }
        variables[pair.substr(0, eq)] = pair.substr(eq + 1);
    }
    if (variables.find("HOME") == variables.end()) {
        variables["HOME"] = home_directory().string();
    }
    return variables;
}

bool EnvironmentResolver::prepare_candidate(const std::filesystem::path& candidate) {
    std::error_code ec;
    const bool existed = std::filesystem::exists(candidate, ec);
    if (ec) {
        LOG_WARN("EnvironmentResolver: cannot stat " + candidate.string() + ": " +
                 ec.message());
        return false;
    }

    if (!existed) {
        std::filesystem::create_directories(candidate, ec);
        if (ec) {
            LOG_WARN("EnvironmentResolver: could not create temp directory " +
                     candidate.string() + ": " + ec.message());
            return false;
        }
        std::filesystem::permissions(candidate, std::filesystem::perms(0755),
                                     std::filesystem::perm_options::replace, ec);
        if (ec) {
            LOG_WARN("EnvironmentResolver: could not set permissions on " +
                     candidate.string() + ": " + ec.message());
        }
        LOG_DEBUG("EnvironmentResolver: created temp directory " + candidate.string());
    }

    if (!std::filesystem::is_directory(candidate, ec) || ec) {
        LOG_WARN("EnvironmentResolver: temp candidate is not a directory: " +
                 candidate.string());
        return false;
    }
    if (access(candidate.c_str(), W_OK) != 0) {
        LOG_WARN("EnvironmentResolver: temp candidate is not writable: " +
                 candidate.string());
        return false;
    }
    return true;
}

std::optional<std::filesystem::path> EnvironmentResolver::select_scratch_dir() const {
    for (const auto& candidate : candidates_) {
        if (prepare_candidate(candidate)) {
            return candidate;
        }
    }
    return std::nullopt;
}

ResolvedEnvironment EnvironmentResolver::resolve(const EnvironmentMap& overrides) const {
    return resolve(base_environment(), overrides);
}

ResolvedEnvironment EnvironmentResolver::resolve(const EnvironmentMap& base,
                                                 const EnvironmentMap& overrides) const {
    ResolvedEnvironment resolved;
    resolved.variables = base;
    resolved.scratch_dir = select_scratch_dir();

    if (resolved.scratch_dir.has_value()) {
        for (const char* name : kTempVariables) {
            resolved.temp_variables[name] = resolved.scratch_dir->string();
        }
        LOG_DEBUG("EnvironmentResolver: TMPDIR -> " + resolved.scratch_dir->string());
    } else {
        LOG_WARN("EnvironmentResolver: no writable temp directory among " +
                 std::to_string(candidates_.size()) +
                 " candidates; leaving temp variables untouched");
    }

    for (const auto& [name, value] : resolved.temp_variables) {
        resolved.variables[name] = value;
    }
    for (const auto& [name, value] : overrides) {
        resolved.variables[name] = value;
    }
    return resolved;
}

}  // namespace inobridge::environment
