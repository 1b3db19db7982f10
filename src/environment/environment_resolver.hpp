#pragma once

#include <filesystem>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace inobridge::environment {

using EnvironmentMap = std::map<std::string, std::string>;

struct ResolvedEnvironment {
    std::optional<std::filesystem::path> scratch_dir;
    // TMPDIR/TMP/TEMP assignments; empty when no candidate was usable.
    EnvironmentMap temp_variables;
    // Complete environment handed to the child process.
    EnvironmentMap variables;
};

class EnvironmentResolver {
public:
    explicit EnvironmentResolver(std::vector<std::filesystem::path> candidates);

    // Fixed priority: project scratch dir, hidden project dir, home scratch dir.
    static std::vector<std::filesystem::path> default_candidates(
        const std::filesystem::path& working_directory,
        const std::filesystem::path& home_directory);

    // Parent environment with HOME guaranteed to be set.
    static EnvironmentMap base_environment();
    static std::filesystem::path home_directory();

    std::optional<std::filesystem::path> select_scratch_dir() const;

    // Layers base environment, scratch temp variables and then the
    // invocation overrides, later layers winning.
    ResolvedEnvironment resolve(const EnvironmentMap& overrides) const;
    ResolvedEnvironment resolve(const EnvironmentMap& base,
                                const EnvironmentMap& overrides) const;

    const std::vector<std::filesystem::path>& candidates() const {
        return candidates_;
    }

private:
    static bool prepare_candidate(const std::filesystem::path& candidate);

    std::vector<std::filesystem::path> candidates_;
};

}  // namespace inobridge::environment
