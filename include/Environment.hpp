#pragma once
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace devops {
    using EnvList = std::vector<std::string>; // KEY=VALUE entries, order significant
    using EnvMap = std::map<std::string, std::string>;

    // Snapshot of the process environment, taken once by the caller.
    EnvList ambient_environment();

    // Ambient entries first, then one KEY=VALUE per override in key order.
    // Duplicate keys are kept; the shell resolves them last-wins.
    EnvList build_environment(const EnvList &ambient, const EnvMap &overrides);

    // Last-wins lookup, matching how the shell imports a list with duplicates.
    std::optional<std::string> env_lookup(const EnvList &env, std::string_view key);

    // True when a known CI provider variable is set to a non-empty value.
    bool is_running_in_ci(const EnvList &env);
} // namespace devops
