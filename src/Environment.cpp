#include "../include/Environment.hpp"
#include <array>

extern char **environ;

using namespace devops;

EnvList devops::ambient_environment() {
    EnvList out;
    for (char **e = environ; e != nullptr && *e != nullptr; ++e) out.emplace_back(*e);
    return out;
}

EnvList devops::build_environment(const EnvList &ambient, const EnvMap &overrides) {
    EnvList out;
    out.reserve(ambient.size() + overrides.size());
    out.insert(out.end(), ambient.begin(), ambient.end());
    for (const auto &[key, value]: overrides) out.push_back(key + "=" + value);
    return out;
}

std::optional<std::string> devops::env_lookup(const EnvList &env, const std::string_view key) {
    for (auto it = env.rbegin(); it != env.rend(); ++it) {
        const std::string_view entry(*it);
        if (entry.size() > key.size() && entry.compare(0, key.size(), key) == 0 && entry[key.size()] == '=') {
            return std::string(entry.substr(key.size() + 1));
        }
    }
    return std::nullopt;
}

bool devops::is_running_in_ci(const EnvList &env) {
    static constexpr std::array<std::string_view, 4> ci_variables = {
        "CI", "GITHUB_ACTIONS", "GITLAB_CI", "NODE_NAME"
    };
    for (const auto variable: ci_variables) {
        if (const auto v = env_lookup(env, variable); v && !v->empty()) return true;
    }
    return false;
}
