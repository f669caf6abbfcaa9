#pragma once
#include "Environment.hpp"
#include <filesystem>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

namespace devops {
    inline constexpr const char *DEFINITION_FILE = "devops-definition.yaml";

    struct Operation {
        bool fail_fast = false;
        EnvMap env;                     // applied on top of the ambient environment
        std::vector<std::string> steps; // shell command lines, run in order
    };

    struct Codebase {
        std::string language;
        std::vector<std::string> dependencies;
        Operation install;
        Operation test;
        Operation build;
    };

    // Loaded once per invocation, read-only afterwards.
    struct TaskDefinition {
        std::string id;
        std::string name;
        std::string version;
        std::string description;
        std::string repo_url;
        Codebase codebase;
    };

    class DefinitionError : public std::runtime_error {
    public:
        using std::runtime_error::runtime_error;
    };

    // Decode the YAML text of a definition. `origin` only prefixes error messages.
    TaskDefinition parse_definition(const std::string &yaml, const std::string &origin = "<memory>");

    TaskDefinition load_definition(const std::filesystem::path &path);

    // --file wins, then DEVOPS_DEFINITION, then ./devops-definition.yaml
    std::filesystem::path resolve_definition_path(const std::optional<std::string> &flag, const EnvList &env);
} // namespace devops
