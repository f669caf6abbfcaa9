#pragma once
#include "Environment.hpp"
#include <chrono>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

namespace devops {
    class UsageError : public std::runtime_error {
    public:
        using std::runtime_error::runtime_error;
    };

    struct Settings {
        std::string command;                    // install | test | build | doctor | version | help
        int verbosity = 0;                      // number of -v
        std::optional<std::string> definition;  // -f/--file
        std::string shell = "/bin/sh";          // --shell, DEVOPS_SHELL
        std::chrono::seconds timeout{0};        // --timeout, 0 = none
        bool colors = true;
    };

    // devops [-v|-vv] [-f FILE] [--shell PATH] [--timeout S] <command>
    // Environment fills what the flags leave unset. Throws UsageError.
    Settings parse_settings(const std::vector<std::string> &args, const EnvList &env);

    std::string usage();
} // namespace devops
