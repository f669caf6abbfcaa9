#pragma once
#include "Context.hpp"
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

namespace devops {
    /**
     * @brief Outcome of one executed command.
     * exit_code == -1 means the command never completed (cancelled, timed out or not started).
     */
    struct CommandResult {
        std::string stdout_text;
        std::string stderr_text;
        int exit_code = 0;
    };

    /**
     * @brief Transport error raised by an Executor.
     * A command that runs and exits nonzero is not an ExecError.
     */
    class ExecError : public std::runtime_error {
    public:
        enum class Kind {
            launch,
            cancelled
        };

        ExecError(Kind kind, const std::string &command, const std::string &detail);

        [[nodiscard]] Kind kind() const { return error_kind; }

        [[nodiscard]] const std::string &command() const { return cmd; }

        // Always exit_code -1 with empty output.
        [[nodiscard]] const CommandResult &result() const { return partial; }

    private:
        Kind error_kind;
        std::string cmd;
        CommandResult partial;
    };

    /**
     * @brief Capability used by the operation runner to run shell steps.
     */
    class Executor {
    public:
        virtual ~Executor() = default;

        /**
         * @brief Run one shell command line and wait for it to exit.
         * @param ctx Cancelling ctx (or reaching its deadline) kills the running process.
         * @param command Interpreted by the shell, so pipes, redirects and && are allowed.
         * @return Complete stdout/stderr and the exit status.
         * @throws ExecError when the command cannot be started or ctx ends first.
         */
        virtual CommandResult execute(const Context &ctx, const std::string &command) = 0;

        /**
         * @brief Install the KEY=VALUE list used for every following execute().
         * @note Replaces any previously installed list.
         */
        virtual void add_env(std::vector<std::string> env) = 0;
    };

    // Runs each command as `<shell> -c <command>` in its own process group, stdin on /dev/null.
    class ShellExecutor final : public Executor {
    public:
        explicit ShellExecutor(std::string shell = "/bin/sh");

        CommandResult execute(const Context &ctx, const std::string &command) override;

        void add_env(std::vector<std::string> env) override;

        [[nodiscard]] const std::string &shell() const { return shell_path; }

        // Empty until add_env() is called; commands then inherit the ambient environment.
        [[nodiscard]] const std::optional<std::vector<std::string> > &environment() const { return env; }

    private:
        std::string shell_path;
        std::optional<std::vector<std::string> > env;
    };
} // namespace devops
