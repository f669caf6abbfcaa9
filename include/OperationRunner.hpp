#pragma once
#include "Context.hpp"
#include "Definition.hpp"
#include "Environment.hpp"
#include "Executor.hpp"
#include "Log.hpp"
#include <iostream>
#include <stdexcept>
#include <string>
#include <vector>

namespace devops {
    class OperationError : public std::runtime_error {
    public:
        OperationError(const std::string &msg, std::vector<std::string> failed);

        // Failing step command lines, in execution order.
        [[nodiscard]] const std::vector<std::string> &failed_steps() const { return failed; }

    private:
        std::vector<std::string> failed;
    };

    // Drives the ordered steps of one Operation through an Executor.
    // Steps run strictly one after another; step N+1 starts only after step N has exited.
    class OperationRunner {
    public:
        OperationRunner(Executor &executor, EnvList ambient, const Logger &log, std::ostream &out = std::cout,
                        std::ostream &err = std::cerr);

        // Run every step of `op`.
        // - empty steps: returns at once, the executor is not touched
        // - fail_fast: throws OperationError at the first failing step, later steps never run
        // - otherwise: every step runs once, then one OperationError names all failing steps
        // A cancelled context always aborts the operation.
        void run(const Context &ctx, const Operation &op) const;

        // run() for a named stage (install/test/build): empty steps only warn,
        // failures are prefixed with "failed to run <stage> steps: ".
        void run_stage(const Context &ctx, const std::string &stage, const Operation &op) const;

    private:
        void forward(const CommandResult &result) const;

        Executor &executor;
        EnvList ambient;
        const Logger &log;
        std::ostream &out;
        std::ostream &err;
    };
} // namespace devops
