#include "../include/OperationRunner.hpp"
#include <chrono>
#include <optional>
#include <sstream>

using namespace devops;
using namespace std;

static string bracket_list(const vector<string> &items) {
    string out = "[";
    for (size_t i = 0; i < items.size(); ++i) {
        if (i) out += ", ";
        out += items[i];
    }
    return out + "]";
}

static void write_block(ostream &os, const string &text) {
    if (text.empty()) return;
    os << text;
    if (text.back() != '\n') os << '\n';
    os.flush();
}

OperationError::OperationError(const string &msg, vector<string> failed)
    : runtime_error(msg), failed(std::move(failed)) {
}

OperationRunner::OperationRunner(Executor &executor, EnvList ambient, const Logger &log, ostream &out, ostream &err)
    : executor(executor), ambient(std::move(ambient)), log(log), out(out), err(err) {
}

void OperationRunner::forward(const CommandResult &result) const {
    write_block(out, result.stdout_text);
    write_block(err, result.stderr_text);
}

void OperationRunner::run(const Context &ctx, const Operation &op) const {
    if (op.steps.empty()) return;

    if (!op.env.empty()) {
        vector<string> names;
        names.reserve(op.env.size());
        for (const auto &[key, value]: op.env) names.push_back(key);
        log.info(string(_("Loading")) + " " + to_string(op.env.size()) + " " +
                 _("additional environment variable(s):") + " " + bracket_list(names));
    }
    executor.add_env(build_environment(ambient, op.env));

    vector<string> failed;
    optional<OperationError> stopped;
    for (size_t idx = 0; idx < op.steps.size(); ++idx) {
        const string &step = op.steps[idx];
        out << "[" << idx + 1 << "] " << step << endl;

        CommandResult result;
        optional<ExecError> transport;
        try {
            result = executor.execute(ctx, step);
        } catch (const ExecError &e) {
            result = e.result();
            transport = e;
        }
        forward(result);

        const bool step_failed = transport.has_value() || result.exit_code != 0;
        log.status(step, !step_failed);
        if (!step_failed) continue;

        failed.push_back(step);
        if (op.fail_fast || (transport && transport->kind() == ExecError::Kind::cancelled)) {
            ostringstream msg;
            msg << _("error while running") << " '" << step << "' (" << _("exit code") << " "
                << result.exit_code << ")";
            if (transport) msg << ": " << transport->what();
            stopped.emplace(msg.str(), failed);
            break;
        }
    }
    print_rule(out, '=');

    if (stopped) throw *stopped;
    if (!failed.empty()) throw OperationError(string(_("failed to run steps:")) + " " + bracket_list(failed), failed);
}

void OperationRunner::run_stage(const Context &ctx, const string &stage, const Operation &op) const {
    if (op.steps.empty()) {
        log.warn(string(_("No")) + " " + stage + " " + _("steps defined in the configuration."));
        return;
    }
    log.debug(string(_("Running")) + " " + to_string(op.steps.size()) + " " + stage + " " + _("step(s)") +
              (op.fail_fast ? string(" ") + _("(fail fast)") : string()));
    const auto start = chrono::steady_clock::now();
    try {
        run(ctx, op);
    } catch (const OperationError &e) {
        throw OperationError(string(_("failed to run")) + " " + stage + " " + _("steps:") + " " + e.what(),
                             e.failed_steps());
    }
    const chrono::duration<double> took = chrono::steady_clock::now() - start;
    ostringstream msg;
    msg << stage << " " << _("completed successfully") << " (" << _("duration") << " " << took.count() << "s)";
    log.info(msg.str());
}
