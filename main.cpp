#include "Context.hpp"
#include "Definition.hpp"
#include "Environment.hpp"
#include "Executor.hpp"
#include "Lifecycle.hpp"
#include "Log.hpp"
#include "OperationRunner.hpp"
#include "Settings.hpp"
#include "Validator.hpp"
#include <clocale>
#include <iostream>
#include <string>
#include <vector>
#include <unistd.h>

#ifndef DEVOPS_VERSION
#define DEVOPS_VERSION "0.0.0-dev.1"
#endif
#ifndef DEVOPS_LOCALEDIR
#define DEVOPS_LOCALEDIR "/usr/share/locale"
#endif

using namespace devops;

namespace {
    constexpr int EXIT_OK = 0;
    constexpr int EXIT_FAILED = 1;
    constexpr int EXIT_USAGE = 2;

    const Operation &operation_for(const TaskDefinition &d, const std::string &command) {
        if (command == "install") return d.codebase.install;
        if (command == "test") return d.codebase.test;
        return d.codebase.build;
    }

    // "tests failed" reads better than "test failed" in the final message.
    std::string failure_prefix(const std::string &command) {
        if (command == "test") return std::string(_("tests failed:")) + " ";
        return command + " " + _("failed:") + " ";
    }
}

int main(const int argc, char **argv) {
    std::setlocale(LC_ALL, "");
    bindtextdomain("devops", DEVOPS_LOCALEDIR);
    textdomain("devops");

    const EnvList ambient = ambient_environment();
    Settings settings;
    try {
        settings = parse_settings(std::vector<std::string>(argv + 1, argv + argc), ambient);
    } catch (const UsageError &e) {
        std::cerr << "devops: " << e.what() << "\n\n" << usage();
        return EXIT_USAGE;
    }
    if (settings.command == "help") {
        std::cout << _("DevOps: Simplifying your CI/CD pipelines.") << "\n\n" << usage();
        return EXIT_OK;
    }
    if (settings.command == "version") {
        std::cout << "devops " << _("version") << " " << DEVOPS_VERSION << std::endl;
        return EXIT_OK;
    }

    const Logger log(std::cerr, level_from_verbosity(settings.verbosity),
                     settings.colors && ::isatty(STDERR_FILENO));

    TaskDefinition definition;
    try {
        const auto path = resolve_definition_path(settings.definition, ambient);
        log.debug(std::string(_("Loading definition from")) + " " + path.string());
        definition = load_definition(path);
    } catch (const DefinitionError &e) {
        log.error(e.what());
        return EXIT_FAILED;
    }

    try {
        const LifecycleController lifecycle(Context::background());
        Context ctx = lifecycle.context();
        if (settings.timeout.count() > 0) ctx = Context::with_timeout(ctx, settings.timeout);

        if (settings.command == "doctor") {
            std::cout << "===== DEVOPS DOCTOR =====" << std::endl;
            try {
                validate_to(definition, std::cout);
            } catch (const ValidationError &e) {
                log.error(std::string(_("validation failed:")) + " " + e.what());
                return EXIT_FAILED;
            }
            log.info(_("Project definition validated successfully"));
            return EXIT_OK;
        }

        ShellExecutor executor(settings.shell);
        const OperationRunner runner(executor, ambient, log);
        try {
            runner.run_stage(ctx, settings.command, operation_for(definition, settings.command));
        } catch (const OperationError &e) {
            log.error(failure_prefix(settings.command) + e.what());
            if (const int sig = lifecycle.signal_received(); sig != 0) return 128 + sig;
            return EXIT_FAILED;
        }
    } catch (const std::exception &e) {
        log.error(e.what());
        return EXIT_FAILED;
    }
    return EXIT_OK;
}
