#include "../include/Settings.hpp"
#include "../include/Log.hpp"
#include <algorithm>
#include <array>
#include <cerrno>
#include <cstdlib>
#include <string_view>

using namespace devops;
using namespace std;

static bool starts_with(const string &s, const string &p) {
    return s.size() >= p.size() && s.compare(0, p.size(), p) == 0;
}

static bool known_command(const string &c) {
    static constexpr array<string_view, 6> commands = {"install", "test", "build", "doctor", "version", "help"};
    return find(commands.begin(), commands.end(), c) != commands.end();
}

// One week; anything longer is a typo, and nanosecond deadlines overflow far above it.
static constexpr long long MAX_TIMEOUT_SECONDS = 7LL * 24 * 60 * 60;

static long long parse_seconds(const string &v) {
    char *end = nullptr;
    errno = 0;
    const long long s = strtoll(v.c_str(), &end, 10);
    if (errno != 0 || end == v.c_str() || *end != '\0' || s < 0) {
        throw UsageError(string(_("--timeout expects a non-negative number of seconds, got")) + " '" + v + "'");
    }
    if (s > MAX_TIMEOUT_SECONDS) {
        throw UsageError(string(_("--timeout cannot exceed")) + " " + to_string(MAX_TIMEOUT_SECONDS) +
                         " " + _("seconds") + ", got '" + v + "'");
    }
    return s;
}

string devops::usage() {
    return string(_("Usage: devops [-v|-vv] [-f FILE] [--shell PATH] [--timeout SECONDS] <command>")) + "\n\n" +
           _("Commands:") + "\n" +
           "  install   " + _("Run the install operations") + "\n" +
           "  test      " + _("Run the test operations") + "\n" +
           "  build     " + _("Run the build operations") + "\n" +
           "  doctor    " + _("Validate your configuration") + "\n" +
           "  version   " + _("Print the version") + "\n";
}

Settings devops::parse_settings(const vector<string> &args, const EnvList &env) {
    Settings s;
    if (const auto shell = env_lookup(env, "DEVOPS_SHELL"); shell && !shell->empty()) s.shell = *shell;
    s.colors = !is_running_in_ci(env);

    // value of "--key=value" or of the following argument
    const auto value_of = [&args](size_t &i, const string &key) -> string {
        const string &a = args[i];
        if (const auto eq = a.find('='); eq != string::npos) return a.substr(eq + 1);
        if (i + 1 >= args.size()) throw UsageError(key + " " + _("expects a value"));
        return args[++i];
    };

    for (size_t i = 0; i < args.size(); ++i) {
        const string &a = args[i];
        if (a == "-h" || a == "--help") {
            s.command = "help";
        } else if (a == "--version") {
            s.command = "version";
        } else if (a == "--verbose") {
            ++s.verbosity;
        } else if (starts_with(a, "-v") && a.find_first_not_of('v', 1) == string::npos) {
            s.verbosity += static_cast<int>(a.size()) - 1;
        } else if (a == "-f" || a == "--file" || starts_with(a, "--file=")) {
            s.definition = value_of(i, "--file");
        } else if (a == "--shell" || starts_with(a, "--shell=")) {
            s.shell = value_of(i, "--shell");
        } else if (a == "--timeout" || starts_with(a, "--timeout=")) {
            s.timeout = chrono::seconds(parse_seconds(value_of(i, "--timeout")));
        } else if (a == "--no-color") {
            s.colors = false;
        } else if (starts_with(a, "-")) {
            throw UsageError(string(_("unknown flag: ")) + a);
        } else if (s.command.empty()) {
            if (!known_command(a)) throw UsageError(string(_("unknown command: ")) + a);
            s.command = a;
        } else if (s.command != "help" && s.command != "version") {
            throw UsageError(string(_("unexpected argument: ")) + a);
        }
    }
    if (s.command.empty()) s.command = "help";
    if (s.shell.empty()) throw UsageError(_("--shell cannot be empty"));
    return s;
}
