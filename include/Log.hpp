#pragma once
#include <libintl.h>
#include <iosfwd>
#include <string>

#ifndef DEVOPS_GETTEXT_DEFINED
#define _(String) gettext(String)
#define DEVOPS_GETTEXT_DEFINED
#endif

namespace devops {
    enum class LogLevel {
        error = 0,
        warn,
        info,
        debug
    };

    // Map a -v count to a level: 0 -> warn, 1 -> info, 2+ -> debug.
    LogLevel level_from_verbosity(int verbosity);

    // Columns of the controlling terminal, 80 when stdout is not a terminal.
    int terminal_width();

    // OpenRC style status line: " * message ............ [ ok ]"
    void print_status(std::ostream &log, const std::string &msg, const std::string &status, bool error = false,
                      bool colors = true);

    // A full terminal-width line made of `ch`.
    void print_rule(std::ostream &os, char ch = '=');

    // Leveled logger writing einfo/ewarn/eerror style lines to one sink.
    class Logger {
    public:
        explicit Logger(std::ostream &sink, LogLevel level = LogLevel::warn, bool colors = false);

        void error(const std::string &msg) const;

        void warn(const std::string &msg) const;

        void info(const std::string &msg) const;

        void debug(const std::string &msg) const;

        // Step outcome in print_status form, shown from info level up.
        void status(const std::string &msg, bool ok) const;

        [[nodiscard]] bool enabled(LogLevel l) const { return l <= threshold; }

        [[nodiscard]] LogLevel level() const { return threshold; }

        [[nodiscard]] bool use_colors() const { return colors; }

    private:
        void line(LogLevel l, const std::string &msg) const;

        std::ostream &sink;
        LogLevel threshold;
        bool colors;
    };
} // namespace devops
