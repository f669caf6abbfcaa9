#include "../include/Log.hpp"
#include <iostream>
#include <string>
#include <unistd.h>
#include <sys/ioctl.h>

using namespace devops;
using namespace std;

LogLevel devops::level_from_verbosity(const int verbosity) {
    if (verbosity <= 0) return LogLevel::warn;
    if (verbosity == 1) return LogLevel::info;
    return LogLevel::debug;
}

int devops::terminal_width() {
    winsize w{};
    if (ioctl(STDOUT_FILENO, TIOCGWINSZ, &w) == 0 && w.ws_col > 0) {
        return w.ws_col;
    }
    return 80;
}

void devops::print_status(ostream &log, const string &msg, const string &status, const bool error,
                          const bool colors) {
    const int term_width = terminal_width();

    // Colors: Stars (Green), Brackets (White), Status (Green/Red)
    const string star = colors ? "\033[32m*\033[0m" : "*";
    const string open = colors ? "\033[37m[\033[0m" : "[";
    const string close = colors ? "\033[37m]\033[0m" : "]";
    string status_text = status;
    if (colors) status_text = (error ? "\033[31;1m" : "\033[32;1m") + status + "\033[0m";
    const string status_block = " " + open + " " + status_text + " " + close;
    const int msg_display_len = 3 + static_cast<int>(msg.length());
    int padding = term_width - msg_display_len - 7;
    if (padding < 1) padding = 1;

    log << " " << star << " " << msg;
    for (int i = 0; i < padding; ++i) log << " ";
    log << status_block << endl;
}

void devops::print_rule(ostream &os, const char ch) {
    os << string(static_cast<size_t>(terminal_width()), ch) << endl;
}

Logger::Logger(ostream &sink, const LogLevel level, const bool colors)
    : sink(sink), threshold(level), colors(colors) {
}

void Logger::line(const LogLevel l, const string &msg) const {
    if (!enabled(l)) return;
    // einfo green, ewarn yellow, eerror red
    const char *tint = "\033[32m";
    if (l == LogLevel::warn) tint = "\033[33m";
    if (l == LogLevel::error) tint = "\033[31m";
    if (l == LogLevel::debug) tint = "\033[36m";
    const string star = colors ? string(tint) + "*\033[0m" : "*";
    sink << " " << star << " " << msg << endl;
}

void Logger::error(const string &msg) const { line(LogLevel::error, msg); }

void Logger::warn(const string &msg) const { line(LogLevel::warn, msg); }

void Logger::info(const string &msg) const { line(LogLevel::info, msg); }

void Logger::debug(const string &msg) const { line(LogLevel::debug, msg); }

void Logger::status(const string &msg, const bool ok) const {
    if (!enabled(LogLevel::info)) return;
    print_status(sink, msg, ok ? "ok" : "!!", !ok, colors);
}
