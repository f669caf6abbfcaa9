#include "../include/Validator.hpp"
#include "../include/Log.hpp"
#include <algorithm>
#include <cctype>
#include <ostream>
#include <wctype.h>
#include <locale.h>

using namespace devops;
using namespace std;

namespace {
    constexpr size_t MAX_ID_LENGTH = 30;

    // Textual separator; the report must stay byte-identical across runs and terminals.
    constexpr const char *REPORT_RULE = "========================================";

    string join_list(const vector<string> &items) {
        string out = "[";
        for (size_t i = 0; i < items.size(); ++i) {
            if (i) out += ", ";
            out += items[i];
        }
        return out + "]";
    }

    constexpr char32_t REPLACEMENT = 0xFFFD;

    // Code points of a UTF-8 string; malformed sequences decode to U+FFFD one byte at a time.
    vector<char32_t> decode_utf8(const string &s) {
        vector<char32_t> out;
        for (size_t i = 0; i < s.size();) {
            const auto b = static_cast<unsigned char>(s[i]);
            size_t len = 0;
            char32_t cp = 0;
            if (b < 0x80) {
                len = 1;
                cp = b;
            } else if ((b & 0xE0) == 0xC0 && b >= 0xC2) {
                len = 2;
                cp = b & 0x1F;
            } else if ((b & 0xF0) == 0xE0) {
                len = 3;
                cp = b & 0x0F;
            } else if ((b & 0xF8) == 0xF0 && b <= 0xF4) {
                len = 4;
                cp = b & 0x07;
            }
            bool valid = len > 0 && i + len <= s.size();
            for (size_t k = 1; valid && k < len; ++k) {
                const auto c = static_cast<unsigned char>(s[i + k]);
                if ((c & 0xC0) != 0x80) valid = false;
                else cp = (cp << 6) | (c & 0x3F);
            }
            if (valid && len == 3 && (cp < 0x800 || (cp >= 0xD800 && cp <= 0xDFFF))) valid = false;
            if (valid && len == 4 && (cp < 0x10000 || cp > 0x10FFFF)) valid = false;
            if (!valid) {
                out.push_back(REPLACEMENT);
                ++i;
                continue;
            }
            out.push_back(cp);
            i += len;
        }
        return out;
    }

    // Unicode White_Space: ASCII controls and space, NEL, NBSP and the Zs/Zl/Zp separators.
    bool is_space(const char32_t c) {
        switch (c) {
            case U'\t': case U'\n': case U'\v': case U'\f': case U'\r': case U' ':
            case 0x85: case 0xA0: case 0x1680: case 0x2028: case 0x2029: case 0x202F: case 0x205F: case 0x3000:
                return true;
            default:
                return c >= 0x2000 && c <= 0x200A;
        }
    }

    bool is_letter(const char32_t c) {
        if (c < 0x80) return isalpha(static_cast<int>(c)) != 0;
        // classification tables of the built-in UTF-8 locale, independent of the process locale
        static const locale_t utf8 = newlocale(LC_CTYPE_MASK, "C.UTF-8", static_cast<locale_t>(nullptr));
        return utf8 != nullptr && c != REPLACEMENT && iswalpha_l(static_cast<wint_t>(c), utf8) != 0;
    }

    struct Sweep {
        ValidationReport report;

        void pass(const string &msg) { report.findings.push_back({Severity::pass, msg}); }

        void warn(const string &msg, const string &suggestion) {
            report.findings.push_back({Severity::warning, msg});
            if (!suggestion.empty()) report.suggestions.push_back(suggestion);
        }

        void fix(const string &msg, const string &remedy) {
            report.findings.push_back({Severity::fix_required, msg});
            report.fixes.push_back(remedy);
        }
    };
}

const char *devops::marker(const Severity s) {
    switch (s) {
        case Severity::pass:
            return "[✔]";
        case Severity::warning:
            return "[~]";
        case Severity::fix_required:
            return "[✘]";
    }
    return "[?]";
}

optional<string> devops::check_project_id(const string &id) {
    if (id.size() >= MAX_ID_LENGTH) {
        return string(_("ID must be under 30 characters")) + " (current: " + to_string(id.size()) + ")";
    }
    if (id.empty()) return string(_("ID cannot be empty"));
    const auto runes = decode_utf8(id);
    if (!is_letter(runes.front())) return string(_("ID must start with a letter"));
    if (any_of(runes.begin(), runes.end(), is_space)) return string(_("ID cannot contain whitespace"));
    const auto allowed = [](const char c) {
        return isalnum(static_cast<unsigned char>(c)) || c == '-' || c == '_';
    };
    if (!all_of(id.begin(), id.end(), allowed)) {
        return string(_("ID can only contain letters, numbers, dashes, and underscores"));
    }
    return nullopt;
}

size_t ValidationReport::count(const Severity s) const {
    return static_cast<size_t>(count_if(findings.begin(), findings.end(),
                                        [s](const Finding &f) { return f.severity == s; }));
}

string ValidationReport::summary() const {
    if (ok()) return "";
    return "found " + to_string(fixes.size()) + (fixes.size() == 1 ? " required fix" : " required fixes");
}

void ValidationReport::write(ostream &os) const {
    for (const auto &[severity, message]: findings) os << marker(severity) << " " << message << "\n";
    os << REPORT_RULE << "\n";
    if (!suggestions.empty()) {
        os << _("Suggestions:") << "\n";
        for (const auto &s: suggestions) os << "  - " << s << "\n";
    }
    if (!fixes.empty()) {
        os << _("Fixes:") << "\n";
        for (const auto &f: fixes) os << "  - " << f << "\n";
        os << marker(Severity::fix_required) << " " << summary() << "\n";
    } else {
        os << marker(Severity::pass) << " " << _("Project definition validated successfully") << "\n";
    }
    os.flush();
}

ValidationError::ValidationError(const ValidationReport &report)
    : runtime_error(report.summary()), fixes(report.fixes.size()) {
}

ValidationReport devops::validate(const TaskDefinition &definition) {
    Sweep s;
    const auto &cb = definition.codebase;

    if (definition.id.empty()) {
        s.fix(_("ID is required"), _("Set an ID for the project"));
    } else if (const auto rule = check_project_id(definition.id)) {
        s.fix(string(_("Invalid ID: ")) + *rule,
              _("Use a valid project ID (alphanumeric/dashes/underscores, starts with letter, no whitespace, "
                  "under 30 chars)"));
    } else {
        s.pass(string(_("ID: ")) + definition.id);
    }

    if (!definition.name.empty()) s.pass(string(_("Name: ")) + definition.name);
    if (!definition.version.empty()) s.pass(string(_("Version: ")) + definition.version);
    if (!definition.description.empty()) s.pass(string(_("Description: ")) + definition.description);

    if (definition.repo_url.empty()) {
        s.fix(_("Repository URL is required"), _("Set a repository URL for the project"));
    } else {
        s.pass(string(_("Repository URL: ")) + definition.repo_url);
    }

    if (cb.language.empty()) {
        s.fix(_("Language is required"), _("Set a language in the codebase"));
    } else {
        s.pass(string(_("Language: ")) + cb.language);
    }

    if (cb.dependencies.empty()) {
        s.warn(_("No dependencies defined"), _("Declare the codebase dependencies"));
    } else {
        s.pass(string(_("Dependencies: ")) + join_list(cb.dependencies));
    }

    // install is optional: reported when present, silent otherwise
    if (!cb.install.steps.empty()) {
        s.pass(string(_("Install steps")) + " (" + to_string(cb.install.steps.size()) + ")");
    }

    if (cb.test.steps.empty()) {
        s.warn(_("No test steps defined"), _("Set test steps in the codebase"));
    } else {
        s.pass(string(_("Test steps")) + " (" + to_string(cb.test.steps.size()) + ")");
    }

    if (cb.build.steps.empty()) {
        s.warn(_("No build steps defined"), _("Set build steps in the codebase"));
    } else {
        s.pass(string(_("Build steps")) + " (" + to_string(cb.build.steps.size()) + ")");
    }
    return s.report;
}

void devops::validate_to(const TaskDefinition &definition, ostream &sink) {
    const auto report = validate(definition);
    report.write(sink);
    if (!report.ok()) throw ValidationError(report);
}
