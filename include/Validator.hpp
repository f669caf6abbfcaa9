#pragma once
#include "Definition.hpp"
#include <cstddef>
#include <iosfwd>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

namespace devops {
    enum class Severity {
        pass,
        warning,
        fix_required
    };

    struct Finding {
        Severity severity;
        std::string message;
    };

    struct ValidationReport {
        std::vector<Finding> findings; // one per checked field, in sweep order
        std::vector<std::string> fixes;
        std::vector<std::string> suggestions;

        [[nodiscard]] bool ok() const { return fixes.empty(); }

        [[nodiscard]] std::size_t count(Severity s) const;

        // "found 1 required fix" / "found N required fixes", empty when ok()
        [[nodiscard]] std::string summary() const;

        // Findings, separator, suggestions, fixes, then the verdict line.
        void write(std::ostream &os) const;
    };

    class ValidationError : public std::runtime_error {
    public:
        explicit ValidationError(const ValidationReport &report);

        [[nodiscard]] std::size_t fix_count() const { return fixes; }

    private:
        std::size_t fixes;
    };

    // Marker printed in front of each finding: [✔] [~] [✘]
    const char *marker(Severity s);

    // First violated rule for a project ID, checked in order: length, emptiness,
    // leading letter, whitespace, character set. nullopt when the ID is valid.
    std::optional<std::string> check_project_id(const std::string &id);

    // Full field sweep. Never throws and never stops early.
    ValidationReport validate(const TaskDefinition &definition);

    // validate(), write the report to sink, throw ValidationError if fixes are required.
    void validate_to(const TaskDefinition &definition, std::ostream &sink);
} // namespace devops
