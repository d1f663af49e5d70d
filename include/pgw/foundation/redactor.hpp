#pragma once

/// @file redactor.hpp
/// @brief Bounded-depth scrubbing of sensitive fields before data reaches
///        logs or telemetry.

#include <regex>
#include <set>
#include <string>
#include <string_view>

#include <yaml-cpp/yaml.h>

namespace pgw::foundation {

struct RedactorOptions {
    /// Map keys whose values are replaced wholesale (compared exactly).
    std::set<std::string, std::less<>> sensitiveFields;

    /// Nodes nested deeper than this are replaced by the truncation marker.
    int maxDepth = 10;

    std::string replacement = "[REDACTED]";
    std::string truncation = "[TRUNCATED]";
};

/// Tree-walking redactor over YAML::Node (which also models parsed JSON).
///
/// The input tree is never modified; redact() returns a scrubbed copy.
class Redactor {
public:
    /// Provider content fields plus credential-bearing names.
    static std::set<std::string, std::less<>> defaultSensitiveFields();

    Redactor();
    explicit Redactor(RedactorOptions options);

    [[nodiscard]] YAML::Node redact(const YAML::Node& input) const;

    /// Scrub `"field": "value"` pairs for sensitive fields embedded in text,
    /// e.g. a JSON fragment inside an error message.
    [[nodiscard]] std::string redactString(std::string_view text) const;

    [[nodiscard]] bool isSensitive(std::string_view field) const;

    [[nodiscard]] const RedactorOptions& options() const noexcept { return options_; }

private:
    YAML::Node walk(const YAML::Node& node, int depth) const;

    RedactorOptions options_;
    std::regex embeddedPattern_;
};

}  // namespace pgw::foundation
