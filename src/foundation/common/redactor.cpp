/// @file redactor.cpp
/// @brief Redactor implementation.

#include "pgw/foundation/redactor.hpp"

namespace pgw::foundation {

namespace {

std::string escapeRegex(std::string_view text) {
    static const std::string kSpecial = R"(\^$.|?*+()[]{})";
    std::string out;
    out.reserve(text.size());
    for (char c : text) {
        if (kSpecial.find(c) != std::string::npos) {
            out += '\\';
        }
        out += c;
    }
    return out;
}

// "(a|b|c)"\s*:\s*"[^"]*"
std::regex buildEmbeddedPattern(const std::set<std::string, std::less<>>& fields) {
    if (fields.empty()) {
        return std::regex("(?!)");
    }
    std::string alternation;
    for (const auto& field : fields) {
        if (!alternation.empty()) {
            alternation += '|';
        }
        alternation += escapeRegex(field);
    }
    return std::regex("\"(" + alternation + ")\"\\s*:\\s*\"[^\"]*\"");
}

}  // namespace

std::set<std::string, std::less<>> Redactor::defaultSensitiveFields() {
    return {
        // Provider content
        "displayName", "formattedAddress", "nationalPhoneNumber",
        "internationalPhoneNumber", "websiteUri", "googleMapsUri",
        "regularOpeningHours", "currentOpeningHours", "reviews", "photos",
        "editorialSummary", "rating", "userRatingCount", "priceLevel",
        "primaryTypeDisplayName", "paymentOptions", "parkingOptions",
        "accessibilityOptions", "photoUri",
        // Credentials
        "key", "apiKey", "api_key", "sig", "secret", "authorization",
        "Authorization", "X-Goog-Api-Key",
    };
}

Redactor::Redactor() : Redactor(RedactorOptions{defaultSensitiveFields()}) {}

Redactor::Redactor(RedactorOptions options)
    : options_(std::move(options)),
      embeddedPattern_(buildEmbeddedPattern(options_.sensitiveFields)) {}

bool Redactor::isSensitive(std::string_view field) const {
    return options_.sensitiveFields.find(field) != options_.sensitiveFields.end();
}

YAML::Node Redactor::redact(const YAML::Node& input) const {
    return walk(input, 0);
}

YAML::Node Redactor::walk(const YAML::Node& node, int depth) const {
    if (depth > options_.maxDepth) {
        return YAML::Node(options_.truncation);
    }

    switch (node.Type()) {
        case YAML::NodeType::Map: {
            YAML::Node out(YAML::NodeType::Map);
            for (auto it = node.begin(); it != node.end(); ++it) {
                const auto key = it->first.Scalar();
                if (isSensitive(key)) {
                    out[key] = options_.replacement;
                } else {
                    out[key] = walk(it->second, depth + 1);
                }
            }
            return out;
        }
        case YAML::NodeType::Sequence: {
            YAML::Node out(YAML::NodeType::Sequence);
            for (const auto& item : node) {
                out.push_back(walk(item, depth + 1));
            }
            return out;
        }
        case YAML::NodeType::Scalar:
            return YAML::Node(redactString(node.Scalar()));
        case YAML::NodeType::Null:
        case YAML::NodeType::Undefined:
            break;
    }
    return YAML::Node();
}

std::string Redactor::redactString(std::string_view text) const {
    return std::regex_replace(std::string(text), embeddedPattern_,
                              "\"$1\":\"" + options_.replacement + "\"");
}

}  // namespace pgw::foundation
