#pragma once

#include <nlohmann/json.hpp>
#include <optional>
#include <string>

// One agent response to one stylistic variant of a base prompt.
// Only base_prompt, agent_name and response take part in grouping; the rest
// is carried through the store untouched.
struct ResponseRecord {
    std::string base_prompt;
    std::string agent_name;
    std::string response;

    std::optional<std::string> style_combination;
    std::optional<nlohmann::json> sentiment; // Opaque scorer output
    std::optional<std::string> timestamp;    // ISO-8601, set by the store

    // All three grouping fields present and non-empty
    bool isComplete() const {
        return !base_prompt.empty() && !agent_name.empty() && !response.empty();
    }

    // Fields of the wrong JSON type are treated as absent, unknown keys ignored
    static ResponseRecord fromJSON(nlohmann::json const& j);

    nlohmann::json toJSON() const;

    bool operator==(ResponseRecord const&) const = default;
};
