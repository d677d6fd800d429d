#include "response_record.h"

namespace {

std::string stringField(nlohmann::json const& j, char const* key) {
    auto it = j.find(key);
    if (it != j.end() && it->is_string()) {
        return it->get<std::string>();
    }
    return {};
}

std::optional<std::string> optionalStringField(nlohmann::json const& j, char const* key) {
    auto it = j.find(key);
    if (it != j.end() && it->is_string()) {
        return it->get<std::string>();
    }
    return std::nullopt;
}

} // namespace

ResponseRecord ResponseRecord::fromJSON(nlohmann::json const& j) {
    ResponseRecord record;
    if (!j.is_object()) {
        return record;
    }

    record.base_prompt = stringField(j, "base_prompt");
    record.agent_name = stringField(j, "agent_name");
    record.response = stringField(j, "response");
    record.style_combination = optionalStringField(j, "style_combination");
    record.timestamp = optionalStringField(j, "timestamp");

    auto sentiment = j.find("sentiment");
    if (sentiment != j.end() && !sentiment->is_null()) {
        record.sentiment = *sentiment;
    }
    return record;
}

nlohmann::json ResponseRecord::toJSON() const {
    nlohmann::json j;
    j["base_prompt"] = base_prompt;
    j["agent_name"] = agent_name;
    j["response"] = response;
    j["style_combination"] = style_combination ? nlohmann::json(*style_combination) : nlohmann::json();
    j["sentiment"] = sentiment ? *sentiment : nlohmann::json();
    if (timestamp) {
        j["timestamp"] = *timestamp;
    }
    return j;
}
