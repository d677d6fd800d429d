#pragma once

#include "response_record.h"
#include "stability/stability_calculator.h"

#include <string>
#include <unordered_map>
#include <vector>

namespace evaluation {

// Groups a flat record stream into {base_prompt: {agent: [responses]}}.
// Records missing any grouping field are dropped and counted, not rejected.
class ResultAggregator {
public:
    // Returns false (and counts a drop) for an incomplete record
    bool addRecord(ResponseRecord const& record);

    // Agent -> responses in observation order; empty for an unknown prompt
    stability::ResponseSets responseSets(std::string const& base_prompt) const;

    // Distinct prompts in first-observation order
    std::vector<std::string> const& allPrompts() const { return prompt_order_; }

    bool hasPrompt(std::string const& base_prompt) const {
        return groups_.find(base_prompt) != groups_.end();
    }

    size_t recordCount() const { return record_count_; }
    size_t droppedCount() const { return dropped_count_; }
    bool empty() const { return prompt_order_.empty(); }

    void clear();

private:
    std::vector<std::string> prompt_order_;
    std::unordered_map<std::string, stability::ResponseSets> groups_;
    size_t record_count_ = 0;
    size_t dropped_count_ = 0;
};

} // namespace evaluation
