#include "evaluation/result_aggregator.h"

namespace evaluation {

bool ResultAggregator::addRecord(ResponseRecord const& record) {
    // Legacy or partially-written store entries
    if (!record.isComplete()) {
        dropped_count_++;
        return false;
    }

    auto [it, inserted] = groups_.try_emplace(record.base_prompt);
    if (inserted) {
        prompt_order_.push_back(record.base_prompt);
    }
    it->second[record.agent_name].push_back(record.response);
    record_count_++;
    return true;
}

stability::ResponseSets ResultAggregator::responseSets(std::string const& base_prompt) const {
    auto it = groups_.find(base_prompt);
    if (it == groups_.end()) {
        return {};
    }
    return it->second;
}

void ResultAggregator::clear() {
    prompt_order_.clear();
    groups_.clear();
    record_count_ = 0;
    dropped_count_ = 0;
}

} // namespace evaluation
