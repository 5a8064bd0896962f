/**
 * ConversationHistory.cpp
 */

#include "hpv/llm/ConversationHistory.hpp"

namespace hpv::llm {

ConversationHistory::ConversationHistory(size_t window) : window_(window) {}

void ConversationHistory::add(std::string question, std::string answer) {
    exchanges_.push_back(Exchange{std::move(question), std::move(answer)});
    while (exchanges_.size() > window_) {
        exchanges_.pop_front();
    }
}

std::vector<Exchange> ConversationHistory::recent() const {
    return std::vector<Exchange>(exchanges_.begin(), exchanges_.end());
}

} // namespace hpv::llm
