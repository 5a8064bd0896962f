/**
 * ConversationHistory.hpp - Bounded window of question/answer exchanges
 */

#pragma once

#include <cstddef>
#include <deque>
#include <string>
#include <vector>

namespace hpv::llm {

struct Exchange {
    std::string question;
    std::string answer;
};

class ConversationHistory {
public:
    explicit ConversationHistory(size_t window = 5);

    void add(std::string question, std::string answer);

    /**
     * The most recent exchanges, oldest first, at most window() of them.
     */
    std::vector<Exchange> recent() const;

    size_t size() const { return exchanges_.size(); }
    bool empty() const { return exchanges_.empty(); }
    size_t window() const { return window_; }
    void clear() { exchanges_.clear(); }

private:
    size_t window_;
    std::deque<Exchange> exchanges_;
};

} // namespace hpv::llm
