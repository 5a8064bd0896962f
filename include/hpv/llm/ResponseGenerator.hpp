/**
 * ResponseGenerator.hpp - The tutoring backend as an opaque ask() call
 */

#pragma once

#include "hpv/llm/ConversationHistory.hpp"

#include <functional>
#include <string>
#include <vector>

namespace hpv::llm {

struct ResponseResult {
    bool ok = false;
    std::string answer;
    std::string error;
};

class ResponseGenerator {
public:
    using Callback = std::function<void(const ResponseResult& result)>;

    virtual ~ResponseGenerator() = default;

    /**
     * Asynchronous; done runs on the event loop thread.
     */
    virtual void ask(const std::string& question,
                     const std::vector<Exchange>& history,
                     Callback done) = 0;

    virtual std::string name() const = 0;
};

} // namespace hpv::llm
