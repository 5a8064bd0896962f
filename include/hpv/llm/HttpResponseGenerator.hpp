/**
 * HttpResponseGenerator.hpp - HTTP client for the question-answering backend
 *
 * POST {question, history, is_first_message} to /ask_question/ and read
 * "answer" from the JSON reply.
 */

#pragma once

#include "hpv/core/BackgroundExecutor.hpp"
#include "hpv/core/EventLoop.hpp"
#include "hpv/llm/ResponseGenerator.hpp"

#include <memory>
#include <string>

namespace hpv::llm {

class HttpResponseGenerator : public ResponseGenerator {
public:
    HttpResponseGenerator(core::EventLoop& loop,
                          core::BackgroundExecutor& executor,
                          const std::string& base_url = "http://localhost:8003",
                          const std::string& path = "/ask_question/",
                          int timeout_ms = 30000);
    ~HttpResponseGenerator() override;

    void ask(const std::string& question,
             const std::vector<Exchange>& history,
             Callback done) override;

    std::string name() const override { return "http"; }

    bool isHealthy();

    /**
     * Blocking request; ask() runs this on the executor.
     */
    ResponseResult askSync(const std::string& question, const std::vector<Exchange>& history);

    static std::string buildRequest(const std::string& question, const std::vector<Exchange>& history);
    static ResponseResult parseResponse(const std::string& body);

private:
    struct Impl;
    std::shared_ptr<Impl> impl_;
};

} // namespace hpv::llm
