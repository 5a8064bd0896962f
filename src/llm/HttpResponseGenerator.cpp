/**
 * HttpResponseGenerator.cpp - cpp-httplib client for the tutoring backend
 */

#include "hpv/llm/HttpResponseGenerator.hpp"

#include <iostream>

#include <httplib.h>
#include <nlohmann/json.hpp>

using json = nlohmann::json;

namespace hpv::llm {

struct HttpResponseGenerator::Impl {
    core::EventLoop& loop;
    core::BackgroundExecutor& executor;
    std::unique_ptr<httplib::Client> client;
    std::string path;

    Impl(core::EventLoop& l, core::BackgroundExecutor& e, const std::string& url,
         std::string p, int timeout_ms)
        : loop(l), executor(e), path(std::move(p)) {
        client = std::make_unique<httplib::Client>(url);
        client->set_connection_timeout(timeout_ms / 1000, (timeout_ms % 1000) * 1000);
        client->set_read_timeout(timeout_ms / 1000, (timeout_ms % 1000) * 1000);
        client->set_write_timeout(timeout_ms / 1000, (timeout_ms % 1000) * 1000);
    }

    ResponseResult post(const std::string& question, const std::vector<Exchange>& history) {
        auto res = client->Post(path, buildRequest(question, history), "application/json");

        if (!res) {
            return ResponseResult{false, "", "request failed: " + httplib::to_string(res.error())};
        }
        if (res->status != 200) {
            return ResponseResult{false, "", "HTTP " + std::to_string(res->status)};
        }
        return parseResponse(res->body);
    }
};

HttpResponseGenerator::HttpResponseGenerator(core::EventLoop& loop,
                                             core::BackgroundExecutor& executor,
                                             const std::string& base_url,
                                             const std::string& path,
                                             int timeout_ms)
    : impl_(std::make_shared<Impl>(loop, executor, base_url, path, timeout_ms))
{
    std::cout << "[ResponseGenerator] Backend " << base_url << path << std::endl;
}

HttpResponseGenerator::~HttpResponseGenerator() = default;

bool HttpResponseGenerator::isHealthy() {
    auto res = impl_->client->Get("/health");
    return res && res->status == 200;
}

std::string HttpResponseGenerator::buildRequest(const std::string& question,
                                                const std::vector<Exchange>& history) {
    json turns = json::array();
    for (const auto& exchange : history) {
        turns.push_back({{"question", exchange.question}, {"answer", exchange.answer}});
    }

    json req = {
        {"question", question},
        {"history", turns},
        {"is_first_message", history.empty()}
    };
    return req.dump();
}

ResponseResult HttpResponseGenerator::parseResponse(const std::string& body) {
    ResponseResult result;
    try {
        json res = json::parse(body);
        result.answer = res.value("answer", "");
        result.ok = !result.answer.empty();
        if (!result.ok) result.error = "reply has no answer";
    } catch (const std::exception& e) {
        result.error = std::string("JSON parse error: ") + e.what();
    }
    return result;
}

ResponseResult HttpResponseGenerator::askSync(const std::string& question,
                                              const std::vector<Exchange>& history) {
    return impl_->post(question, history);
}

void HttpResponseGenerator::ask(const std::string& question,
                                const std::vector<Exchange>& history,
                                Callback done) {
    // The job holds the client alive until the request returns
    std::shared_ptr<Impl> impl = impl_;
    impl_->executor.submit<ResponseResult>(impl_->loop,
        [impl, question, history]() {
            return impl->post(question, history);
        },
        [done = std::move(done)](ResponseResult result) {
            if (!result.ok) {
                std::cerr << "[ResponseGenerator] " << result.error << std::endl;
            }
            if (done) done(result);
        });
}

} // namespace hpv::llm
