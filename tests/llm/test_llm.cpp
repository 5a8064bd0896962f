/**
 * test_llm.cpp - Conversation history and the tutoring backend client
 */

#include "hpv/core/BackgroundExecutor.hpp"
#include "hpv/core/EventLoop.hpp"
#include "hpv/llm/ConversationHistory.hpp"
#include "hpv/llm/HttpResponseGenerator.hpp"

#include <cassert>
#include <chrono>
#include <iostream>
#include <optional>
#include <thread>

#include <httplib.h>
#include <nlohmann/json.hpp>

using namespace hpv;
using json = nlohmann::json;

void test_history_window() {
    llm::ConversationHistory history;
    assert(history.empty());
    assert(history.window() == 5);

    for (int i = 1; i <= 7; i++) {
        history.add("q" + std::to_string(i), "a" + std::to_string(i));
    }
    assert(history.size() == 5);

    auto recent = history.recent();
    assert(recent.size() == 5);
    assert(recent.front().question == "q3");
    assert(recent.back().question == "q7");
    assert(recent.back().answer == "a7");

    history.clear();
    assert(history.recent().empty());

    std::cout << "[PASS] test_history_window" << std::endl;
}

void test_request_body() {
    json first = json::parse(llm::HttpResponseGenerator::buildRequest("What is an atom?", {}));
    assert(first["question"] == "What is an atom?");
    assert(first["history"].is_array() && first["history"].empty());
    assert(first["is_first_message"] == true);

    std::vector<llm::Exchange> history = {
        {"What is an atom?", "The smallest unit of matter."},
        {"What is it made of?", "Protons, neutrons and electrons."}
    };
    json next = json::parse(llm::HttpResponseGenerator::buildRequest("Are they tiny?", history));
    assert(next["is_first_message"] == false);
    assert(next["history"].size() == 2);
    assert(next["history"][0]["question"] == "What is an atom?");
    assert(next["history"][1]["answer"] == "Protons, neutrons and electrons.");

    std::cout << "[PASS] test_request_body" << std::endl;
}

void test_parse_response() {
    auto ok = llm::HttpResponseGenerator::parseResponse(R"({"answer":"Plants use sunlight.","sources":[]})");
    assert(ok.ok);
    assert(ok.answer == "Plants use sunlight.");

    auto missing = llm::HttpResponseGenerator::parseResponse(R"({"detail":"Not found"})");
    assert(!missing.ok);
    assert(!missing.error.empty());

    auto garbage = llm::HttpResponseGenerator::parseResponse("<html>502</html>");
    assert(!garbage.ok);
    assert(garbage.error.find("JSON") != std::string::npos);

    std::cout << "[PASS] test_parse_response" << std::endl;
}

void test_unreachable_backend() {
    core::EventLoop loop(core::EventLoop::ClockMode::Manual);
    core::BackgroundExecutor executor("test", core::BackgroundExecutor::Mode::Inline);
    llm::HttpResponseGenerator generator(loop, executor, "http://127.0.0.1:1", "/ask_question/", 1000);

    std::optional<llm::ResponseResult> result;
    generator.ask("Hello?", {}, [&result](const llm::ResponseResult& r) { result = r; });

    // Delivered through the loop, never from inside ask()
    assert(!result);
    loop.runPending();
    assert(result);
    assert(!result->ok);
    assert(!result->error.empty());

    std::cout << "[PASS] test_unreachable_backend" << std::endl;
}

void test_local_backend() {
    httplib::Server server;
    std::string received;
    server.Post("/ask_question/", [&received](const httplib::Request& req, httplib::Response& res) {
        received = req.body;
        res.set_content(R"({"answer":"Plants turn light into food."})", "application/json");
    });

    int port = server.bind_to_any_port("127.0.0.1");
    assert(port > 0);
    std::thread thread([&server]() { server.listen_after_bind(); });
    while (!server.is_running()) {
        std::this_thread::sleep_for(std::chrono::milliseconds(5));
    }

    core::EventLoop loop(core::EventLoop::ClockMode::Manual);
    core::BackgroundExecutor executor("test", core::BackgroundExecutor::Mode::Inline);
    llm::HttpResponseGenerator generator(loop, executor,
                                         "http://127.0.0.1:" + std::to_string(port),
                                         "/ask_question/", 5000);

    std::vector<llm::Exchange> history = {{"Hi Pal", "Hi! What shall we learn?"}};
    std::optional<llm::ResponseResult> result;
    generator.ask("What is photosynthesis?", history,
                  [&result](const llm::ResponseResult& r) { result = r; });
    loop.runPending();

    server.stop();
    thread.join();

    assert(result && result->ok);
    assert(result->answer == "Plants turn light into food.");

    json body = json::parse(received);
    assert(body["question"] == "What is photosynthesis?");
    assert(body["is_first_message"] == false);
    assert(body["history"].size() == 1);

    std::cout << "[PASS] test_local_backend" << std::endl;
}

void test_live_backend() {
    core::EventLoop loop(core::EventLoop::ClockMode::Manual);
    core::BackgroundExecutor executor("test", core::BackgroundExecutor::Mode::Inline);
    llm::HttpResponseGenerator generator(loop, executor);

    if (!generator.isHealthy()) {
        std::cout << "[SKIP] test_live_backend (no backend at http://localhost:8003)" << std::endl;
        return;
    }

    auto result = generator.askSync("What is two plus two?", {});
    assert(result.ok);
    std::cout << "  Pal: " << result.answer << std::endl;
    std::cout << "[PASS] test_live_backend" << std::endl;
}

int main() {
    std::cout << "=== LLM Tests ===" << std::endl;

    test_history_window();
    test_request_body();
    test_parse_response();
    test_unreachable_backend();
    test_local_backend();
    test_live_backend();

    std::cout << "\nAll tests passed!" << std::endl;
    return 0;
}
