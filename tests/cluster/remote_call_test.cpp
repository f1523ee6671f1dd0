/**
 * @file remote_call_test.cpp
 * @brief Typed call stubs end to end: dispatcher + worker on loopback
 */

#include "taskfabric/cipher.hpp"
#include "taskfabric/dispatcher.hpp"
#include "taskfabric/metrics.h"
#include "taskfabric/remote_call.hpp"
#include "taskfabric/task_registry.hpp"
#include "taskfabric/worker_agent.hpp"

#include <chrono>
#include <cstdio>
#include <cstdlib>
#include <map>
#include <memory>
#include <string>
#include <thread>
#include <vector>

#define CHECK(cond, msg) do { \
    if (!(cond)) { \
        fprintf(stderr, "FAIL [%s:%d]: %s\n", __FILE__, __LINE__, msg); \
        exit(1); \
    } \
} while(0)

using namespace taskfabric;

static void test_task_ids() {
    std::string a = TaskClient::make_task_id("sum");
    std::string b = TaskClient::make_task_id("sum");
    CHECK(a.size() == 12 && a.compare(0, 4, "sum_") == 0, "handler_ prefix + 8 hex");
    CHECK(a.find_first_not_of("0123456789abcdef", 4) == std::string::npos, "lowercase hex");
    CHECK(a != b, "ids differ");
    fprintf(stderr, "  [PASS] test_task_ids\n");
}

static void test_typed_calls() {
    cipher::Key key{};
    CHECK(cipher::generate_key(&key) == TF_OK, "key");

    Dispatcher::Config dc;
    dc.bind_address    = "127.0.0.1";
    dc.port            = 0;
    dc.otp             = "REMOTE01";
    dc.task_timeout_ms = 3000;
    Dispatcher d(dc, key);
    CHECK(d.start() == TF_OK, "start");

    auto reg = std::make_shared<TaskRegistry>();
    register_demo_handlers(reg.get());
    reg->register_typed<std::vector<uint8_t>, std::vector<uint8_t>>("reverse",
        [](const std::vector<uint8_t>& in) {
            return std::vector<uint8_t>(in.rbegin(), in.rend());
        });
    reg->register_typed<std::map<std::string, int64_t>, int64_t>("total",
        [](const std::map<std::string, int64_t>& m) {
            int64_t t = 0;
            for (auto& [k, v] : m) t += v;
            return t;
        });

    WorkerAgent::Config wc;
    wc.host          = "127.0.0.1";
    wc.port          = d.port();
    wc.otp           = "REMOTE01";
    wc.worker_id     = "typed";
    wc.bootstrap_key = key;
    WorkerAgent w(wc, reg);
    CHECK(w.connect() == TF_OK, "connect");
    for (int i = 0; i < 300 && d.worker_count() == 0; ++i)
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
    CHECK(d.worker_count() == 1, "registered");

    TaskClient client(d);

    RemoteFunction<std::vector<int64_t>, int64_t> sum(client, "sum");
    int64_t total = 0;
    CHECK(sum(std::vector<int64_t>{1, 2, 3, 4}, &total) == TF_OK && total == 10, "sum");

    RemoteFunction<std::string, int64_t> words(client, "word_count", "typed");
    CHECK(words.target() == "typed" && words.handler() == "word_count", "accessors");
    int64_t n = 0;
    CHECK(words(std::string("a b c"), &n) == TF_OK && n == 3, "targeted word_count");

    RemoteFunction<std::vector<uint8_t>, std::vector<uint8_t>> rev(client, "reverse");
    std::vector<uint8_t> blob = {0x00, 0x10, 0xFF}, back;
    CHECK(rev(blob, &back) == TF_OK, "bytes call");
    CHECK(back == std::vector<uint8_t>({0xFF, 0x10, 0x00}), "bytes reversed");

    RemoteFunction<std::map<std::string, int64_t>, int64_t> tot(client, "total");
    CHECK(tot({{"a", 5}, {"b", 7}}, &total) == TF_OK && total == 12, "map args");

    /* A result of the wrong shape. */
    RemoteFunction<std::string, std::string> wrong(client, "word_count");
    std::string s, error;
    CHECK(wrong(std::string("x y"), &s, &error) == TF_ERROR_PROTOCOL, "result mismatch");
    CHECK(error.find("word_count") != std::string::npos, "mismatch names handler");

    /* Handler-side argument mismatch. */
    RemoteFunction<std::string, int64_t> bad_args(client, "sum");
    CHECK(bad_args(std::string("x"), &n, &error) == TF_ERROR_TASK_EXECUTION, "bad args");

    RemoteFunction<Value, Value> raw(client, "echo", "ghost");
    Value v;
    CHECK(raw(Value("hi"), &v) == TF_ERROR_WORKER_NOT_FOUND, "unknown target");

    Value untyped;
    CHECK(client.call("echo", Value(true), &untyped) == TF_OK && untyped.as_bool(),
          "untyped call");
    CHECK(d.pending_count() == 0, "no pending entries left");

    w.stop();
    d.stop();
    fprintf(stderr, "  [PASS] test_typed_calls\n");
}

int main() {
    fprintf(stderr, "[remote_call_test]\n");
    tf_log_set_level(TF_LOG_WARN);
    test_task_ids();
    test_typed_calls();
    fprintf(stderr, "[remote_call_test] ALL PASSED\n");
    return 0;
}
