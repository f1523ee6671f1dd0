/**
 * @file metrics_test.cpp
 * @brief Log levels, log callback, counters and their exports
 */

#include "taskfabric/metrics.h"

#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <string>
#include <vector>

#define CHECK(cond, msg) do { \
    if (!(cond)) { \
        fprintf(stderr, "FAIL [%s:%d]: %s\n", __FILE__, __LINE__, msg); \
        exit(1); \
    } \
} while(0)

struct Captured {
    std::vector<std::string> lines;
};

static void capture(tf_log_level level, const char* component,
                    const char* message, void* ud) {
    auto* c = static_cast<Captured*>(ud);
    c->lines.push_back(std::to_string(level) + " " + component + " " + message);
}

static void test_logging() {
    Captured cap;
    tf_log_set_callback(capture, &cap);
    tf_log_set_level(TF_LOG_WARN);

    tf_log(TF_LOG_INFO, "dispatcher", "dropped %d", 1);
    tf_log(TF_LOG_WARN, "dispatcher", "worker %s evicted", "w1");
    tf_log(TF_LOG_ERROR, "channel", "bad frame");
    CHECK(cap.lines.size() == 2, "below-threshold message filtered");
    CHECK(cap.lines[0] == "3 dispatcher worker w1 evicted", "formatted message");

    tf_log_set_level(TF_LOG_OFF);
    tf_log(TF_LOG_FATAL, "x", "never");
    CHECK(cap.lines.size() == 2, "OFF silences everything");

    tf_log_set_callback(nullptr, nullptr);
    tf_log_set_level(TF_LOG_INFO);
    fprintf(stderr, "  [PASS] test_logging\n");
}

static void test_level_names() {
    tf_log_level l = TF_LOG_INFO;
    CHECK(tf_log_level_from_string("debug", &l) && l == TF_LOG_DEBUG, "lowercase");
    CHECK(tf_log_level_from_string("WARNING", &l) && l == TF_LOG_WARN, "alias");
    CHECK(tf_log_level_from_string("Critical", &l) && l == TF_LOG_FATAL, "critical");
    CHECK(!tf_log_level_from_string("loud", &l) && l == TF_LOG_FATAL, "unknown untouched");
    CHECK(!tf_log_level_from_string("", &l), "empty");
    fprintf(stderr, "  [PASS] test_level_names\n");
}

static void test_counters() {
    tf_metrics_reset();
    tf_metrics_record_worker(TF_WORKER_ADMITTED);
    tf_metrics_record_worker(TF_WORKER_ADMITTED);
    tf_metrics_record_worker(TF_WORKER_REJECTED);
    tf_metrics_record_worker(TF_WORKER_EVICTED);
    tf_metrics_record_worker(TF_WORKER_DISCONNECTED);
    tf_metrics_record_task(TF_TASK_DISPATCHED, 0);
    tf_metrics_record_task(TF_TASK_DISPATCHED, 0);
    tf_metrics_record_task(TF_TASK_DISPATCHED, 0);
    tf_metrics_record_task(TF_TASK_COMPLETED, 2000);
    tf_metrics_record_task(TF_TASK_FAILED, 4000);
    tf_metrics_record_task(TF_TASK_TIMED_OUT, 0);

    tf_metrics_snapshot s;
    tf_metrics_snapshot_get(&s);
    CHECK(s.workers_admitted == 2 && s.workers_rejected == 1 && s.workers_evicted == 1,
          "worker counters");
    CHECK(s.workers_disconnected == 1, "disconnect counter");
    CHECK(s.tasks_dispatched == 3 && s.tasks_completed == 1 &&
          s.tasks_failed == 1 && s.tasks_timed_out == 1, "task counters");
    CHECK(s.avg_task_latency_ms == 3.0, "average over finished tasks");

    char buf[2048];
    CHECK(tf_metrics_to_json(buf, sizeof(buf)) > 0, "json export");
    CHECK(std::strstr(buf, "\"tasks_timed_out\":1") != nullptr, "json field");
    CHECK(std::strstr(buf, "\"workers_disconnected\":1") != nullptr, "json disconnects");
    CHECK(std::strstr(buf, "\"avg_task_latency_ms\":3.00") != nullptr, "json latency");

    CHECK(tf_metrics_to_prometheus(buf, sizeof(buf)) > 0, "prometheus export");
    CHECK(std::strstr(buf, "tf_workers_admitted 2\n") != nullptr, "prometheus sample");
    CHECK(std::strstr(buf, "tf_workers_disconnected 1\n") != nullptr,
          "prometheus disconnects");

    tf_metrics_reset();
    tf_metrics_snapshot_get(&s);
    CHECK(s.workers_admitted == 0 && s.avg_task_latency_ms == 0.0, "reset");
    fprintf(stderr, "  [PASS] test_counters\n");
}

int main() {
    fprintf(stderr, "[metrics_test]\n");
    test_logging();
    test_level_names();
    test_counters();
    fprintf(stderr, "[metrics_test] ALL PASSED\n");
    return 0;
}
