/**
 * @file metrics.cpp
 * @brief Metrics collector + structured logging implementation
 */

#include "taskfabric/metrics.h"

#include <atomic>
#include <cctype>
#include <cstdarg>
#include <cstdio>
#include <cstring>
#include <mutex>

/* ---- Status ---- */

const char* tf_status_str(tf_status st) {
    switch (st) {
        case TF_OK:                        return "ok";
        case TF_ERROR_INVALID_ARG:         return "invalid argument";
        case TF_ERROR_CONNECTION_CLOSED:   return "connection closed";
        case TF_ERROR_AUTH_FAILED:         return "authentication failed";
        case TF_ERROR_DECRYPTION:          return "decryption error";
        case TF_ERROR_WORKER_NOT_FOUND:    return "worker not found";
        case TF_ERROR_NO_AVAILABLE_WORKER: return "no available worker";
        case TF_ERROR_TASK_TIMEOUT:        return "task timeout";
        case TF_ERROR_TASK_EXECUTION:      return "task execution error";
        case TF_ERROR_PROTOCOL:            return "protocol error";
        case TF_ERROR_UNKNOWN_MESSAGE:     return "unknown message type";
        case TF_ERROR_IO:                  return "i/o error";
        case TF_ERROR_INTERNAL:            return "internal error";
        default:                           return "?";
    }
}

/* ---- Logging ---- */

static tf_log_fn                  s_log_fn    = nullptr;
static void*                      s_log_ud    = nullptr;
static std::atomic<tf_log_level>  s_log_level{TF_LOG_INFO};
static std::mutex                 s_log_mu;

void tf_log_set_callback(tf_log_fn fn, void* userdata) {
    std::lock_guard<std::mutex> lk(s_log_mu);
    s_log_fn = fn;
    s_log_ud = userdata;
}

void tf_log_set_level(tf_log_level level) {
    s_log_level.store(level, std::memory_order_relaxed);
}

tf_log_level tf_log_get_level(void) {
    return s_log_level.load(std::memory_order_relaxed);
}

static const char* level_str(tf_log_level l) {
    switch (l) {
        case TF_LOG_TRACE: return "TRACE";
        case TF_LOG_DEBUG: return "DEBUG";
        case TF_LOG_INFO:  return "INFO";
        case TF_LOG_WARN:  return "WARN";
        case TF_LOG_ERROR: return "ERROR";
        case TF_LOG_FATAL: return "FATAL";
        default:           return "?";
    }
}

int tf_log_level_from_string(const char* name, tf_log_level* out) {
    if (!name || !out) return 0;
    char up[16] = {};
    size_t n = std::strlen(name);
    if (n == 0 || n >= sizeof(up)) return 0;
    for (size_t i = 0; i < n; ++i)
        up[i] = static_cast<char>(std::toupper(static_cast<unsigned char>(name[i])));

    static const struct { const char* name; tf_log_level level; } table[] = {
        {"TRACE", TF_LOG_TRACE}, {"DEBUG", TF_LOG_DEBUG},
        {"INFO",  TF_LOG_INFO},  {"WARN",  TF_LOG_WARN},
        {"WARNING", TF_LOG_WARN}, {"ERROR", TF_LOG_ERROR},
        {"FATAL", TF_LOG_FATAL}, {"CRITICAL", TF_LOG_FATAL},
        {"OFF",   TF_LOG_OFF},
    };
    for (const auto& e : table) {
        if (std::strcmp(up, e.name) == 0) {
            *out = e.level;
            return 1;
        }
    }
    return 0;
}

void tf_log(tf_log_level level, const char* component, const char* fmt, ...) {
    if (level < tf_log_get_level()) return;

    char buf[1024];
    va_list ap;
    va_start(ap, fmt);
    vsnprintf(buf, sizeof(buf), fmt, ap);
    va_end(ap);

    std::lock_guard<std::mutex> lk(s_log_mu);
    if (s_log_fn) {
        s_log_fn(level, component, buf, s_log_ud);
    } else {
        std::fprintf(stderr, "[%s] %s: %s\n", level_str(level), component, buf);
    }
}

/* ---- Metrics ---- */

static struct {
    std::atomic<uint32_t> workers_admitted{0};
    std::atomic<uint32_t> workers_rejected{0};
    std::atomic<uint32_t> workers_evicted{0};
    std::atomic<uint32_t> workers_disconnected{0};
    std::atomic<uint32_t> tasks_dispatched{0};
    std::atomic<uint32_t> tasks_completed{0};
    std::atomic<uint32_t> tasks_failed{0};
    std::atomic<uint32_t> tasks_timed_out{0};
    std::atomic<uint64_t> task_latency_us{0};
} s_metrics;

void tf_metrics_reset(void) {
    s_metrics.workers_admitted.store(0);
    s_metrics.workers_rejected.store(0);
    s_metrics.workers_evicted.store(0);
    s_metrics.workers_disconnected.store(0);
    s_metrics.tasks_dispatched.store(0);
    s_metrics.tasks_completed.store(0);
    s_metrics.tasks_failed.store(0);
    s_metrics.tasks_timed_out.store(0);
    s_metrics.task_latency_us.store(0);
}

void tf_metrics_record_worker(tf_worker_event ev) {
    switch (ev) {
        case TF_WORKER_ADMITTED:     s_metrics.workers_admitted.fetch_add(1); break;
        case TF_WORKER_REJECTED:     s_metrics.workers_rejected.fetch_add(1); break;
        case TF_WORKER_EVICTED:      s_metrics.workers_evicted.fetch_add(1); break;
        case TF_WORKER_DISCONNECTED: s_metrics.workers_disconnected.fetch_add(1); break;
    }
}

void tf_metrics_record_task(tf_task_outcome outcome, uint64_t latency_us) {
    switch (outcome) {
        case TF_TASK_DISPATCHED:
            s_metrics.tasks_dispatched.fetch_add(1);
            break;
        case TF_TASK_COMPLETED:
            s_metrics.tasks_completed.fetch_add(1);
            s_metrics.task_latency_us.fetch_add(latency_us);
            break;
        case TF_TASK_FAILED:
            s_metrics.tasks_failed.fetch_add(1);
            s_metrics.task_latency_us.fetch_add(latency_us);
            break;
        case TF_TASK_TIMED_OUT:
            s_metrics.tasks_timed_out.fetch_add(1);
            break;
    }
}

void tf_metrics_snapshot_get(tf_metrics_snapshot* out) {
    out->workers_admitted     = s_metrics.workers_admitted.load();
    out->workers_rejected     = s_metrics.workers_rejected.load();
    out->workers_evicted      = s_metrics.workers_evicted.load();
    out->workers_disconnected = s_metrics.workers_disconnected.load();
    out->tasks_dispatched     = s_metrics.tasks_dispatched.load();
    out->tasks_completed      = s_metrics.tasks_completed.load();
    out->tasks_failed         = s_metrics.tasks_failed.load();
    out->tasks_timed_out      = s_metrics.tasks_timed_out.load();
    out->task_latency_us      = s_metrics.task_latency_us.load();
    uint32_t finished = out->tasks_completed + out->tasks_failed;
    out->avg_task_latency_ms = (finished > 0)
        ? (double)out->task_latency_us / 1e3 / (double)finished : 0.0;
}

size_t tf_metrics_to_json(char* buf, size_t buf_size) {
    tf_metrics_snapshot snap;
    tf_metrics_snapshot_get(&snap);
    int n = snprintf(buf, buf_size,
        "{\"workers_admitted\":%u,\"workers_rejected\":%u,"
        "\"workers_evicted\":%u,\"workers_disconnected\":%u,"
        "\"tasks_dispatched\":%u,\"tasks_completed\":%u,"
        "\"tasks_failed\":%u,\"tasks_timed_out\":%u,"
        "\"avg_task_latency_ms\":%.2f}",
        snap.workers_admitted, snap.workers_rejected,
        snap.workers_evicted, snap.workers_disconnected,
        snap.tasks_dispatched, snap.tasks_completed,
        snap.tasks_failed, snap.tasks_timed_out,
        snap.avg_task_latency_ms);
    return (n > 0) ? (size_t)n : 0;
}

size_t tf_metrics_to_prometheus(char* buf, size_t buf_size) {
    tf_metrics_snapshot snap;
    tf_metrics_snapshot_get(&snap);
    int n = snprintf(buf, buf_size,
        "# HELP tf_workers_admitted Workers that passed the handshake\n"
        "# TYPE tf_workers_admitted counter\n"
        "tf_workers_admitted %u\n"
        "# HELP tf_workers_rejected Handshakes refused\n"
        "# TYPE tf_workers_rejected counter\n"
        "tf_workers_rejected %u\n"
        "# HELP tf_workers_evicted Workers dropped by the heartbeat monitor\n"
        "# TYPE tf_workers_evicted counter\n"
        "tf_workers_evicted %u\n"
        "# HELP tf_workers_disconnected Workers whose connection ended\n"
        "# TYPE tf_workers_disconnected counter\n"
        "tf_workers_disconnected %u\n"
        "# HELP tf_tasks_dispatched Tasks sent to workers\n"
        "# TYPE tf_tasks_dispatched counter\n"
        "tf_tasks_dispatched %u\n"
        "# HELP tf_tasks_completed Tasks reported successful\n"
        "# TYPE tf_tasks_completed counter\n"
        "tf_tasks_completed %u\n"
        "# HELP tf_tasks_failed Tasks reported failed\n"
        "# TYPE tf_tasks_failed counter\n"
        "tf_tasks_failed %u\n"
        "# HELP tf_tasks_timed_out Tasks that hit their deadline\n"
        "# TYPE tf_tasks_timed_out counter\n"
        "tf_tasks_timed_out %u\n",
        snap.workers_admitted, snap.workers_rejected, snap.workers_evicted,
        snap.workers_disconnected, snap.tasks_dispatched, snap.tasks_completed,
        snap.tasks_failed, snap.tasks_timed_out);
    return (n > 0) ? (size_t)n : 0;
}
