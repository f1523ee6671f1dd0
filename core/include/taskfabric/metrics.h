/**
 * @file metrics.h
 * @brief Structured logging & cluster metrics collection
 *
 * C-ABI compatible logging and counters. The dispatcher and worker
 * record admissions, evictions and task outcomes here; the counters
 * export as JSON or Prometheus text.
 */

#ifndef TASKFABRIC_METRICS_H
#define TASKFABRIC_METRICS_H

#include <stdint.h>
#include <stddef.h>

#include "status.h" /* TF_API */

#ifdef __cplusplus
extern "C" {
#endif

/* ---- Log Levels ---- */
typedef enum tf_log_level {
    TF_LOG_TRACE = 0,
    TF_LOG_DEBUG = 1,
    TF_LOG_INFO  = 2,
    TF_LOG_WARN  = 3,
    TF_LOG_ERROR = 4,
    TF_LOG_FATAL = 5,
    TF_LOG_OFF   = 6
} tf_log_level;

/* ---- Log callback ---- */
typedef void (*tf_log_fn)(tf_log_level level, const char* component,
                          const char* message, void* userdata);

TF_API void tf_log_set_callback(tf_log_fn fn, void* userdata);
TF_API void tf_log_set_level(tf_log_level level);
TF_API tf_log_level tf_log_get_level(void);
TF_API void tf_log(tf_log_level level, const char* component, const char* fmt, ...)
#if defined(__GNUC__) || defined(__clang__)
    __attribute__((format(printf, 3, 4)))
#endif
    ;

/**
 * Parse "TRACE" / "DEBUG" / "INFO" / "WARN" / "WARNING" / "ERROR" /
 * "FATAL" / "OFF" (case-insensitive). Returns 0 and leaves *out alone
 * for anything else.
 */
TF_API int tf_log_level_from_string(const char* name, tf_log_level* out);

/* ---- Metrics Collector ---- */

typedef struct tf_metrics_snapshot {
    uint32_t workers_admitted;
    uint32_t workers_rejected;
    uint32_t workers_evicted;
    uint32_t workers_disconnected;
    uint32_t tasks_dispatched;
    uint32_t tasks_completed;
    uint32_t tasks_failed;
    uint32_t tasks_timed_out;
    uint64_t task_latency_us;     /* sum over completed + failed */
    double   avg_task_latency_ms;
} tf_metrics_snapshot;

typedef enum tf_worker_event {
    TF_WORKER_ADMITTED     = 0,
    TF_WORKER_REJECTED     = 1,
    TF_WORKER_EVICTED      = 2,
    TF_WORKER_DISCONNECTED = 3
} tf_worker_event;

typedef enum tf_task_outcome {
    TF_TASK_DISPATCHED = 0,
    TF_TASK_COMPLETED  = 1,
    TF_TASK_FAILED     = 2,
    TF_TASK_TIMED_OUT  = 3
} tf_task_outcome;

TF_API void tf_metrics_reset(void);
TF_API void tf_metrics_record_worker(tf_worker_event ev);
TF_API void tf_metrics_record_task(tf_task_outcome outcome, uint64_t latency_us);
TF_API void tf_metrics_snapshot_get(tf_metrics_snapshot* out);
TF_API size_t tf_metrics_to_json(char* buf, size_t buf_size);
TF_API size_t tf_metrics_to_prometheus(char* buf, size_t buf_size);

#ifdef __cplusplus
}
#endif

#endif /* TASKFABRIC_METRICS_H */
