/**
 * @file config.hpp
 * @brief TaskFabric — process configuration and the session key file
 *
 * Defaults come from wire_protocol.h; every field can be overridden by a
 * TASKFABRIC_* environment variable. Timeouts are (fractional) seconds in
 * the environment and milliseconds here.
 */

#ifndef TASKFABRIC_CONFIG_HPP
#define TASKFABRIC_CONFIG_HPP

#include "taskfabric/cipher.hpp"
#include "taskfabric/dispatcher.hpp"
#include "taskfabric/metrics.h"
#include "taskfabric/status.h"
#include "taskfabric/wire_protocol.h"
#include "taskfabric/worker_agent.hpp"

#include <cstdint>
#include <string>

namespace taskfabric {

struct Config {
    uint16_t     host_port             = TF_DEFAULT_HOST_PORT;
    uint16_t     worker_port           = TF_DEFAULT_WORKER_PORT;   /* reserved */
    std::string  host_address          = "0.0.0.0";
    size_t       otp_length            = TF_DEFAULT_OTP_LENGTH;
    size_t       chunk_size            = TF_DEFAULT_CHUNK_SIZE;
    uint64_t     max_file_size         = TF_DEFAULT_MAX_FILE_SIZE;
    uint32_t     connection_timeout_ms = TF_DEFAULT_CONNECTION_TIMEOUT_MS;
    uint32_t     task_timeout_ms       = TF_DEFAULT_TASK_TIMEOUT_MS;
    uint32_t     heartbeat_interval_ms = TF_DEFAULT_HEARTBEAT_MS;
    tf_log_level log_level             = TF_LOG_INFO;
    size_t       max_workers           = TF_DEFAULT_MAX_WORKERS;

    /**
     * Defaults overridden by TASKFABRIC_HOST_PORT, _WORKER_PORT,
     * _HOST_ADDRESS, _OTP_LENGTH, _CHUNK_SIZE, _MAX_FILE_SIZE,
     * _CONNECTION_TIMEOUT, _TASK_TIMEOUT, _HEARTBEAT_INTERVAL, _LOG_LEVEL,
     * _MAX_WORKERS. An unparsable value keeps the default (logged).
     */
    static Config from_env();

    Dispatcher::Config  dispatcher_config() const;
    WorkerAgent::Config worker_config(const std::string& host,
                                      const std::string& otp,
                                      const std::string& worker_id,
                                      const cipher::Key& key) const;
};

/* ---- Key file: {"encryption_key": "<64 hex digits>"} -------------- */

tf_status save_key_file(const std::string& path, const cipher::Key& key);

/** TF_ERROR_IO if unreadable, TF_ERROR_PROTOCOL if malformed. */
tf_status load_key_file(const std::string& path, cipher::Key* key);

} // namespace taskfabric

#endif // TASKFABRIC_CONFIG_HPP
