/**
 * @file dispatcher.hpp
 * @brief TaskFabric — dispatcher: admission, worker registry, task dispatch
 *
 * Threads:
 *   accept   one, runs tcp::accept and hands sockets to connection threads
 *   monitor  one, evicts workers silent for more than 2 × heartbeat interval
 *   conn     one per accepted socket: handshake, then the message loop
 *
 * A single mutex guards the registry, the id reservations of workers
 * mid-handshake, the pending-result map and the session secret.
 */

#ifndef TASKFABRIC_DISPATCHER_HPP
#define TASKFABRIC_DISPATCHER_HPP

#include "taskfabric/cipher.hpp"
#include "taskfabric/framed_channel.hpp"
#include "taskfabric/message.hpp"
#include "taskfabric/status.h"
#include "taskfabric/value.hpp"
#include "taskfabric/wire_protocol.h"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <future>
#include <list>
#include <memory>
#include <mutex>
#include <set>
#include <string>
#include <thread>
#include <unordered_map>
#include <vector>

namespace taskfabric {

/* ================================================================== */
/*  WorkerSnapshot — value copy of one registry entry                  */
/* ================================================================== */

struct WorkerSnapshot {
    std::string worker_id;
    std::string hostname;
    std::string address;
    bool        active            = false;
    std::string current_task;           /* empty = idle */
    uint64_t    last_heartbeat_ms = 0;  /* wall clock, ms since epoch */
    uint64_t    connected_at_ms   = 0;
};

/* ================================================================== */
/*  Dispatcher                                                         */
/* ================================================================== */

class Dispatcher {
public:
    struct Config {
        std::string bind_address          = "0.0.0.0";
        uint16_t    port                  = TF_DEFAULT_HOST_PORT;  /* 0 = ephemeral */
        uint32_t    heartbeat_interval_ms = TF_DEFAULT_HEARTBEAT_MS;
        uint32_t    task_timeout_ms       = TF_DEFAULT_TASK_TIMEOUT_MS;
        uint32_t    connection_timeout_ms = TF_DEFAULT_CONNECTION_TIMEOUT_MS;
        size_t      otp_length            = TF_DEFAULT_OTP_LENGTH;
        std::string otp;                  /* preset secret; empty = generate */
        size_t      max_workers           = TF_DEFAULT_MAX_WORKERS;
        /** On timeout, clear the worker's task mark so it can be reused. */
        bool        release_worker_on_timeout = true;
    };

    /**
     * `bootstrap_key` encrypts the handshake; `session_key` is handed to
     * admitted workers and used afterwards.
     */
    Dispatcher(Config cfg, const cipher::Key& bootstrap_key,
               const cipher::Key& session_key);

    /** Bootstrap and session key are the same key. */
    Dispatcher(Config cfg, const cipher::Key& key);

    ~Dispatcher();

    Dispatcher(const Dispatcher&) = delete;
    Dispatcher& operator=(const Dispatcher&) = delete;

    /* ---- Lifecycle ------------------------------------------------ */

    tf_status start();

    /** Disconnect all workers, join every thread, fail pending results. */
    void stop();

    bool     running() const { return running_.load(std::memory_order_acquire); }
    uint16_t port() const { return port_; }

    /* ---- Dispatch ------------------------------------------------- */

    /**
     * Send `work` to `target_worker` (or, when empty, to the first idle
     * active worker) and block until its result or the task timeout.
     *
     *   TF_OK                         *result holds the handler's value
     *   TF_ERROR_WORKER_NOT_FOUND     target not registered or inactive
     *   TF_ERROR_NO_AVAILABLE_WORKER  no idle worker; returned at once
     *   TF_ERROR_TASK_TIMEOUT         deadline passed, entry removed
     *   TF_ERROR_TASK_EXECUTION       worker reported failure (*error)
     *   TF_ERROR_CONNECTION_CLOSED    send failed, or dispatcher stopped
     *   TF_ERROR_INVALID_ARG          empty or already-pending task id,
     *                                 or args fail is_encodable()
     */
    tf_status execute_task(const std::string& task_id,
                           const TaskWork& work,
                           Value* result,
                           std::string* error = nullptr,
                           const std::string& target_worker = std::string());

    /* ---- Session secret ------------------------------------------- */

    /** New OTP; only later handshakes see it. */
    std::string regenerate_session_secret();
    std::string session_secret() const;
    tf_status   set_session_secret(const std::string& otp);

    const cipher::Key& session_key() const { return session_key_; }

    /* ---- Queries -------------------------------------------------- */

    std::vector<WorkerSnapshot> snapshot_workers() const;
    size_t worker_count() const;
    size_t pending_count() const;
    bool   has_pending(const std::string& task_id) const;

    const Config& config() const { return cfg_; }

private:
    using Clock = std::chrono::steady_clock;

    struct WorkerRecord {
        std::string                    worker_id;
        std::string                    hostname;
        std::string                    address;
        std::shared_ptr<FramedChannel> channel;
        Clock::time_point              last_heartbeat;
        uint64_t                       last_heartbeat_ms = 0;
        uint64_t                       connected_at_ms   = 0;
        bool                           active = true;
        std::string                    current_task;
    };

    struct Outcome {
        tf_status   status = TF_OK;
        Value       value;
        std::string error;
    };

    struct PendingResult {
        std::string           task_id;
        std::string           worker_id;
        std::promise<Outcome> promise;
        Clock::time_point     dispatched_at;
        Clock::time_point     deadline;
    };

    struct Connection {
        std::shared_ptr<FramedChannel> channel;
        std::thread                    thread;
        std::atomic<bool>              done{false};
    };

    void accept_loop();
    void monitor_loop();
    void serve_connection(Connection* conn);
    void message_loop(const std::shared_ptr<WorkerRecord>& rec);
    void handle_task_result(const std::shared_ptr<WorkerRecord>& rec,
                            const TaskResultMsg& msg);
    bool admit(const AuthMsg& auth, std::string* reason);
    void reap_connections(bool all);

    /* Caller holds mu_. */
    std::shared_ptr<WorkerRecord> find_worker_locked(const std::string& id) const;
    bool remove_worker_locked(const std::shared_ptr<WorkerRecord>& rec);

    static uint64_t wall_ms();

    Config             cfg_;
    cipher::Key        bootstrap_key_;
    cipher::Key        session_key_;

    mutable std::mutex mu_;
    std::condition_variable stop_cv_;
    std::vector<std::shared_ptr<WorkerRecord>> workers_;   /* admission order */
    std::set<std::string>                      reserved_;
    std::unordered_map<std::string, std::shared_ptr<PendingResult>> pending_;
    std::string        secret_;

    std::mutex                              conn_mu_;
    std::list<std::unique_ptr<Connection>>  conns_;

    std::atomic<bool>  running_{false};
    int                listen_fd_ = -1;
    uint16_t           port_      = 0;
    std::thread        accept_thread_;
    std::thread        monitor_thread_;
};

} // namespace taskfabric

#endif // TASKFABRIC_DISPATCHER_HPP
