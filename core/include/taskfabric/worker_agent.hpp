/**
 * @file worker_agent.hpp
 * @brief TaskFabric — worker side: connect, authenticate, execute, heartbeat
 *
 * After connect() two threads share the channel:
 *   heartbeat  sends heartbeat{worker_id} every interval
 *   message    runs execute_task requests through the TaskRegistry
 * Both write through the channel's writer lock.
 */

#ifndef TASKFABRIC_WORKER_AGENT_HPP
#define TASKFABRIC_WORKER_AGENT_HPP

#include "taskfabric/cipher.hpp"
#include "taskfabric/framed_channel.hpp"
#include "taskfabric/message.hpp"
#include "taskfabric/status.h"
#include "taskfabric/task_registry.hpp"
#include "taskfabric/wire_protocol.h"

#include <atomic>
#include <condition_variable>
#include <cstdint>
#include <memory>
#include <mutex>
#include <string>
#include <thread>

namespace taskfabric {

struct WorkerStatus {
    std::string worker_id;
    std::string hostname;
    std::string host;
    uint16_t    port           = 0;
    bool        connected      = false;
    bool        running        = false;
    uint64_t    tasks_executed = 0;
    uint64_t    tasks_failed   = 0;
};

class WorkerAgent {
public:
    struct Config {
        std::string host = "127.0.0.1";
        uint16_t    port = TF_DEFAULT_HOST_PORT;
        std::string otp;
        std::string worker_id;                 /* empty = hostname */
        std::string hostname;                  /* empty = gethostname() */
        cipher::Key bootstrap_key{};
        uint32_t    heartbeat_interval_ms = TF_DEFAULT_HEARTBEAT_MS;
        uint32_t    connection_timeout_ms = TF_DEFAULT_CONNECTION_TIMEOUT_MS;
    };

    WorkerAgent(Config cfg, std::shared_ptr<TaskRegistry> registry);
    ~WorkerAgent();

    WorkerAgent(const WorkerAgent&) = delete;
    WorkerAgent& operator=(const WorkerAgent&) = delete;

    /**
     * Connect, handshake, start both threads.
     *   TF_ERROR_CONNECTION_CLOSED  dispatcher unreachable
     *   TF_ERROR_AUTH_FAILED        rejected; *message has the reason
     */
    tf_status connect(std::string* message = nullptr);

    /** Best-effort disconnect, close, join. Idempotent. */
    void stop();

    /** True once the channel is gone; false on timeout. 0 = wait forever. */
    bool wait_until_disconnected(uint32_t timeout_ms = 0);

    bool connected() const { return connected_.load(std::memory_order_acquire); }
    WorkerStatus status() const;

    const std::string& worker_id() const { return cfg_.worker_id; }
    TaskRegistry& registry() { return *registry_; }

private:
    void heartbeat_loop();
    void message_loop();
    void handle_execute(const ExecuteTaskMsg& msg);
    void mark_disconnected();

    Config                          cfg_;
    std::shared_ptr<TaskRegistry>   registry_;
    std::unique_ptr<FramedChannel>  channel_;

    std::atomic<bool>               connected_{false};
    std::atomic<bool>               running_{false};
    std::atomic<uint64_t>           tasks_executed_{0};
    std::atomic<uint64_t>           tasks_failed_{0};

    mutable std::mutex              mu_;
    std::condition_variable         cv_;

    std::thread                     heartbeat_thread_;
    std::thread                     message_thread_;
};

} // namespace taskfabric

#endif // TASKFABRIC_WORKER_AGENT_HPP
