/**
 * @file worker_agent.cpp
 * @brief Worker: outbound connect, handshake, task execution, heartbeats
 */

#include "taskfabric/worker_agent.hpp"
#include "taskfabric/handshake.hpp"
#include "taskfabric/metrics.h"

#include <chrono>
#include <unistd.h>

namespace taskfabric {

static std::string local_hostname() {
    char buf[256] = {0};
    if (::gethostname(buf, sizeof(buf) - 1) != 0) return "localhost";
    return buf;
}

WorkerAgent::WorkerAgent(Config cfg, std::shared_ptr<TaskRegistry> registry)
    : cfg_(std::move(cfg)),
      registry_(registry ? std::move(registry) : std::make_shared<TaskRegistry>()) {
    if (cfg_.hostname.empty())  cfg_.hostname  = local_hostname();
    if (cfg_.worker_id.empty()) cfg_.worker_id = cfg_.hostname;
}

WorkerAgent::~WorkerAgent() {
    stop();
}

tf_status WorkerAgent::connect(std::string* message) {
    if (connected()) return TF_ERROR_INVALID_ARG;
    if (cfg_.otp.empty() || cfg_.heartbeat_interval_ms == 0)
        return TF_ERROR_INVALID_ARG;

    /* Threads of a previous session have exited; reclaim them. */
    if (heartbeat_thread_.joinable()) heartbeat_thread_.join();
    if (message_thread_.joinable())   message_thread_.join();

    std::unique_ptr<FramedChannel> ch;
    tf_status st = FramedChannel::connect(cfg_.host, cfg_.port, cfg_.bootstrap_key,
                                          static_cast<int>(cfg_.connection_timeout_ms),
                                          &ch);
    if (st != TF_OK) {
        if (message) *message = "cannot reach " + cfg_.host + ":" + std::to_string(cfg_.port);
        return st;
    }

    ch->set_receive_timeout(static_cast<int>(cfg_.connection_timeout_ms));
    st = handshake::client_handshake(*ch, cfg_.otp, cfg_.worker_id,
                                     cfg_.hostname, message);
    if (st != TF_OK) {
        ch->close();
        return st;
    }
    ch->set_receive_timeout(0);

    channel_ = std::move(ch);
    running_.store(true, std::memory_order_release);
    connected_.store(true, std::memory_order_release);

    heartbeat_thread_ = std::thread(&WorkerAgent::heartbeat_loop, this);
    message_thread_   = std::thread(&WorkerAgent::message_loop, this);

    tf_log(TF_LOG_INFO, "worker", "%s connected to %s:%u",
           cfg_.worker_id.c_str(), cfg_.host.c_str(),
           static_cast<unsigned>(cfg_.port));
    return TF_OK;
}

void WorkerAgent::stop() {
    bool was_running = running_.exchange(false, std::memory_order_acq_rel);

    if (was_running && channel_) {
        if (connected()) {
            DisconnectMsg bye;
            bye.worker_id = cfg_.worker_id;
            if (channel_->send(bye) != TF_OK)
                tf_log(TF_LOG_DEBUG, "worker", "disconnect not delivered");
        }
        channel_->close();
    }
    {
        std::lock_guard<std::mutex> lk(mu_);
        cv_.notify_all();
    }

    if (heartbeat_thread_.joinable()) heartbeat_thread_.join();
    if (message_thread_.joinable())   message_thread_.join();

    if (was_running)
        tf_log(TF_LOG_INFO, "worker", "%s stopped", cfg_.worker_id.c_str());
}

void WorkerAgent::mark_disconnected() {
    std::lock_guard<std::mutex> lk(mu_);
    connected_.store(false, std::memory_order_release);
    cv_.notify_all();
}

bool WorkerAgent::wait_until_disconnected(uint32_t timeout_ms) {
    std::unique_lock<std::mutex> lk(mu_);
    auto done = [this] { return !connected(); };
    if (timeout_ms == 0) {
        cv_.wait(lk, done);
        return true;
    }
    return cv_.wait_for(lk, std::chrono::milliseconds(timeout_ms), done);
}

WorkerStatus WorkerAgent::status() const {
    WorkerStatus s;
    s.worker_id      = cfg_.worker_id;
    s.hostname       = cfg_.hostname;
    s.host           = cfg_.host;
    s.port           = cfg_.port;
    s.connected      = connected();
    s.running        = running_.load(std::memory_order_acquire);
    s.tasks_executed = tasks_executed_.load(std::memory_order_relaxed);
    s.tasks_failed   = tasks_failed_.load(std::memory_order_relaxed);
    return s;
}

/* ================================================================== */
/*  Threads                                                            */
/* ================================================================== */

void WorkerAgent::heartbeat_loop() {
    const auto interval = std::chrono::milliseconds(cfg_.heartbeat_interval_ms);
    HeartbeatMsg hb;
    hb.worker_id = cfg_.worker_id;

    std::unique_lock<std::mutex> lk(mu_);
    while (connected() && running_.load(std::memory_order_acquire)) {
        lk.unlock();
        if (channel_->send(hb) != TF_OK) {
            tf_log(TF_LOG_WARN, "worker", "heartbeat send failed");
            lk.lock();
            break;
        }
        lk.lock();
        cv_.wait_for(lk, interval, [this] {
            return !connected() || !running_.load(std::memory_order_acquire);
        });
    }
}

void WorkerAgent::message_loop() {
    for (;;) {
        Message msg;
        std::string err;
        tf_status st = channel_->receive(&msg, &err);
        if (st == TF_ERROR_UNKNOWN_MESSAGE) {
            tf_log(TF_LOG_WARN, "worker", "unknown message type '%s'", err.c_str());
            continue;
        }
        if (st != TF_OK) {
            if (running_.load(std::memory_order_acquire))
                tf_log(TF_LOG_WARN, "worker", "connection lost: %s %s",
                       tf_status_str(st), err.c_str());
            break;
        }

        if (const auto* task = std::get_if<ExecuteTaskMsg>(&msg)) {
            handle_execute(*task);
        } else if (std::holds_alternative<HeartbeatResponseMsg>(msg)) {
            /* acknowledged */
        } else if (std::holds_alternative<DisconnectMsg>(msg)) {
            tf_log(TF_LOG_INFO, "worker", "dispatcher requested disconnect");
            break;
        } else {
            tf_log(TF_LOG_DEBUG, "worker", "ignoring %s", message_type(msg));
        }
    }

    channel_->close();
    mark_disconnected();
}

void WorkerAgent::handle_execute(const ExecuteTaskMsg& msg) {
    tf_log(TF_LOG_DEBUG, "worker", "executing %s (%s)",
           msg.task_id.c_str(), msg.work.handler.c_str());

    TaskResultMsg reply;
    reply.task_id = msg.task_id;

    Value result;
    std::string error;
    tf_status st = registry_->invoke(msg.work.handler, msg.work.args, &result, &error);
    if (st == TF_OK && !is_encodable(result, &error)) {
        error = "result not encodable: " + error;
        st = TF_ERROR_TASK_EXECUTION;
    }
    if (st == TF_OK) {
        reply.result  = std::move(result);
        reply.success = true;
        tasks_executed_.fetch_add(1, std::memory_order_relaxed);
    } else {
        tf_log(TF_LOG_WARN, "worker", "task %s failed: %s",
               msg.task_id.c_str(), error.c_str());
        reply.result  = error;
        reply.success = false;
        tasks_failed_.fetch_add(1, std::memory_order_relaxed);
    }

    if (channel_->send(reply) != TF_OK)
        tf_log(TF_LOG_WARN, "worker", "result for %s not delivered",
               msg.task_id.c_str());
}

} // namespace taskfabric
