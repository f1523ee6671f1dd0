/**
 * @file dispatcher.cpp
 * @brief Dispatcher: accept loop, handshake, registry, dispatch, eviction
 */

#include "taskfabric/dispatcher.hpp"
#include "taskfabric/handshake.hpp"
#include "taskfabric/metrics.h"
#include "taskfabric/transport.hpp"

#include <algorithm>

namespace taskfabric {

Dispatcher::Dispatcher(Config cfg, const cipher::Key& bootstrap_key,
                       const cipher::Key& session_key)
    : cfg_(std::move(cfg)),
      bootstrap_key_(bootstrap_key),
      session_key_(session_key),
      secret_(cfg_.otp) {}

Dispatcher::Dispatcher(Config cfg, const cipher::Key& key)
    : Dispatcher(std::move(cfg), key, key) {}

Dispatcher::~Dispatcher() {
    stop();
}

uint64_t Dispatcher::wall_ms() {
    return static_cast<uint64_t>(
        std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::system_clock::now().time_since_epoch()).count());
}

/* ================================================================== */
/*  Lifecycle                                                          */
/* ================================================================== */

tf_status Dispatcher::start() {
    if (running()) return TF_OK;
    if (cfg_.heartbeat_interval_ms == 0 || cfg_.otp_length == 0)
        return TF_ERROR_INVALID_ARG;

    {
        std::lock_guard<std::mutex> lk(mu_);
        if (secret_.empty()) {
            tf_status st = cipher::generate_otp(cfg_.otp_length, &secret_);
            if (st != TF_OK) return st;
        }
    }

    tf_status st = tcp::listen(cfg_.bind_address, cfg_.port, 16,
                               &listen_fd_, &port_);
    if (st != TF_OK) return st;

    running_.store(true, std::memory_order_release);
    accept_thread_  = std::thread(&Dispatcher::accept_loop, this);
    monitor_thread_ = std::thread(&Dispatcher::monitor_loop, this);

    tf_log(TF_LOG_INFO, "dispatcher", "listening on %s:%u",
           cfg_.bind_address.c_str(), static_cast<unsigned>(port_));
    return TF_OK;
}

void Dispatcher::stop() {
    if (!running_.exchange(false, std::memory_order_acq_rel)) return;

    {
        std::lock_guard<std::mutex> lk(mu_);
        stop_cv_.notify_all();
    }

    /* Unblock accept() */
    tcp::shutdown_both(listen_fd_);
    if (accept_thread_.joinable()) accept_thread_.join();
    tcp::close_socket(listen_fd_);
    listen_fd_ = -1;

    if (monitor_thread_.joinable()) monitor_thread_.join();

    std::vector<std::shared_ptr<WorkerRecord>> workers;
    {
        std::lock_guard<std::mutex> lk(mu_);
        workers = workers_;
    }
    for (auto& w : workers) {
        if (w->channel->send(DisconnectMsg{}) != TF_OK)
            tf_log(TF_LOG_DEBUG, "dispatcher", "disconnect to %s not delivered",
                   w->worker_id.c_str());
    }

    {
        std::lock_guard<std::mutex> lk(conn_mu_);
        for (auto& c : conns_) c->channel->close();
    }
    reap_connections(true);

    std::unordered_map<std::string, std::shared_ptr<PendingResult>> pending;
    {
        std::lock_guard<std::mutex> lk(mu_);
        workers_.clear();
        reserved_.clear();
        pending.swap(pending_);
        for (auto& [id, p] : pending) {
            Outcome o;
            o.status = TF_ERROR_CONNECTION_CLOSED;
            o.error  = "dispatcher stopped";
            p->promise.set_value(std::move(o));
        }
    }

    tf_log(TF_LOG_INFO, "dispatcher", "stopped (%zu pending results failed)",
           pending.size());
}

/* ================================================================== */
/*  Accept + connection threads                                        */
/* ================================================================== */

void Dispatcher::accept_loop() {
    while (running()) {
        int fd = tcp::kInvalidSocket;
        std::string peer;
        if (tcp::accept(listen_fd_, &fd, &peer) != TF_OK) break;
        if (!running()) {
            tcp::close_socket(fd);
            break;
        }

        tf_log(TF_LOG_DEBUG, "dispatcher", "connection from %s", peer.c_str());

        reap_connections(false);

        auto conn = std::make_unique<Connection>();
        conn->channel = std::make_shared<FramedChannel>(fd, bootstrap_key_);
        Connection* raw = conn.get();
        std::lock_guard<std::mutex> lk(conn_mu_);
        conns_.push_back(std::move(conn));
        raw->thread = std::thread(&Dispatcher::serve_connection, this, raw);
    }
}

void Dispatcher::reap_connections(bool all) {
    std::list<std::unique_ptr<Connection>> finished;
    {
        std::lock_guard<std::mutex> lk(conn_mu_);
        for (auto it = conns_.begin(); it != conns_.end();) {
            if (all || (*it)->done.load(std::memory_order_acquire)) {
                finished.push_back(std::move(*it));
                it = conns_.erase(it);
            } else {
                ++it;
            }
        }
    }
    for (auto& c : finished)
        if (c->thread.joinable()) c->thread.join();
}

bool Dispatcher::admit(const AuthMsg& auth, std::string* reason) {
    std::lock_guard<std::mutex> lk(mu_);
    if (auth.worker_id.empty()) {
        *reason = "Empty worker id";
        return false;
    }
    if (find_worker_locked(auth.worker_id) || reserved_.count(auth.worker_id)) {
        *reason = "Worker id already connected";
        return false;
    }
    if (workers_.size() + reserved_.size() >= cfg_.max_workers) {
        *reason = "Worker limit reached";
        return false;
    }
    reserved_.insert(auth.worker_id);
    return true;
}

void Dispatcher::serve_connection(Connection* conn) {
    std::shared_ptr<FramedChannel> ch = conn->channel;

    bool reserved = false;
    AuthMsg auth;
    tf_status st = handshake::server_handshake(
        *ch,
        [this] { return session_secret(); },
        [this, &reserved](const AuthMsg& a, std::string* reason) {
            reserved = admit(a, reason);
            return reserved;
        },
        session_key_,
        static_cast<int>(cfg_.connection_timeout_ms),
        &auth);

    if (st != TF_OK) {
        if (reserved) {
            std::lock_guard<std::mutex> lk(mu_);
            reserved_.erase(auth.worker_id);
        }
        tf_metrics_record_worker(TF_WORKER_REJECTED);
        ch->close();
        conn->done.store(true, std::memory_order_release);
        return;
    }

    auto rec = std::make_shared<WorkerRecord>();
    rec->worker_id         = auth.worker_id;
    rec->hostname          = auth.hostname;
    rec->address           = ch->peer();
    rec->channel           = ch;
    rec->last_heartbeat    = Clock::now();
    rec->last_heartbeat_ms = wall_ms();
    rec->connected_at_ms   = rec->last_heartbeat_ms;
    {
        std::lock_guard<std::mutex> lk(mu_);
        reserved_.erase(auth.worker_id);
        workers_.push_back(rec);
    }
    tf_metrics_record_worker(TF_WORKER_ADMITTED);
    tf_log(TF_LOG_INFO, "dispatcher", "worker %s (%s) connected from %s",
           rec->worker_id.c_str(), rec->hostname.c_str(), rec->address.c_str());

    message_loop(rec);

    bool removed;
    {
        std::lock_guard<std::mutex> lk(mu_);
        removed = remove_worker_locked(rec);
        rec->active = false;
    }
    if (removed) {
        tf_metrics_record_worker(TF_WORKER_DISCONNECTED);
        tf_log(TF_LOG_INFO, "dispatcher", "worker %s disconnected",
               rec->worker_id.c_str());
    }
    ch->close();
    conn->done.store(true, std::memory_order_release);
}

/* ================================================================== */
/*  Per-worker message loop                                            */
/* ================================================================== */

void Dispatcher::message_loop(const std::shared_ptr<WorkerRecord>& rec) {
    FramedChannel& ch = *rec->channel;
    for (;;) {
        Message msg;
        std::string err;
        tf_status st = ch.receive(&msg, &err);
        if (st == TF_ERROR_UNKNOWN_MESSAGE) {
            tf_log(TF_LOG_WARN, "dispatcher", "unknown message type '%s' from %s",
                   err.c_str(), rec->worker_id.c_str());
            continue;
        }
        if (st != TF_OK) {
            if (running() && !ch.is_closed())
                tf_log(TF_LOG_INFO, "dispatcher", "worker %s: %s %s",
                       rec->worker_id.c_str(), tf_status_str(st), err.c_str());
            return;
        }

        {
            std::lock_guard<std::mutex> lk(mu_);
            if (!rec->active) {
                tf_log(TF_LOG_WARN, "dispatcher",
                       "dropping %s from evicted worker %s",
                       message_type(msg), rec->worker_id.c_str());
                return;
            }
        }

        if (std::holds_alternative<HeartbeatMsg>(msg)) {
            {
                std::lock_guard<std::mutex> lk(mu_);
                rec->last_heartbeat    = Clock::now();
                rec->last_heartbeat_ms = wall_ms();
            }
            if (ch.send(HeartbeatResponseMsg{}) != TF_OK) return;
        } else if (const auto* tr = std::get_if<TaskResultMsg>(&msg)) {
            handle_task_result(rec, *tr);
        } else if (std::holds_alternative<DisconnectMsg>(msg)) {
            tf_log(TF_LOG_INFO, "dispatcher", "worker %s sent disconnect",
                   rec->worker_id.c_str());
            return;
        } else {
            tf_log(TF_LOG_DEBUG, "dispatcher", "ignoring %s from %s",
                   message_type(msg), rec->worker_id.c_str());
        }
    }
}

void Dispatcher::handle_task_result(const std::shared_ptr<WorkerRecord>& rec,
                                    const TaskResultMsg& msg) {
    std::lock_guard<std::mutex> lk(mu_);
    if (rec->current_task == msg.task_id) rec->current_task.clear();

    auto it = pending_.find(msg.task_id);
    if (it == pending_.end()) {
        tf_log(TF_LOG_DEBUG, "dispatcher", "late result for %s from %s",
               msg.task_id.c_str(), rec->worker_id.c_str());
        return;
    }
    std::shared_ptr<PendingResult> p = it->second;
    pending_.erase(it);

    Outcome o;
    if (msg.success) {
        o.status = TF_OK;
        o.value  = msg.result;
    } else {
        o.status = TF_ERROR_TASK_EXECUTION;
        o.error  = to_display_string(msg.result);
    }
    /* Set under mu_ so a timed-out waiter that loses the race finds a
     * ready future. */
    p->promise.set_value(std::move(o));
}

/* ================================================================== */
/*  Heartbeat monitor                                                  */
/* ================================================================== */

void Dispatcher::monitor_loop() {
    const auto interval = std::chrono::milliseconds(cfg_.heartbeat_interval_ms);
    const auto limit    = 2 * interval;

    std::unique_lock<std::mutex> lk(mu_);
    while (running()) {
        stop_cv_.wait_for(lk, interval, [this] { return !running(); });
        if (!running()) break;

        std::vector<std::shared_ptr<WorkerRecord>> evicted;
        auto now = Clock::now();
        for (auto& w : workers_) {
            if (now - w->last_heartbeat > limit) evicted.push_back(w);
        }
        for (auto& w : evicted) {
            w->active = false;
            remove_worker_locked(w);
        }

        if (evicted.empty()) continue;
        lk.unlock();
        for (auto& w : evicted) {
            tf_metrics_record_worker(TF_WORKER_EVICTED);
            tf_log(TF_LOG_WARN, "dispatcher",
                   "worker %s missed heartbeats, evicted", w->worker_id.c_str());
            w->channel->close();
        }
        lk.lock();
    }
}

/* ================================================================== */
/*  Dispatch                                                           */
/* ================================================================== */

tf_status Dispatcher::execute_task(const std::string& task_id,
                                   const TaskWork& work,
                                   Value* result,
                                   std::string* error,
                                   const std::string& target_worker) {
    if (!result || task_id.empty()) return TF_ERROR_INVALID_ARG;
    std::string why;
    if (!is_encodable(work.args, &why)) {
        if (error) *error = "arguments not encodable: " + why;
        return TF_ERROR_INVALID_ARG;
    }

    std::shared_ptr<WorkerRecord>  worker;
    std::shared_ptr<PendingResult> pending;
    std::future<Outcome>           future;
    {
        std::lock_guard<std::mutex> lk(mu_);
        if (!running()) return TF_ERROR_CONNECTION_CLOSED;
        if (pending_.count(task_id)) {
            if (error) *error = "task id already pending: " + task_id;
            return TF_ERROR_INVALID_ARG;
        }

        if (!target_worker.empty()) {
            worker = find_worker_locked(target_worker);
            if (!worker || !worker->active) {
                if (error) *error = "worker not found: " + target_worker;
                return TF_ERROR_WORKER_NOT_FOUND;
            }
        } else {
            for (auto& w : workers_) {
                if (w->active && w->current_task.empty()) {
                    worker = w;
                    break;
                }
            }
            if (!worker) {
                if (error) *error = "no available worker";
                return TF_ERROR_NO_AVAILABLE_WORKER;
            }
        }

        pending = std::make_shared<PendingResult>();
        pending->task_id       = task_id;
        pending->worker_id     = worker->worker_id;
        pending->dispatched_at = Clock::now();
        pending->deadline      = pending->dispatched_at +
                                 std::chrono::milliseconds(cfg_.task_timeout_ms);
        future = pending->promise.get_future();
        pending_[task_id] = pending;
        worker->current_task = task_id;
    }

    tf_metrics_record_task(TF_TASK_DISPATCHED, 0);
    tf_log(TF_LOG_DEBUG, "dispatcher", "task %s (%s) -> %s",
           task_id.c_str(), work.handler.c_str(), worker->worker_id.c_str());

    ExecuteTaskMsg msg;
    msg.task_id = task_id;
    msg.work    = work;
    if (worker->channel->send(msg) != TF_OK) {
        std::lock_guard<std::mutex> lk(mu_);
        auto it = pending_.find(task_id);
        if (it != pending_.end() && it->second == pending) pending_.erase(it);
        if (worker->current_task == task_id) worker->current_task.clear();
        tf_metrics_record_task(TF_TASK_FAILED, 0);
        if (error) *error = "send to " + worker->worker_id + " failed";
        return TF_ERROR_CONNECTION_CLOSED;
    }

    if (future.wait_until(pending->deadline) == std::future_status::timeout) {
        bool removed = false;
        {
            std::lock_guard<std::mutex> lk(mu_);
            auto it = pending_.find(task_id);
            if (it != pending_.end() && it->second == pending) {
                pending_.erase(it);
                removed = true;
                if (cfg_.release_worker_on_timeout &&
                    worker->current_task == task_id)
                    worker->current_task.clear();
            }
        }
        if (removed) {
            tf_metrics_record_task(TF_TASK_TIMED_OUT, 0);
            tf_log(TF_LOG_WARN, "dispatcher", "task %s on %s timed out after %u ms",
                   task_id.c_str(), worker->worker_id.c_str(), cfg_.task_timeout_ms);
            if (error) *error = "task " + task_id + " timed out";
            return TF_ERROR_TASK_TIMEOUT;
        }
        /* A result won the race; the promise is already set. */
    }

    Outcome o = future.get();
    uint64_t latency_us = static_cast<uint64_t>(
        std::chrono::duration_cast<std::chrono::microseconds>(
            Clock::now() - pending->dispatched_at).count());

    if (o.status == TF_OK) {
        tf_metrics_record_task(TF_TASK_COMPLETED, latency_us);
        *result = std::move(o.value);
    } else {
        tf_metrics_record_task(TF_TASK_FAILED, latency_us);
        if (error) *error = o.error;
    }
    return o.status;
}

/* ================================================================== */
/*  Session secret                                                     */
/* ================================================================== */

std::string Dispatcher::regenerate_session_secret() {
    std::string otp;
    if (cipher::generate_otp(cfg_.otp_length, &otp) != TF_OK) {
        tf_log(TF_LOG_ERROR, "dispatcher", "OTP generation failed, keeping old one");
        return session_secret();
    }
    std::lock_guard<std::mutex> lk(mu_);
    secret_ = otp;
    return otp;
}

std::string Dispatcher::session_secret() const {
    std::lock_guard<std::mutex> lk(mu_);
    return secret_;
}

tf_status Dispatcher::set_session_secret(const std::string& otp) {
    if (otp.empty()) return TF_ERROR_INVALID_ARG;
    std::lock_guard<std::mutex> lk(mu_);
    secret_ = otp;
    return TF_OK;
}

/* ================================================================== */
/*  Registry                                                           */
/* ================================================================== */

std::shared_ptr<Dispatcher::WorkerRecord>
Dispatcher::find_worker_locked(const std::string& id) const {
    for (auto& w : workers_)
        if (w->worker_id == id) return w;
    return nullptr;
}

bool Dispatcher::remove_worker_locked(const std::shared_ptr<WorkerRecord>& rec) {
    auto it = std::find(workers_.begin(), workers_.end(), rec);
    if (it == workers_.end()) return false;
    workers_.erase(it);
    return true;
}

std::vector<WorkerSnapshot> Dispatcher::snapshot_workers() const {
    std::lock_guard<std::mutex> lk(mu_);
    std::vector<WorkerSnapshot> out;
    out.reserve(workers_.size());
    for (auto& w : workers_) {
        WorkerSnapshot s;
        s.worker_id         = w->worker_id;
        s.hostname          = w->hostname;
        s.address           = w->address;
        s.active            = w->active;
        s.current_task      = w->current_task;
        s.last_heartbeat_ms = w->last_heartbeat_ms;
        s.connected_at_ms   = w->connected_at_ms;
        out.push_back(std::move(s));
    }
    return out;
}

size_t Dispatcher::worker_count() const {
    std::lock_guard<std::mutex> lk(mu_);
    return workers_.size();
}

size_t Dispatcher::pending_count() const {
    std::lock_guard<std::mutex> lk(mu_);
    return pending_.size();
}

bool Dispatcher::has_pending(const std::string& task_id) const {
    std::lock_guard<std::mutex> lk(mu_);
    return pending_.count(task_id) != 0;
}

} // namespace taskfabric
