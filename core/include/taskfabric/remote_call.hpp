/**
 * @file remote_call.hpp
 * @brief TaskFabric — typed call stubs over a Dispatcher
 *
 *   TaskClient client(dispatcher);
 *   RemoteFunction<std::vector<int64_t>, int64_t> sum(client, "sum");
 *   int64_t total = 0;
 *   tf_status st = sum(std::vector<int64_t>{1, 2, 3}, &total);
 */

#ifndef TASKFABRIC_REMOTE_CALL_HPP
#define TASKFABRIC_REMOTE_CALL_HPP

#include "taskfabric/cipher.hpp"
#include "taskfabric/dispatcher.hpp"
#include "taskfabric/status.h"
#include "taskfabric/value.hpp"
#include "taskfabric/value_traits.hpp"

#include <atomic>
#include <cstdint>
#include <cstdio>
#include <string>

namespace taskfabric {

/* ================================================================== */
/*  TaskClient — untyped calls bound to one dispatcher                 */
/* ================================================================== */

class TaskClient {
public:
    explicit TaskClient(Dispatcher& dispatcher) : dispatcher_(dispatcher) {}

    /** "<handler>_<8 lowercase hex digits>", random. */
    static std::string make_task_id(const std::string& handler) {
        uint32_t v = 0;
        if (cipher::random_bytes(&v, sizeof(v)) != TF_OK) {
            static std::atomic<uint32_t> s_seq{0};
            v = s_seq.fetch_add(1, std::memory_order_relaxed);
        }
        char hex[9];
        std::snprintf(hex, sizeof(hex), "%08x", v);
        return handler + "_" + hex;
    }

    tf_status call(const std::string& handler, const Value& args,
                   Value* result, std::string* error = nullptr,
                   const std::string& target_worker = std::string()) {
        TaskWork work;
        work.handler = handler;
        work.args    = args;
        return dispatcher_.execute_task(make_task_id(handler), work,
                                        result, error, target_worker);
    }

    Dispatcher& dispatcher() { return dispatcher_; }

private:
    Dispatcher& dispatcher_;
};

/* ================================================================== */
/*  RemoteFunction — typed stub for one handler                        */
/* ================================================================== */

template <typename Args, typename Result>
class RemoteFunction {
public:
    RemoteFunction(TaskClient& client, std::string handler,
                   std::string target_worker = std::string())
        : client_(client),
          handler_(std::move(handler)),
          target_(std::move(target_worker)) {}

    /**
     * A result that does not convert to Result is reported as
     * TF_ERROR_PROTOCOL.
     */
    tf_status operator()(const Args& args, Result* out,
                         std::string* error = nullptr) const {
        if (!out) return TF_ERROR_INVALID_ARG;
        Value raw;
        tf_status st = client_.call(handler_, ValueTraits<Args>::to_value(args),
                                    &raw, error, target_);
        if (st != TF_OK) return st;
        if (!ValueTraits<Result>::from_value(raw, out)) {
            if (error) *error = handler_ + ": unexpected result " + to_json(raw);
            return TF_ERROR_PROTOCOL;
        }
        return TF_OK;
    }

    const std::string& handler() const { return handler_; }
    const std::string& target()  const { return target_; }

private:
    TaskClient& client_;
    std::string handler_;
    std::string target_;
};

} // namespace taskfabric

#endif // TASKFABRIC_REMOTE_CALL_HPP
