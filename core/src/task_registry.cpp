/**
 * @file task_registry.cpp
 * @brief Handler table + the demo handlers
 */

#include "taskfabric/task_registry.hpp"
#include "taskfabric/metrics.h"

#include <chrono>
#include <exception>
#include <limits>
#include <sstream>
#include <thread>

namespace taskfabric {

tf_status TaskRegistry::register_handler(const std::string& name, TaskHandler fn) {
    if (name.empty() || !fn) return TF_ERROR_INVALID_ARG;
    std::lock_guard<std::mutex> lk(mu_);
    handlers_[name] = std::move(fn);
    return TF_OK;
}

bool TaskRegistry::unregister_handler(const std::string& name) {
    std::lock_guard<std::mutex> lk(mu_);
    return handlers_.erase(name) != 0;
}

bool TaskRegistry::contains(const std::string& name) const {
    std::lock_guard<std::mutex> lk(mu_);
    return handlers_.count(name) != 0;
}

std::vector<std::string> TaskRegistry::names() const {
    std::lock_guard<std::mutex> lk(mu_);
    std::vector<std::string> out;
    out.reserve(handlers_.size());
    for (auto& [name, fn] : handlers_) out.push_back(name);
    return out;
}

size_t TaskRegistry::size() const {
    std::lock_guard<std::mutex> lk(mu_);
    return handlers_.size();
}

tf_status TaskRegistry::invoke(const std::string& name, const Value& args,
                               Value* result, std::string* error) const {
    TaskHandler fn;
    {
        std::lock_guard<std::mutex> lk(mu_);
        auto it = handlers_.find(name);
        if (it != handlers_.end()) fn = it->second;
    }

    std::string reason;
    if (!fn) {
        if (error) *error = "Unknown handler: " + name;
        return TF_ERROR_TASK_EXECUTION;
    }

    Value out;
    tf_status st;
    try {
        st = fn(args, &out, &reason);
    } catch (const std::exception& e) {
        if (error) *error = name + ": " + e.what();
        return TF_ERROR_TASK_EXECUTION;
    }

    if (st != TF_OK) {
        if (error) *error = reason.empty() ? tf_status_str(st) : reason;
        return TF_ERROR_TASK_EXECUTION;
    }
    if (result) *result = std::move(out);
    return TF_OK;
}

/* ================================================================== */
/*  Demo handlers                                                      */
/* ================================================================== */

namespace {

tf_status handle_echo(const Value& args, Value* result, std::string*) {
    *result = args;
    return TF_OK;
}

/* Integer sum when every element is an integer and the total fits in
 * int64, double otherwise. */
tf_status handle_sum(const Value& args, Value* result, std::string* error) {
    if (!args.is_array()) {
        *error = "sum expects an array of numbers";
        return TF_ERROR_INVALID_ARG;
    }
    bool all_int = true;
    int64_t isum = 0;
    double  dsum = 0.0;
    for (const auto& v : args.as_array()) {
        if (!v.is_number()) {
            *error = "sum expects an array of numbers";
            return TF_ERROR_INVALID_ARG;
        }
        if (v.is_int() && all_int) {
            int64_t x = v.as_int();
            if ((x > 0 && isum > std::numeric_limits<int64_t>::max() - x) ||
                (x < 0 && isum < std::numeric_limits<int64_t>::min() - x))
                all_int = false;
            else
                isum += x;
        } else {
            all_int = false;
        }
        dsum += v.as_double();
    }
    *result = all_int ? Value(isum) : Value(dsum);
    return TF_OK;
}

tf_status handle_sleep_ms(const Value& args, Value* result, std::string* error) {
    if (!args.is_int() || args.as_int() < 0) {
        *error = "sleep_ms expects a non-negative integer";
        return TF_ERROR_INVALID_ARG;
    }
    std::this_thread::sleep_for(std::chrono::milliseconds(args.as_int()));
    *result = args.as_int();
    return TF_OK;
}

tf_status handle_word_count(const Value& args, Value* result, std::string* error) {
    if (!args.is_string()) {
        *error = "word_count expects a string";
        return TF_ERROR_INVALID_ARG;
    }
    std::istringstream in(args.as_string());
    std::string word;
    int64_t n = 0;
    while (in >> word) ++n;
    *result = n;
    return TF_OK;
}

} // namespace

void register_demo_handlers(TaskRegistry* registry) {
    if (!registry) return;
    static const struct { const char* name; TaskHandler fn; } demo[] = {
        {"echo",       handle_echo},
        {"sum",        handle_sum},
        {"sleep_ms",   handle_sleep_ms},
        {"word_count", handle_word_count},
    };
    for (const auto& d : demo) {
        if (registry->register_handler(d.name, d.fn) != TF_OK)
            tf_log(TF_LOG_WARN, "worker", "demo handler %s not registered", d.name);
    }
    tf_log(TF_LOG_DEBUG, "worker", "registered %zu demo handlers", registry->size());
}

} // namespace taskfabric
