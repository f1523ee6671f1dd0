/**
 * @file task_registry.hpp
 * @brief TaskFabric — named task handlers on the worker
 *
 * The dispatcher never ships code: execute_task names a handler that the
 * worker registered before connecting, plus an argument tree.
 */

#ifndef TASKFABRIC_TASK_REGISTRY_HPP
#define TASKFABRIC_TASK_REGISTRY_HPP

#include "taskfabric/status.h"
#include "taskfabric/value.hpp"
#include "taskfabric/value_traits.hpp"

#include <functional>
#include <map>
#include <mutex>
#include <string>
#include <utility>
#include <vector>

namespace taskfabric {

/**
 * Return TF_OK with *result set, or any other status with *error set.
 * Exceptions thrown by a handler are caught by TaskRegistry::invoke().
 */
using TaskHandler = std::function<tf_status(const Value& args,
                                            Value* result,
                                            std::string* error)>;

class TaskRegistry {
public:
    /** Replaces a handler of the same name. */
    tf_status register_handler(const std::string& name, TaskHandler fn);

    /**
     * Typed handler: `fn` is callable as Result(const Args&). Arguments
     * that do not convert are reported as a handler failure.
     */
    template <typename Args, typename Result, typename Fn>
    tf_status register_typed(const std::string& name, Fn fn) {
        return register_handler(name,
            [name, fn = std::move(fn)](const Value& args, Value* result,
                                       std::string* error) -> tf_status {
                Args a{};
                if (!ValueTraits<Args>::from_value(args, &a)) {
                    *error = "bad arguments for " + name;
                    return TF_ERROR_INVALID_ARG;
                }
                *result = ValueTraits<Result>::to_value(fn(a));
                return TF_OK;
            });
    }

    bool unregister_handler(const std::string& name);
    bool contains(const std::string& name) const;
    std::vector<std::string> names() const;
    size_t size() const;

    /**
     * Run `name`. An unknown handler, a non-OK return or an exception all
     * yield TF_ERROR_TASK_EXECUTION with a reason in *error.
     */
    tf_status invoke(const std::string& name, const Value& args,
                     Value* result, std::string* error) const;

private:
    mutable std::mutex                 mu_;
    std::map<std::string, TaskHandler> handlers_;
};

/** echo, sum, sleep_ms, word_count: used by tf_node_cli join mode. */
void register_demo_handlers(TaskRegistry* registry);

} // namespace taskfabric

#endif // TASKFABRIC_TASK_REGISTRY_HPP
