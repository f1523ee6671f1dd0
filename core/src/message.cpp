/**
 * @file message.cpp
 * @brief Message catalogue ↔ Value tree
 */

#include "taskfabric/message.hpp"
#include "taskfabric/wire_protocol.h"

#include <cstring>
#include <type_traits>

namespace taskfabric {

/* ================================================================== */
/*  Encode                                                             */
/* ================================================================== */

namespace {

template <class> inline constexpr bool kAlwaysFalse = false;

Value with_type(const char* type) {
    Value v = Value::object();
    v["type"] = type;
    return v;
}

} // namespace

const char* message_type(const Message& msg) {
    return std::visit([](const auto& m) -> const char* {
        using T = std::decay_t<decltype(m)>;
        if constexpr (std::is_same_v<T, AuthMsg>)              return TF_MSG_AUTH;
        else if constexpr (std::is_same_v<T, AuthResponseMsg>) return TF_MSG_AUTH_RESPONSE;
        else if constexpr (std::is_same_v<T, HeartbeatMsg>)    return TF_MSG_HEARTBEAT;
        else if constexpr (std::is_same_v<T, HeartbeatResponseMsg>)
                                                               return TF_MSG_HEARTBEAT_RESPONSE;
        else if constexpr (std::is_same_v<T, ExecuteTaskMsg>)  return TF_MSG_EXECUTE_TASK;
        else if constexpr (std::is_same_v<T, TaskResultMsg>)   return TF_MSG_TASK_RESULT;
        else if constexpr (std::is_same_v<T, DisconnectMsg>)   return TF_MSG_DISCONNECT;
        else if constexpr (std::is_same_v<T, FileTransferStartMsg>)
                                                               return TF_MSG_FILE_TRANSFER_START;
        else if constexpr (std::is_same_v<T, FileTransferEndMsg>)
                                                               return TF_MSG_FILE_TRANSFER_END;
        else static_assert(kAlwaysFalse<T>, "unhandled message");
    }, msg);
}

Value encode_message(const Message& msg) {
    Value v = with_type(message_type(msg));
    std::visit([&v](const auto& m) {
        using T = std::decay_t<decltype(m)>;
        if constexpr (std::is_same_v<T, AuthMsg>) {
            v["otp"]       = m.otp;
            v["worker_id"] = m.worker_id;
            v["hostname"]  = m.hostname;
        } else if constexpr (std::is_same_v<T, AuthResponseMsg>) {
            v["success"] = m.success;
            v["message"] = m.message;
            if (m.encryption_key) v["encryption_key"] = *m.encryption_key;
        } else if constexpr (std::is_same_v<T, HeartbeatMsg>) {
            v["worker_id"] = m.worker_id;
        } else if constexpr (std::is_same_v<T, ExecuteTaskMsg>) {
            v["task_id"] = m.task_id;
            Value work = Value::object();
            work["handler"] = m.work.handler;
            work["args"]    = m.work.args;
            v["work"] = std::move(work);
        } else if constexpr (std::is_same_v<T, TaskResultMsg>) {
            v["task_id"] = m.task_id;
            v["result"]  = m.result;
            v["success"] = m.success;
        } else if constexpr (std::is_same_v<T, DisconnectMsg>) {
            if (m.worker_id) v["worker_id"] = *m.worker_id;
        } else if constexpr (std::is_same_v<T, FileTransferStartMsg>) {
            v["filename"] = m.filename;
            v["size"]     = static_cast<int64_t>(m.size);
        }
        /* HeartbeatResponseMsg, FileTransferEndMsg: type only */
    }, msg);
    return v;
}

/* ================================================================== */
/*  Decode                                                             */
/* ================================================================== */

namespace {

tf_status fail(std::string* err, const std::string& why) {
    if (err) *err = why;
    return TF_ERROR_PROTOCOL;
}

bool get_string(const Value& o, const char* key, std::string* out) {
    const Value* f = o.find(key);
    if (!f || !f->is_string()) return false;
    *out = f->as_string();
    return true;
}

bool get_bool(const Value& o, const char* key, bool* out) {
    const Value* f = o.find(key);
    if (!f || !f->is_bool()) return false;
    *out = f->as_bool();
    return true;
}

} // namespace

tf_status decode_message(const Value& tree, Message* out, std::string* err) {
    if (!out) return TF_ERROR_INVALID_ARG;
    if (!tree.is_object()) return fail(err, "message is not an object");

    std::string type;
    if (!get_string(tree, "type", &type))
        return fail(err, "message has no string 'type'");

    if (type == TF_MSG_AUTH) {
        AuthMsg m;
        if (!get_string(tree, "otp", &m.otp) ||
            !get_string(tree, "worker_id", &m.worker_id) ||
            !get_string(tree, "hostname", &m.hostname))
            return fail(err, "auth: missing otp/worker_id/hostname");
        *out = std::move(m);
        return TF_OK;
    }

    if (type == TF_MSG_AUTH_RESPONSE) {
        AuthResponseMsg m;
        if (!get_bool(tree, "success", &m.success))
            return fail(err, "auth_response: missing success");
        get_string(tree, "message", &m.message);
        std::string key;
        if (get_string(tree, "encryption_key", &key)) m.encryption_key = key;
        *out = std::move(m);
        return TF_OK;
    }

    if (type == TF_MSG_HEARTBEAT) {
        HeartbeatMsg m;
        if (!get_string(tree, "worker_id", &m.worker_id))
            return fail(err, "heartbeat: missing worker_id");
        *out = std::move(m);
        return TF_OK;
    }

    if (type == TF_MSG_HEARTBEAT_RESPONSE) {
        *out = HeartbeatResponseMsg{};
        return TF_OK;
    }

    if (type == TF_MSG_EXECUTE_TASK) {
        ExecuteTaskMsg m;
        if (!get_string(tree, "task_id", &m.task_id))
            return fail(err, "execute_task: missing task_id");
        const Value* work = tree.find("work");
        if (!work || !work->is_object() ||
            !get_string(*work, "handler", &m.work.handler))
            return fail(err, "execute_task: missing work.handler");
        if (const Value* args = work->find("args")) m.work.args = *args;
        *out = std::move(m);
        return TF_OK;
    }

    if (type == TF_MSG_TASK_RESULT) {
        TaskResultMsg m;
        if (!get_string(tree, "task_id", &m.task_id) ||
            !get_bool(tree, "success", &m.success))
            return fail(err, "task_result: missing task_id/success");
        if (const Value* r = tree.find("result")) m.result = *r;
        *out = std::move(m);
        return TF_OK;
    }

    if (type == TF_MSG_DISCONNECT) {
        DisconnectMsg m;
        std::string id;
        if (get_string(tree, "worker_id", &id)) m.worker_id = id;
        *out = std::move(m);
        return TF_OK;
    }

    if (type == TF_MSG_FILE_TRANSFER_START) {
        FileTransferStartMsg m;
        const Value* size = tree.find("size");
        if (!get_string(tree, "filename", &m.filename) ||
            !size || !size->is_int() || size->as_int() < 0)
            return fail(err, "file_transfer_start: missing filename/size");
        m.size = static_cast<uint64_t>(size->as_int());
        *out = std::move(m);
        return TF_OK;
    }

    if (type == TF_MSG_FILE_TRANSFER_END) {
        *out = FileTransferEndMsg{};
        return TF_OK;
    }

    if (err) *err = type;
    return TF_ERROR_UNKNOWN_MESSAGE;
}

} // namespace taskfabric
