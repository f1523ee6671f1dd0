/**
 * @file message.hpp
 * @brief TaskFabric — message catalogue
 *
 * Closed set of messages exchanged between dispatcher and worker. Each
 * message maps to an object tree carrying a "type" discriminator (see
 * TF_MSG_* in wire_protocol.h) plus its own fields.
 */

#ifndef TASKFABRIC_MESSAGE_HPP
#define TASKFABRIC_MESSAGE_HPP

#include "taskfabric/status.h"
#include "taskfabric/value.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <variant>

namespace taskfabric {

/* ---- Admission ---------------------------------------------------- */

struct AuthMsg {
    std::string otp;
    std::string worker_id;
    std::string hostname;
};

struct AuthResponseMsg {
    bool        success = false;
    std::string message;
    std::optional<std::string> encryption_key;   /* lowercase hex */
};

/* ---- Liveness ----------------------------------------------------- */

struct HeartbeatMsg {
    std::string worker_id;
};

struct HeartbeatResponseMsg {};

/* ---- Work --------------------------------------------------------- */

/** Named handler invocation; the worker resolves `handler` in its registry. */
struct TaskWork {
    std::string handler;
    Value       args;
};

struct ExecuteTaskMsg {
    std::string task_id;
    TaskWork    work;
};

/** On failure `result` carries the error text. */
struct TaskResultMsg {
    std::string task_id;
    Value       result;
    bool        success = false;
};

struct DisconnectMsg {
    std::optional<std::string> worker_id;
};

/* ---- File transfer ------------------------------------------------ */

struct FileTransferStartMsg {
    std::string filename;
    uint64_t    size = 0;
};

struct FileTransferEndMsg {};

using Message = std::variant<AuthMsg,
                             AuthResponseMsg,
                             HeartbeatMsg,
                             HeartbeatResponseMsg,
                             ExecuteTaskMsg,
                             TaskResultMsg,
                             DisconnectMsg,
                             FileTransferStartMsg,
                             FileTransferEndMsg>;

/** Wire discriminator of the held alternative. */
const char* message_type(const Message& msg);

Value encode_message(const Message& msg);

/**
 * Tree → message.
 *   TF_ERROR_UNKNOWN_MESSAGE: `type` is a string outside the catalogue
 *                             (*err receives the type name).
 *   TF_ERROR_PROTOCOL:        not an object, no `type`, or a field is
 *                             missing or of the wrong kind.
 */
tf_status decode_message(const Value& tree, Message* out,
                         std::string* err = nullptr);

} // namespace taskfabric

#endif // TASKFABRIC_MESSAGE_HPP
