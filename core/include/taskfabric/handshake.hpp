/**
 * @file handshake.hpp
 * @brief TaskFabric — OTP admission handshake
 *
 *   worker                                 dispatcher
 *     | -- auth{otp, worker_id, hostname} --> |   bootstrap key
 *     | <-- auth_response{success, key} ----- |   bootstrap key
 *     |            (both sides rotate to the session key)
 *
 * On any failure the caller closes the connection.
 */

#ifndef TASKFABRIC_HANDSHAKE_HPP
#define TASKFABRIC_HANDSHAKE_HPP

#include "taskfabric/cipher.hpp"
#include "taskfabric/framed_channel.hpp"
#include "taskfabric/message.hpp"
#include "taskfabric/status.h"

#include <functional>
#include <string>

namespace taskfabric { namespace handshake {

/**
 * Worker side. On TF_OK the channel has rotated to the session key.
 * TF_ERROR_AUTH_FAILED carries the dispatcher's reason in *message.
 */
tf_status client_handshake(FramedChannel& ch,
                           const std::string& otp,
                           const std::string& worker_id,
                           const std::string& hostname,
                           std::string* message = nullptr);

/** Current OTP, read at comparison time. */
using SecretSource = std::function<std::string()>;

/**
 * Dispatcher-side admission check run after the OTP matched. Returning
 * false rejects the worker with *reason.
 */
using AdmissionCheck = std::function<bool(const AuthMsg& auth,
                                          std::string* reason)>;

/**
 * Dispatcher side. The first frame must arrive within timeout_ms.
 * On TF_OK the success response (carrying `session_key`) has been sent,
 * the channel has rotated to it, reads are blocking again and *peer holds
 * the worker's auth message.
 */
tf_status server_handshake(FramedChannel& ch,
                           const SecretSource& secret,
                           const AdmissionCheck& admit,
                           const cipher::Key& session_key,
                           int timeout_ms,
                           AuthMsg* peer);

}} // namespace taskfabric::handshake

#endif // TASKFABRIC_HANDSHAKE_HPP
