/**
 * @file handshake.cpp
 * @brief OTP admission handshake, both sides
 */

#include "taskfabric/handshake.hpp"
#include "taskfabric/metrics.h"

namespace taskfabric { namespace handshake {

tf_status client_handshake(FramedChannel& ch,
                           const std::string& otp,
                           const std::string& worker_id,
                           const std::string& hostname,
                           std::string* message) {
    AuthMsg auth;
    auth.otp       = otp;
    auth.worker_id = worker_id;
    auth.hostname  = hostname;

    tf_status st = ch.send(auth);
    if (st != TF_OK) return st;

    Message reply;
    std::string err;
    st = ch.receive(&reply, &err);
    if (st != TF_OK) {
        tf_log(TF_LOG_ERROR, "handshake", "no auth response: %s %s",
               tf_status_str(st), err.c_str());
        return st == TF_ERROR_UNKNOWN_MESSAGE ? TF_ERROR_AUTH_FAILED : st;
    }

    const auto* resp = std::get_if<AuthResponseMsg>(&reply);
    if (!resp) {
        if (message) *message = std::string("unexpected ") + message_type(reply);
        return TF_ERROR_AUTH_FAILED;
    }
    if (message) *message = resp->message;
    if (!resp->success) {
        tf_log(TF_LOG_WARN, "handshake", "rejected: %s", resp->message.c_str());
        return TF_ERROR_AUTH_FAILED;
    }

    cipher::Key session_key;
    if (!resp->encryption_key ||
        !cipher::key_from_hex(*resp->encryption_key, &session_key)) {
        if (message) *message = "auth response carried no usable key";
        tf_log(TF_LOG_ERROR, "handshake", "auth response carried no usable key");
        return TF_ERROR_AUTH_FAILED;
    }

    ch.rotate_key(session_key);
    return TF_OK;
}

namespace {

void reject(FramedChannel& ch, const std::string& reason) {
    AuthResponseMsg resp;
    resp.success = false;
    resp.message = reason;
    /* Best effort: the connection is dropped either way. */
    if (ch.send(resp) != TF_OK)
        tf_log(TF_LOG_DEBUG, "handshake", "rejection to %s not delivered",
               ch.peer().c_str());
}

} // namespace

tf_status server_handshake(FramedChannel& ch,
                           const SecretSource& secret,
                           const AdmissionCheck& admit,
                           const cipher::Key& session_key,
                           int timeout_ms,
                           AuthMsg* peer) {
    ch.set_receive_timeout(timeout_ms);

    Message first;
    std::string err;
    tf_status st = ch.receive(&first, &err);
    if (st != TF_OK) {
        tf_log(TF_LOG_WARN, "handshake", "bad first frame from %s: %s %s",
               ch.peer().c_str(), tf_status_str(st), err.c_str());
        /* Only a readable-but-wrong frame can be answered. */
        if (st == TF_ERROR_PROTOCOL || st == TF_ERROR_UNKNOWN_MESSAGE)
            reject(ch, "Expected auth message");
        return TF_ERROR_AUTH_FAILED;
    }

    const auto* auth = std::get_if<AuthMsg>(&first);
    if (!auth) {
        reject(ch, "Expected auth message");
        return TF_ERROR_AUTH_FAILED;
    }

    if (auth->otp != secret()) {
        tf_log(TF_LOG_WARN, "handshake", "invalid OTP from %s (worker %s)",
               ch.peer().c_str(), auth->worker_id.c_str());
        reject(ch, "Invalid OTP");
        return TF_ERROR_AUTH_FAILED;
    }

    std::string reason;
    if (admit && !admit(*auth, &reason)) {
        tf_log(TF_LOG_WARN, "handshake", "worker %s refused: %s",
               auth->worker_id.c_str(), reason.c_str());
        reject(ch, reason);
        return TF_ERROR_AUTH_FAILED;
    }

    AuthResponseMsg ok;
    ok.success        = true;
    ok.message        = "Authentication successful";
    ok.encryption_key = cipher::key_to_hex(session_key);
    st = ch.send(ok);
    if (st != TF_OK) return st;

    ch.rotate_key(session_key);
    ch.set_receive_timeout(0);
    if (peer) *peer = *auth;
    return TF_OK;
}

}} // namespace taskfabric::handshake
