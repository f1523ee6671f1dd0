/**
 * @file framed_channel.hpp
 * @brief TaskFabric — encrypted, length-prefixed message channel
 *
 * Owns one connected stream socket. Every frame is
 *
 *   [uint32 length N, big-endian] [N bytes of cipher::encrypt() output]
 *
 * Writers are serialized by an internal mutex so concurrent senders never
 * interleave frames. Reads are expected from a single thread.
 */

#ifndef TASKFABRIC_FRAMED_CHANNEL_HPP
#define TASKFABRIC_FRAMED_CHANNEL_HPP

#include "taskfabric/cipher.hpp"
#include "taskfabric/message.hpp"
#include "taskfabric/status.h"
#include "taskfabric/value.hpp"

#include <atomic>
#include <cstdint>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace taskfabric {

class FramedChannel {
public:
    /** Takes ownership of `fd`. */
    FramedChannel(int fd, const cipher::Key& key);
    ~FramedChannel();

    FramedChannel(const FramedChannel&) = delete;
    FramedChannel& operator=(const FramedChannel&) = delete;

    /** Resolve, connect (bounded by timeout_ms) and wrap. */
    static tf_status connect(const std::string& host, uint16_t port,
                             const cipher::Key& key, int timeout_ms,
                             std::unique_ptr<FramedChannel>* out);

    /* ---- Messages ------------------------------------------------- */

    /** TF_ERROR_INVALID_ARG, nothing written, if !is_encodable(tree). */
    tf_status send(const Message& msg);

    /**
     * Blocks for one frame.
     *   TF_ERROR_CONNECTION_CLOSED  peer closed, close() called, or timeout
     *   TF_ERROR_DECRYPTION         wrong key or altered frame
     *   TF_ERROR_PROTOCOL           oversized frame or undecodable tree
     *   TF_ERROR_UNKNOWN_MESSAGE    frame consumed, stream still in sync;
     *                               *err names the type
     */
    tf_status receive(Message* out, std::string* err = nullptr);

    /* ---- Raw trees and byte chunks -------------------------------- */

    tf_status send_value(const Value& v);
    tf_status receive_value(Value* out, std::string* err = nullptr);

    /** Frames whose plaintext is the raw bytes (file transfer). */
    tf_status send_chunk(const uint8_t* data, size_t len);
    tf_status receive_chunk(std::vector<uint8_t>* out);

    /* ---- Control -------------------------------------------------- */

    /** Only frames sent/received after this call use the new key. */
    void rotate_key(const cipher::Key& key);

    /** SO_RCVTIMEO on the socket; 0 = block indefinitely. */
    void set_receive_timeout(int timeout_ms);

    /** Shut the socket down both ways. Safe from any thread, idempotent. */
    void close();

    bool is_closed() const { return closed_.load(std::memory_order_acquire); }

    const std::string& peer() const { return peer_; }

private:
    tf_status write_frame(const uint8_t* plaintext, size_t len);
    tf_status read_frame(std::vector<uint8_t>* plaintext);
    cipher::Key current_key() const;

    int                 fd_;
    std::string         peer_;
    mutable std::mutex  key_mu_;
    cipher::Key         key_;
    std::mutex          write_mu_;
    std::atomic<bool>   closed_{false};
};

} // namespace taskfabric

#endif // TASKFABRIC_FRAMED_CHANNEL_HPP
