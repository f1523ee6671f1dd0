/**
 * @file framed_channel.cpp
 * @brief Encrypted length-prefixed framing over a TCP socket
 */

#include "taskfabric/framed_channel.hpp"
#include "taskfabric/metrics.h"
#include "taskfabric/transport.hpp"
#include "taskfabric/wire_protocol.h"

#include <string_view>

namespace taskfabric {

FramedChannel::FramedChannel(int fd, const cipher::Key& key)
    : fd_(fd), peer_(tcp::peer_address(fd)), key_(key) {}

FramedChannel::~FramedChannel() {
    close();
    tcp::close_socket(fd_);
}

tf_status FramedChannel::connect(const std::string& host, uint16_t port,
                                 const cipher::Key& key, int timeout_ms,
                                 std::unique_ptr<FramedChannel>* out) {
    if (!out) return TF_ERROR_INVALID_ARG;
    int fd = tcp::kInvalidSocket;
    tf_status st = tcp::connect(host, port, timeout_ms, &fd);
    if (st != TF_OK) return st;
    *out = std::make_unique<FramedChannel>(fd, key);
    return TF_OK;
}

cipher::Key FramedChannel::current_key() const {
    std::lock_guard<std::mutex> lk(key_mu_);
    return key_;
}

void FramedChannel::rotate_key(const cipher::Key& key) {
    std::lock_guard<std::mutex> lk(key_mu_);
    key_ = key;
}

void FramedChannel::set_receive_timeout(int timeout_ms) {
    tcp::set_receive_timeout(fd_, timeout_ms);
}

void FramedChannel::close() {
    bool expected = false;
    if (closed_.compare_exchange_strong(expected, true,
                                        std::memory_order_acq_rel))
        tcp::shutdown_both(fd_);
}

/* ================================================================== */
/*  Frame I/O                                                          */
/* ================================================================== */

tf_status FramedChannel::write_frame(const uint8_t* plaintext, size_t len) {
    if (is_closed()) return TF_ERROR_CONNECTION_CLOSED;

    std::vector<uint8_t> frame;
    tf_status st = cipher::encrypt(current_key(), plaintext, len, &frame);
    if (st != TF_OK) return st;
    if (frame.size() > TF_MAX_FRAME_BYTES) return TF_ERROR_INVALID_ARG;

    /* Prefix and body go out in one write. */
    frame.insert(frame.begin(), TF_FRAME_PREFIX_BYTES, 0);
    tf_store_be32(frame.data(),
                  static_cast<uint32_t>(frame.size() - TF_FRAME_PREFIX_BYTES));

    std::lock_guard<std::mutex> lk(write_mu_);
    if (!tcp::send_all(fd_, frame.data(), frame.size()))
        return TF_ERROR_CONNECTION_CLOSED;
    return TF_OK;
}

tf_status FramedChannel::read_frame(std::vector<uint8_t>* plaintext) {
    uint8_t prefix[TF_FRAME_PREFIX_BYTES];
    if (!tcp::recv_all(fd_, prefix, sizeof(prefix)))
        return TF_ERROR_CONNECTION_CLOSED;

    uint32_t n = tf_load_be32(prefix);
    if (n > TF_MAX_FRAME_BYTES) {
        tf_log(TF_LOG_WARN, "channel", "frame of %u bytes from %s exceeds limit",
               n, peer_.c_str());
        return TF_ERROR_PROTOCOL;
    }

    std::vector<uint8_t> body(n);
    if (n > 0 && !tcp::recv_all(fd_, body.data(), n))
        return TF_ERROR_CONNECTION_CLOSED;

    return cipher::decrypt(current_key(), body.data(), body.size(), plaintext);
}

/* ================================================================== */
/*  Trees                                                              */
/* ================================================================== */

tf_status FramedChannel::send_value(const Value& v) {
    std::string why;
    if (!is_encodable(v, &why)) {
        tf_log(TF_LOG_WARN, "channel", "refusing to send to %s: %s",
               peer_.c_str(), why.c_str());
        return TF_ERROR_INVALID_ARG;
    }
    std::string text = to_json(v);
    return write_frame(reinterpret_cast<const uint8_t*>(text.data()), text.size());
}

tf_status FramedChannel::receive_value(Value* out, std::string* err) {
    if (!out) return TF_ERROR_INVALID_ARG;
    std::vector<uint8_t> plain;
    tf_status st = read_frame(&plain);
    if (st != TF_OK) return st;
    std::string_view text(reinterpret_cast<const char*>(plain.data()), plain.size());
    return parse_json(text, out, err);
}

tf_status FramedChannel::send(const Message& msg) {
    return send_value(encode_message(msg));
}

tf_status FramedChannel::receive(Message* out, std::string* err) {
    if (!out) return TF_ERROR_INVALID_ARG;
    Value tree;
    tf_status st = receive_value(&tree, err);
    if (st != TF_OK) return st;
    return decode_message(tree, out, err);
}

/* ================================================================== */
/*  Chunks                                                             */
/* ================================================================== */

tf_status FramedChannel::send_chunk(const uint8_t* data, size_t len) {
    if (!data && len > 0) return TF_ERROR_INVALID_ARG;
    return write_frame(data, len);
}

tf_status FramedChannel::receive_chunk(std::vector<uint8_t>* out) {
    if (!out) return TF_ERROR_INVALID_ARG;
    return read_frame(out);
}

} // namespace taskfabric
