/**
 * @file handshake_test.cpp
 * @brief OTP admission over a socketpair, both sides
 */

#include "taskfabric/cipher.hpp"
#include "taskfabric/framed_channel.hpp"
#include "taskfabric/handshake.hpp"

#include <cstdio>
#include <cstdlib>
#include <memory>
#include <string>
#include <thread>

#include <sys/socket.h>

#define CHECK(cond, msg) do { \
    if (!(cond)) { \
        fprintf(stderr, "FAIL [%s:%d]: %s\n", __FILE__, __LINE__, msg); \
        exit(1); \
    } \
} while(0)

using namespace taskfabric;

struct Pair {
    std::unique_ptr<FramedChannel> worker;
    std::unique_ptr<FramedChannel> dispatcher;
};

static Pair make_pair(const cipher::Key& bootstrap) {
    int sv[2];
    CHECK(::socketpair(AF_UNIX, SOCK_STREAM, 0, sv) == 0, "socketpair");
    Pair p;
    p.worker     = std::make_unique<FramedChannel>(sv[0], bootstrap);
    p.dispatcher = std::make_unique<FramedChannel>(sv[1], bootstrap);
    return p;
}

static cipher::Key make_key() {
    cipher::Key k{};
    CHECK(cipher::generate_key(&k) == TF_OK, "generate_key");
    return k;
}

static void test_admitted() {
    cipher::Key bootstrap = make_key();
    cipher::Key session   = make_key();
    Pair p = make_pair(bootstrap);

    tf_status server_st = TF_ERROR_INTERNAL;
    AuthMsg peer;
    std::thread server([&] {
        server_st = handshake::server_handshake(
            *p.dispatcher, [] { return std::string("ABCD1234"); }, nullptr,
            session, 2000, &peer);
    });

    std::string message;
    tf_status st = handshake::client_handshake(*p.worker, "ABCD1234", "w1",
                                               "box-1", &message);
    server.join();
    CHECK(st == TF_OK, "client admitted");
    CHECK(server_st == TF_OK, "server admitted");
    CHECK(message == "Authentication successful", "success text");
    CHECK(peer.worker_id == "w1" && peer.hostname == "box-1", "peer identity");

    /* Both sides now speak the session key. */
    CHECK(p.worker->send(HeartbeatMsg{"w1"}) == TF_OK, "send on session key");
    Message m;
    CHECK(p.dispatcher->receive(&m) == TF_OK, "receive on session key");
    CHECK(std::holds_alternative<HeartbeatMsg>(m), "heartbeat");

    /* The bootstrap key no longer opens session frames. */
    Pair q = make_pair(bootstrap);
    q.dispatcher->rotate_key(session);
    CHECK(q.dispatcher->send(HeartbeatResponseMsg{}) == TF_OK, "send session frame");
    CHECK(q.worker->receive(&m) == TF_ERROR_DECRYPTION, "bootstrap key rejected");
    fprintf(stderr, "  [PASS] test_admitted\n");
}

static void test_wrong_otp() {
    cipher::Key bootstrap = make_key();
    Pair p = make_pair(bootstrap);

    tf_status server_st = TF_OK;
    std::thread server([&] {
        AuthMsg peer;
        server_st = handshake::server_handshake(
            *p.dispatcher, [] { return std::string("ABCD1234"); }, nullptr,
            make_key(), 2000, &peer);
    });

    std::string message;
    tf_status st = handshake::client_handshake(*p.worker, "WRONG000", "w1",
                                               "box-1", &message);
    server.join();
    CHECK(st == TF_ERROR_AUTH_FAILED, "client rejected");
    CHECK(message == "Invalid OTP", "reason");
    CHECK(server_st == TF_ERROR_AUTH_FAILED, "server rejected");
    fprintf(stderr, "  [PASS] test_wrong_otp\n");
}

static void test_admission_refused() {
    cipher::Key bootstrap = make_key();
    Pair p = make_pair(bootstrap);

    int admit_calls = 0;
    tf_status server_st = TF_OK;
    std::thread server([&] {
        AuthMsg peer;
        server_st = handshake::server_handshake(
            *p.dispatcher, [] { return std::string("OTP"); },
            [&](const AuthMsg& a, std::string* reason) {
                ++admit_calls;
                *reason = "Worker id already connected";
                return a.worker_id != "dup";
            },
            make_key(), 2000, &peer);
    });

    std::string message;
    CHECK(handshake::client_handshake(*p.worker, "OTP", "dup", "h", &message) ==
          TF_ERROR_AUTH_FAILED, "refused");
    server.join();
    CHECK(admit_calls == 1, "check ran once");
    CHECK(server_st == TF_ERROR_AUTH_FAILED, "server refused");
    CHECK(message == "Worker id already connected", "refusal reason forwarded");
    fprintf(stderr, "  [PASS] test_admission_refused\n");
}

static void test_wrong_first_message() {
    cipher::Key bootstrap = make_key();
    Pair p = make_pair(bootstrap);

    tf_status server_st = TF_OK;
    std::thread server([&] {
        AuthMsg peer;
        server_st = handshake::server_handshake(
            *p.dispatcher, [] { return std::string("OTP"); }, nullptr,
            make_key(), 2000, &peer);
    });

    CHECK(p.worker->send(HeartbeatMsg{"w1"}) == TF_OK, "send heartbeat first");
    Message m;
    CHECK(p.worker->receive(&m) == TF_OK, "reply");
    server.join();
    const auto* r = std::get_if<AuthResponseMsg>(&m);
    CHECK(r && !r->success && r->message == "Expected auth message", "expected auth");
    CHECK(server_st == TF_ERROR_AUTH_FAILED, "server failed");
    fprintf(stderr, "  [PASS] test_wrong_first_message\n");
}

static void test_silent_peer_times_out() {
    cipher::Key bootstrap = make_key();
    Pair p = make_pair(bootstrap);

    AuthMsg peer;
    tf_status st = handshake::server_handshake(
        *p.dispatcher, [] { return std::string("OTP"); }, nullptr,
        make_key(), 150, &peer);
    CHECK(st == TF_ERROR_AUTH_FAILED, "no auth within deadline");
    fprintf(stderr, "  [PASS] test_silent_peer_times_out\n");
}

int main() {
    fprintf(stderr, "[handshake_test]\n");
    test_admitted();
    test_wrong_otp();
    test_admission_refused();
    test_wrong_first_message();
    test_silent_peer_times_out();
    fprintf(stderr, "[handshake_test] ALL PASSED\n");
    return 0;
}
