/**
 * @file message_test.cpp
 * @brief Message catalogue encode/decode and rejection paths
 */

#include "taskfabric/message.hpp"
#include "taskfabric/value.hpp"

#include <cstdio>
#include <cstdlib>
#include <string>

#define CHECK(cond, msg) do { \
    if (!(cond)) { \
        fprintf(stderr, "FAIL [%s:%d]: %s\n", __FILE__, __LINE__, msg); \
        exit(1); \
    } \
} while(0)

using namespace taskfabric;

/* Encode → text → parse → decode, as the channel does. */
static tf_status through_text(const Message& in, Message* out) {
    Value tree;
    if (parse_json(to_json(encode_message(in)), &tree) != TF_OK) return TF_ERROR_PROTOCOL;
    return decode_message(tree, out);
}

static void test_auth_pair() {
    AuthMsg a{"ABCD1234", "w1", "box-1"};
    Value tree = encode_message(a);
    CHECK(to_json(tree) ==
          "{\"hostname\":\"box-1\",\"otp\":\"ABCD1234\",\"type\":\"auth\",\"worker_id\":\"w1\"}",
          "auth wire shape");

    Message m;
    CHECK(through_text(a, &m) == TF_OK, "decode auth");
    const auto* got = std::get_if<AuthMsg>(&m);
    CHECK(got && got->otp == "ABCD1234" && got->worker_id == "w1" &&
          got->hostname == "box-1", "auth fields");

    AuthResponseMsg ok;
    ok.success = true;
    ok.message = "Authentication successful";
    ok.encryption_key = std::string(64, 'a');
    CHECK(through_text(ok, &m) == TF_OK, "decode auth_response");
    const auto* r = std::get_if<AuthResponseMsg>(&m);
    CHECK(r && r->success && r->encryption_key && r->encryption_key->size() == 64,
          "auth_response carries key");

    AuthResponseMsg no;
    no.message = "Invalid OTP";
    CHECK(encode_message(no).find("encryption_key") == nullptr, "key omitted on reject");
    CHECK(through_text(no, &m) == TF_OK, "decode reject");
    r = std::get_if<AuthResponseMsg>(&m);
    CHECK(r && !r->success && !r->encryption_key && r->message == "Invalid OTP",
          "reject fields");
    fprintf(stderr, "  [PASS] test_auth_pair\n");
}

static void test_task_messages() {
    ExecuteTaskMsg ex;
    ex.task_id = "sum_0000002a";
    ex.work.handler = "sum";
    ex.work.args = Value::array();
    ex.work.args.push_back(1);
    ex.work.args.push_back(Value::bytes("\x00\xff", 2));

    Message m;
    CHECK(through_text(ex, &m) == TF_OK, "decode execute_task");
    const auto* e = std::get_if<ExecuteTaskMsg>(&m);
    CHECK(e && e->task_id == ex.task_id && e->work.handler == "sum", "execute fields");
    CHECK(e->work.args == ex.work.args, "args with byte leaf survive");

    TaskResultMsg res;
    res.task_id = ex.task_id;
    res.result  = "Unknown handler: nope";
    res.success = false;
    CHECK(through_text(res, &m) == TF_OK, "decode task_result");
    const auto* t = std::get_if<TaskResultMsg>(&m);
    CHECK(t && !t->success && t->result.as_string() == "Unknown handler: nope",
          "failure carries text");

    /* result and args default to null when absent. */
    Value bare = Value::object();
    bare["type"] = "task_result";
    bare["task_id"] = "x";
    bare["success"] = true;
    CHECK(decode_message(bare, &m) == TF_OK, "bare result");
    CHECK(std::get<TaskResultMsg>(m).result.is_null(), "null result");
    fprintf(stderr, "  [PASS] test_task_messages\n");
}

static void test_small_messages() {
    Message m;
    CHECK(through_text(HeartbeatMsg{"w1"}, &m) == TF_OK &&
          std::get<HeartbeatMsg>(m).worker_id == "w1", "heartbeat");
    CHECK(through_text(HeartbeatResponseMsg{}, &m) == TF_OK &&
          std::holds_alternative<HeartbeatResponseMsg>(m), "heartbeat_response");

    CHECK(through_text(DisconnectMsg{}, &m) == TF_OK &&
          !std::get<DisconnectMsg>(m).worker_id, "disconnect without id");
    CHECK(through_text(DisconnectMsg{std::string("w1")}, &m) == TF_OK &&
          *std::get<DisconnectMsg>(m).worker_id == "w1", "disconnect with id");

    FileTransferStartMsg fs{"model.bin", 123456789};
    CHECK(through_text(fs, &m) == TF_OK, "file_transfer_start");
    CHECK(std::get<FileTransferStartMsg>(m).size == 123456789 &&
          std::get<FileTransferStartMsg>(m).filename == "model.bin", "start fields");
    CHECK(through_text(FileTransferEndMsg{}, &m) == TF_OK &&
          std::holds_alternative<FileTransferEndMsg>(m), "file_transfer_end");
    CHECK(std::string(message_type(m)) == "file_transfer_end", "message_type");
    fprintf(stderr, "  [PASS] test_small_messages\n");
}

static void test_rejections() {
    Message m;
    std::string err;

    Value unknown = Value::object();
    unknown["type"] = "reboot";
    CHECK(decode_message(unknown, &m, &err) == TF_ERROR_UNKNOWN_MESSAGE, "unknown type");
    CHECK(err == "reboot", "unknown type name reported");

    CHECK(decode_message(Value(3), &m, &err) == TF_ERROR_PROTOCOL, "not an object");
    CHECK(decode_message(Value::object(), &m, &err) == TF_ERROR_PROTOCOL, "no type");

    Value auth = Value::object();
    auth["type"] = "auth";
    auth["otp"] = "X";
    CHECK(decode_message(auth, &m, &err) == TF_ERROR_PROTOCOL, "auth missing fields");

    Value ex = Value::object();
    ex["type"] = "execute_task";
    ex["task_id"] = "t";
    ex["work"] = "sum";
    CHECK(decode_message(ex, &m, &err) == TF_ERROR_PROTOCOL, "work must be an object");

    Value fs = Value::object();
    fs["type"] = "file_transfer_start";
    fs["filename"] = "a";
    fs["size"] = -1;
    CHECK(decode_message(fs, &m, &err) == TF_ERROR_PROTOCOL, "negative size");
    fprintf(stderr, "  [PASS] test_rejections\n");
}

int main() {
    fprintf(stderr, "[message_test]\n");
    test_auth_pair();
    test_task_messages();
    test_small_messages();
    test_rejections();
    fprintf(stderr, "[message_test] ALL PASSED\n");
    return 0;
}
