/**
 * @file file_transfer_test.cpp
 * @brief Chunked file copy over a channel, size limits, progress, format_size
 */

#include "taskfabric/cipher.hpp"
#include "taskfabric/file_transfer.hpp"
#include "taskfabric/framed_channel.hpp"

#include <cstdio>
#include <cstdlib>
#include <filesystem>
#include <memory>
#include <string>
#include <thread>
#include <vector>

#include <sys/socket.h>
#include <unistd.h>

#define CHECK(cond, msg) do { \
    if (!(cond)) { \
        fprintf(stderr, "FAIL [%s:%d]: %s\n", __FILE__, __LINE__, msg); \
        exit(1); \
    } \
} while(0)

using namespace taskfabric;
namespace fs = std::filesystem;

static fs::path g_dir;

static void make_pair(std::unique_ptr<FramedChannel>* a,
                      std::unique_ptr<FramedChannel>* b) {
    cipher::Key k{};
    CHECK(cipher::generate_key(&k) == TF_OK, "generate_key");
    int sv[2];
    CHECK(::socketpair(AF_UNIX, SOCK_STREAM, 0, sv) == 0, "socketpair");
    *a = std::make_unique<FramedChannel>(sv[0], k);
    *b = std::make_unique<FramedChannel>(sv[1], k);
}

static std::vector<uint8_t> write_file(const fs::path& p, size_t n) {
    std::vector<uint8_t> data(n);
    for (size_t i = 0; i < n; ++i) data[i] = static_cast<uint8_t>((i * 31) ^ (i >> 8));
    FILE* f = std::fopen(p.c_str(), "wb");
    CHECK(f, "create input");
    CHECK(std::fwrite(data.data(), 1, n, f) == n, "write input");
    std::fclose(f);
    return data;
}

static std::vector<uint8_t> read_file(const fs::path& p) {
    std::vector<uint8_t> data;
    FILE* f = std::fopen(p.c_str(), "rb");
    if (!f) return data;
    uint8_t buf[4096];
    size_t n;
    while ((n = std::fread(buf, 1, sizeof(buf), f)) > 0) data.insert(data.end(), buf, buf + n);
    std::fclose(f);
    return data;
}

static void test_copy() {
    std::unique_ptr<FramedChannel> tx, rx;
    make_pair(&tx, &rx);

    fs::path src = g_dir / "weights.bin";
    auto data = write_file(src, 20000);   /* three chunks at 8192 */

    tf_status send_st = TF_ERROR_INTERNAL;
    int send_calls = 0;
    std::thread sender([&] {
        send_st = send_file(*tx, src.string(), 8192,
                            [&](uint64_t, uint64_t) { ++send_calls; });
    });

    fs::path dst = g_dir / "nested" / "dir" / "copy.bin";
    uint64_t last_done = 0, last_total = 0;
    std::string name;
    tf_status st = receive_file(*rx, dst.string(), TF_DEFAULT_MAX_FILE_SIZE,
                                [&](uint64_t done, uint64_t total) {
                                    last_done = done;
                                    last_total = total;
                                }, &name);
    sender.join();

    CHECK(send_st == TF_OK, "send_file");
    CHECK(st == TF_OK, "receive_file");
    CHECK(name == "weights.bin", "basename announced");
    CHECK(send_calls == 3, "progress per chunk");
    CHECK(last_done == 20000 && last_total == 20000, "final progress");
    CHECK(read_file(dst) == data, "content identical");
    fprintf(stderr, "  [PASS] test_copy\n");
}

static void test_empty_file() {
    std::unique_ptr<FramedChannel> tx, rx;
    make_pair(&tx, &rx);

    fs::path src = g_dir / "empty.txt";
    write_file(src, 0);
    CHECK(send_file(*tx, src.string()) == TF_OK, "send empty");
    fs::path dst = g_dir / "empty_copy.txt";
    CHECK(receive_file(*rx, dst.string()) == TF_OK, "receive empty");
    CHECK(fs::exists(dst) && fs::file_size(dst) == 0, "empty output");
    fprintf(stderr, "  [PASS] test_empty_file\n");
}

static void test_rejections() {
    std::unique_ptr<FramedChannel> tx, rx;
    make_pair(&tx, &rx);

    CHECK(send_file(*tx, (g_dir / "missing.bin").string()) == TF_ERROR_IO,
          "missing file");

    /* Announced size over the receiver's limit. */
    fs::path src = g_dir / "big.bin";
    write_file(src, 3000);
    CHECK(send_file(*tx, src.string(), 1024) == TF_OK, "send big");
    CHECK(receive_file(*rx, (g_dir / "big_copy.bin").string(), 1000) ==
          TF_ERROR_INVALID_ARG, "size limit");

    /* Anything but file_transfer_start first. */
    make_pair(&tx, &rx);
    CHECK(tx->send(HeartbeatMsg{"w1"}) == TF_OK, "send heartbeat");
    CHECK(receive_file(*rx, (g_dir / "never.bin").string()) == TF_ERROR_PROTOCOL,
          "wrong first message");
    fprintf(stderr, "  [PASS] test_rejections\n");
}

static void test_format_size() {
    CHECK(format_size(0) == "0B", "zero");
    CHECK(format_size(512) == "512.0B", "bytes");
    CHECK(format_size(1536) == "1.5KB", "kilobytes");
    CHECK(format_size(1024ull * 1024) == "1.0MB", "megabytes");
    CHECK(format_size(5ull * 1024 * 1024 * 1024 * 1024 * 1024) == "5120.0TB",
          "largest unit caps");
    fprintf(stderr, "  [PASS] test_format_size\n");
}

int main() {
    fprintf(stderr, "[file_transfer_test]\n");
    g_dir = fs::temp_directory_path() / ("tf_file_transfer_" + std::to_string(::getpid()));
    fs::create_directories(g_dir);

    test_copy();
    test_empty_file();
    test_rejections();
    test_format_size();

    std::error_code ec;
    fs::remove_all(g_dir, ec);
    fprintf(stderr, "[file_transfer_test] ALL PASSED\n");
    return 0;
}
