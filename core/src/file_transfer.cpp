/**
 * @file file_transfer.cpp
 * @brief Chunked file send/receive with progress reporting
 */

#include "taskfabric/file_transfer.hpp"
#include "taskfabric/metrics.h"

#include <cstdio>
#include <filesystem>
#include <memory>
#include <system_error>
#include <vector>

namespace fs = std::filesystem;

namespace taskfabric {

namespace {

struct FileCloser {
    void operator()(FILE* f) const { if (f) std::fclose(f); }
};
using FilePtr = std::unique_ptr<FILE, FileCloser>;

} // namespace

tf_status send_file(FramedChannel& ch, const std::string& path,
                    size_t chunk_size, const TransferProgress& progress) {
    if (chunk_size == 0) return TF_ERROR_INVALID_ARG;

    std::error_code ec;
    if (!fs::is_regular_file(path, ec)) {
        tf_log(TF_LOG_ERROR, "file_transfer", "file not found: %s", path.c_str());
        return TF_ERROR_IO;
    }
    uint64_t total = static_cast<uint64_t>(fs::file_size(path, ec));
    if (ec) return TF_ERROR_IO;

    FilePtr f(std::fopen(path.c_str(), "rb"));
    if (!f) {
        tf_log(TF_LOG_ERROR, "file_transfer", "cannot open %s", path.c_str());
        return TF_ERROR_IO;
    }

    FileTransferStartMsg start;
    start.filename = fs::path(path).filename().string();
    start.size     = total;
    tf_status st = ch.send(start);
    if (st != TF_OK) return st;

    std::vector<uint8_t> buf(chunk_size);
    uint64_t sent = 0;
    while (sent < total) {
        size_t n = std::fread(buf.data(), 1, buf.size(), f.get());
        if (n == 0) {
            tf_log(TF_LOG_ERROR, "file_transfer", "%s shrank while sending",
                   path.c_str());
            return TF_ERROR_IO;
        }
        /* Never send more than announced even if the file grew. */
        if (sent + n > total) n = static_cast<size_t>(total - sent);
        st = ch.send_chunk(buf.data(), n);
        if (st != TF_OK) return st;
        sent += n;
        if (progress) progress(sent, total);
    }

    st = ch.send(FileTransferEndMsg{});
    if (st != TF_OK) return st;

    tf_log(TF_LOG_INFO, "file_transfer", "sent %s (%s)",
           start.filename.c_str(), format_size(total).c_str());
    return TF_OK;
}

tf_status receive_file(FramedChannel& ch, const std::string& save_path,
                       uint64_t max_size, const TransferProgress& progress,
                       std::string* filename) {
    Message msg;
    std::string err;
    tf_status st = ch.receive(&msg, &err);
    if (st == TF_ERROR_UNKNOWN_MESSAGE) return TF_ERROR_PROTOCOL;
    if (st != TF_OK) return st;

    const auto* start = std::get_if<FileTransferStartMsg>(&msg);
    if (!start) {
        tf_log(TF_LOG_ERROR, "file_transfer", "expected file_transfer_start, got %s",
               message_type(msg));
        return TF_ERROR_PROTOCOL;
    }
    const uint64_t    total = start->size;
    const std::string name  = start->filename;
    if (filename) *filename = name;
    if (total > max_size) {
        tf_log(TF_LOG_ERROR, "file_transfer", "%s is %s, limit %s",
               name.c_str(), format_size(total).c_str(),
               format_size(max_size).c_str());
        return TF_ERROR_INVALID_ARG;
    }

    std::error_code ec;
    fs::path parent = fs::path(save_path).parent_path();
    if (!parent.empty()) {
        fs::create_directories(parent, ec);
        if (ec) {
            tf_log(TF_LOG_ERROR, "file_transfer", "cannot create %s: %s",
                   parent.string().c_str(), ec.message().c_str());
            return TF_ERROR_IO;
        }
    }

    FilePtr f(std::fopen(save_path.c_str(), "wb"));
    if (!f) {
        tf_log(TF_LOG_ERROR, "file_transfer", "cannot write %s", save_path.c_str());
        return TF_ERROR_IO;
    }

    std::vector<uint8_t> chunk;
    uint64_t received = 0;
    while (received < total) {
        st = ch.receive_chunk(&chunk);
        if (st != TF_OK) return st;
        if (received + chunk.size() > total) return TF_ERROR_PROTOCOL;
        if (!chunk.empty() &&
            std::fwrite(chunk.data(), 1, chunk.size(), f.get()) != chunk.size())
            return TF_ERROR_IO;
        received += chunk.size();
        if (progress) progress(received, total);
    }
    if (std::fflush(f.get()) != 0) return TF_ERROR_IO;

    st = ch.receive(&msg, &err);
    if (st == TF_ERROR_UNKNOWN_MESSAGE) return TF_ERROR_PROTOCOL;
    if (st != TF_OK) return st;
    if (!std::holds_alternative<FileTransferEndMsg>(msg)) {
        tf_log(TF_LOG_ERROR, "file_transfer", "expected file_transfer_end, got %s",
               message_type(msg));
        return TF_ERROR_PROTOCOL;
    }

    tf_log(TF_LOG_INFO, "file_transfer", "received %s (%s) -> %s",
           name.c_str(), format_size(total).c_str(), save_path.c_str());
    return TF_OK;
}

std::string format_size(uint64_t bytes) {
    if (bytes == 0) return "0B";
    static const char* kUnits[] = {"B", "KB", "MB", "GB", "TB"};
    double v = static_cast<double>(bytes);
    size_t i = 0;
    while (v >= 1024.0 && i + 1 < sizeof(kUnits) / sizeof(kUnits[0])) {
        v /= 1024.0;
        ++i;
    }
    char buf[32];
    std::snprintf(buf, sizeof(buf), "%.1f%s", v, kUnits[i]);
    return buf;
}

void print_progress(uint64_t done, uint64_t total) {
    double pct = total > 0 ? 100.0 * static_cast<double>(done) /
                                 static_cast<double>(total)
                           : 0.0;
    std::printf("\rProgress: %.1f%% (%s/%s)", pct, format_size(done).c_str(),
                format_size(total).c_str());
    if (done >= total) std::printf("\n");
    std::fflush(stdout);
}

} // namespace taskfabric
