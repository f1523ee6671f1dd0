/**
 * @file config.cpp
 * @brief Environment overrides + key file persistence
 */

#include "taskfabric/config.hpp"
#include "taskfabric/value.hpp"

#include <cerrno>
#include <cmath>
#include <cstdint>
#include <cstdio>
#include <cstdlib>
#include <fcntl.h>
#include <memory>
#include <sys/stat.h>
#include <unistd.h>

namespace taskfabric {

/* ================================================================== */
/*  Environment                                                        */
/* ================================================================== */

namespace {

/* Whole-string unsigned integer in [0, max]. */
bool parse_uint(const char* s, uint64_t max, uint64_t* out) {
    if (!s || !*s || *s == '-') return false;
    errno = 0;
    char* end = nullptr;
    unsigned long long v = std::strtoull(s, &end, 10);
    if (errno != 0 || *end != '\0' || v > max) return false;
    *out = v;
    return true;
}

/* Non-negative seconds, fractional allowed, to milliseconds. */
bool parse_seconds_ms(const char* s, uint32_t* out_ms) {
    if (!s || !*s) return false;
    errno = 0;
    char* end = nullptr;
    double secs = std::strtod(s, &end);
    if (errno != 0 || *end != '\0' || !std::isfinite(secs) || secs < 0.0 ||
        secs * 1000.0 > 4294967295.0)
        return false;
    *out_ms = static_cast<uint32_t>(std::llround(secs * 1000.0));
    return true;
}

void bad_env(const char* name, const char* value) {
    tf_log(TF_LOG_WARN, "config", "ignoring %s=\"%s\" (unparsable)", name, value);
}

template <typename T>
void env_uint(const char* name, uint64_t max, T* field) {
    const char* v = std::getenv(name);
    if (!v) return;
    uint64_t parsed = 0;
    if (parse_uint(v, max, &parsed)) *field = static_cast<T>(parsed);
    else bad_env(name, v);
}

void env_seconds(const char* name, uint32_t* field_ms) {
    const char* v = std::getenv(name);
    if (!v) return;
    if (!parse_seconds_ms(v, field_ms)) bad_env(name, v);
}

} // namespace

Config Config::from_env() {
    Config c;
    env_uint("TASKFABRIC_HOST_PORT",    65535, &c.host_port);
    env_uint("TASKFABRIC_WORKER_PORT",  65535, &c.worker_port);
    env_uint("TASKFABRIC_OTP_LENGTH",   256,   &c.otp_length);
    env_uint("TASKFABRIC_CHUNK_SIZE",   TF_MAX_FRAME_BYTES - TF_CIPHER_OVERHEAD,
             &c.chunk_size);
    env_uint("TASKFABRIC_MAX_FILE_SIZE", UINT64_MAX, &c.max_file_size);
    env_uint("TASKFABRIC_MAX_WORKERS",  1u << 20, &c.max_workers);

    env_seconds("TASKFABRIC_CONNECTION_TIMEOUT", &c.connection_timeout_ms);
    env_seconds("TASKFABRIC_TASK_TIMEOUT",       &c.task_timeout_ms);
    env_seconds("TASKFABRIC_HEARTBEAT_INTERVAL", &c.heartbeat_interval_ms);

    if (const char* v = std::getenv("TASKFABRIC_HOST_ADDRESS")) {
        if (*v) c.host_address = v;
        else bad_env("TASKFABRIC_HOST_ADDRESS", v);
    }
    if (const char* v = std::getenv("TASKFABRIC_LOG_LEVEL")) {
        if (!tf_log_level_from_string(v, &c.log_level))
            bad_env("TASKFABRIC_LOG_LEVEL", v);
    }

    /* Zero would make the OTP empty or the monitor spin. */
    if (c.otp_length == 0)            c.otp_length = TF_DEFAULT_OTP_LENGTH;
    if (c.chunk_size == 0)            c.chunk_size = TF_DEFAULT_CHUNK_SIZE;
    if (c.heartbeat_interval_ms == 0) c.heartbeat_interval_ms = TF_DEFAULT_HEARTBEAT_MS;
    return c;
}

Dispatcher::Config Config::dispatcher_config() const {
    Dispatcher::Config d;
    d.bind_address          = host_address;
    d.port                  = host_port;
    d.heartbeat_interval_ms = heartbeat_interval_ms;
    d.task_timeout_ms       = task_timeout_ms;
    d.connection_timeout_ms = connection_timeout_ms;
    d.otp_length            = otp_length;
    d.max_workers           = max_workers;
    return d;
}

WorkerAgent::Config Config::worker_config(const std::string& host,
                                          const std::string& otp,
                                          const std::string& worker_id,
                                          const cipher::Key& key) const {
    WorkerAgent::Config w;
    w.host                  = host;
    w.port                  = host_port;
    w.otp                   = otp;
    w.worker_id             = worker_id;
    w.bootstrap_key         = key;
    w.heartbeat_interval_ms = heartbeat_interval_ms;
    w.connection_timeout_ms = connection_timeout_ms;
    return w;
}

/* ================================================================== */
/*  Key file                                                           */
/* ================================================================== */

namespace {

struct FileCloser {
    void operator()(FILE* f) const { if (f) std::fclose(f); }
};

} // namespace

tf_status save_key_file(const std::string& path, const cipher::Key& key) {
    Value doc = Value::object();
    doc["encryption_key"] = cipher::key_to_hex(key);
    std::string text = to_json(doc);

    /* Owner-only: the file holds the session key. */
    int fd = ::open(path.c_str(), O_WRONLY | O_CREAT | O_TRUNC, S_IRUSR | S_IWUSR);
    if (fd < 0) {
        tf_log(TF_LOG_ERROR, "config", "cannot write key file %s", path.c_str());
        return TF_ERROR_IO;
    }
    std::unique_ptr<FILE, FileCloser> f(::fdopen(fd, "w"));
    if (!f) {
        ::close(fd);
        return TF_ERROR_IO;
    }
    if (std::fwrite(text.data(), 1, text.size(), f.get()) != text.size() ||
        std::fflush(f.get()) != 0)
        return TF_ERROR_IO;
    return TF_OK;
}

tf_status load_key_file(const std::string& path, cipher::Key* key) {
    if (!key) return TF_ERROR_INVALID_ARG;

    std::unique_ptr<FILE, FileCloser> f(std::fopen(path.c_str(), "r"));
    if (!f) return TF_ERROR_IO;

    std::string text;
    char buf[512];
    size_t n;
    while ((n = std::fread(buf, 1, sizeof(buf), f.get())) > 0) {
        text.append(buf, n);
        if (text.size() > 64 * 1024) return TF_ERROR_PROTOCOL;
    }
    if (std::ferror(f.get())) return TF_ERROR_IO;

    Value doc;
    std::string err;
    if (parse_json(text, &doc, &err) != TF_OK) {
        tf_log(TF_LOG_ERROR, "config", "key file %s: %s", path.c_str(), err.c_str());
        return TF_ERROR_PROTOCOL;
    }
    const Value* hex = doc.find("encryption_key");
    if (!hex || !hex->is_string() || !cipher::key_from_hex(hex->as_string(), key)) {
        tf_log(TF_LOG_ERROR, "config", "key file %s has no valid encryption_key",
               path.c_str());
        return TF_ERROR_PROTOCOL;
    }
    return TF_OK;
}

} // namespace taskfabric
