/**
 * @file file_transfer.hpp
 * @brief TaskFabric — chunked file copy over an established channel
 *
 *   file_transfer_start{filename, size}
 *   chunk frame × ceil(size / chunk_size)   (raw bytes, encrypted)
 *   file_transfer_end
 */

#ifndef TASKFABRIC_FILE_TRANSFER_HPP
#define TASKFABRIC_FILE_TRANSFER_HPP

#include "taskfabric/framed_channel.hpp"
#include "taskfabric/status.h"
#include "taskfabric/wire_protocol.h"

#include <cstdint>
#include <functional>
#include <string>

namespace taskfabric {

/** (bytes so far, total bytes); called after every chunk. */
using TransferProgress = std::function<void(uint64_t done, uint64_t total)>;

/**
 * Send `path` as its basename. TF_ERROR_IO if the file cannot be opened
 * or read; channel errors propagate unchanged.
 */
tf_status send_file(FramedChannel& ch, const std::string& path,
                    size_t chunk_size = TF_DEFAULT_CHUNK_SIZE,
                    const TransferProgress& progress = nullptr);

/**
 * Receive one file into `save_path`, creating parent directories.
 *   TF_ERROR_PROTOCOL     first/last message of the wrong kind, or a
 *                         chunk overrunning the announced size
 *   TF_ERROR_INVALID_ARG  announced size above max_size
 *   TF_ERROR_IO           cannot create or write save_path
 * *filename receives the sender's name for the file when provided.
 */
tf_status receive_file(FramedChannel& ch, const std::string& save_path,
                       uint64_t max_size = TF_DEFAULT_MAX_FILE_SIZE,
                       const TransferProgress& progress = nullptr,
                       std::string* filename = nullptr);

/** "0B", "512.0B", "1.5KB", … "2.0TB". */
std::string format_size(uint64_t bytes);

/** Prints "\rProgress: 42.0% (1.2MB/2.9MB)" to stdout. */
void print_progress(uint64_t done, uint64_t total);

} // namespace taskfabric

#endif // TASKFABRIC_FILE_TRANSFER_HPP
