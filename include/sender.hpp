#pragma once

#include <cstdint>
#include <string>
#include "atomic_file.hpp"
#include "pipeline.hpp"

namespace transfer {

// What actually goes on the wire: the source file itself, or a gzip copy
// written next to it when the source exceeds the compression threshold.
struct PreparedPayload {
    std::string payload_path;
    bool is_compressed = false;
    uint64_t original_size = 0;
    uint64_t compressed_size = 0;   // equals original_size when not compressed
    storage::TempFile artifact;     // armed only for a compressed copy
};

// Throws errors::InputError for a missing or non-regular source
PreparedPayload prepare_payload(const std::string& file_path, const std::string& transfer_id);

// PREPARING -> WAITING_FOR_PEER -> CONNECTING -> SENDING -> terminal
class SenderPipeline {
public:
    SenderPipeline(PipelineContext context, std::string transfer_id);

    // Runs on the calling thread until the record is terminal. Never throws;
    // failures end up in the ledger and as an Error event.
    void run(const std::string& file_path, std::string password);

private:
    void execute(const std::string& file_path, std::string& password);
    uint16_t wait_for_peer(const std::string& code);

    PipelineContext context_;
    Reporter reporter_;
};

} // namespace transfer
