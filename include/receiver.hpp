#pragma once

#include <string>
#include "pipeline.hpp"

namespace transfer {

// BINDING -> LISTENING -> ACCEPTING -> RECEIVING -> FINALIZING -> terminal
class ReceiverListener {
public:
    ReceiverListener(PipelineContext context, std::string transfer_id);

    // Runs on the calling thread until the record is terminal. Never throws.
    void run(const std::string& save_dir, std::string password, const std::string& code);

private:
    // Returns the final path of the received file
    std::string execute(const std::string& save_dir, std::string& password, const std::string& code);

    PipelineContext context_;
    Reporter reporter_;
};

} // namespace transfer
