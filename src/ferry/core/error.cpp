// Copyright (c) 2026 changcheng967. All rights reserved.

#include <ferry/core/error.hpp>

namespace ferry::core {

DownloadError DownloadError::chunk(std::uint32_t index, DownloadError inner) {
    inner.chunk_index = index;
    return inner;
}

DownloadError DownloadError::exited(int status) {
    DownloadError err(make_error_code(DownloadErrc::process_exit));
    err.exit_code = status;
    return err;
}

std::string DownloadError::message() const {
    std::string text;
    if (chunk_index) {
        text += "chunk " + std::to_string(*chunk_index) + ": ";
    }
    text += code.message();
    if (exit_code) {
        text += " (exit code " + std::to_string(*exit_code) + ")";
    }
    if (!detail.empty()) {
        text += " [" + detail + "]";
    }
    return text;
}

} // namespace ferry::core
