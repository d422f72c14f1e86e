#pragma once

#include <cstdint>
#include <string>

// How a failed transfer should be treated by the next attempt.
enum class TransferErrorKind {
    NONE,
    TRANSIENT,           // timeout, reset, channel failure: retry, checkpoint kept
    SIZE_MISMATCH,       // short destination: retry, checkpoint kept
    INTEGRITY_MISMATCH,  // checksum disagreement: checkpoint discarded, restart at 0
    FATAL,               // missing source, refused: do not retry
};

const char* transfer_error_name(TransferErrorKind kind);

struct TransferResult {
    bool success;
    TransferErrorKind kind;
    std::string error;
    uint64_t bytes_total = 0;     // size of the completed file
    uint64_t resumed_from = 0;    // checkpoint the final attempt started at

    static TransferResult Ok(uint64_t total, uint64_t resumed_from = 0) {
        return {true, TransferErrorKind::NONE, "", total, resumed_from};
    }

    static TransferResult Err(TransferErrorKind kind, const std::string& err) {
        return {false, kind, err, 0, 0};
    }

    bool is_ok() const { return success; }
    bool is_err() const { return !success; }
    bool retryable() const { return !success && kind != TransferErrorKind::FATAL; }
};
