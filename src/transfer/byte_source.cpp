#include "byte_source.hpp"

const char* transfer_error_name(TransferErrorKind kind) {
    switch (kind) {
        case TransferErrorKind::NONE:               return "none";
        case TransferErrorKind::TRANSIENT:          return "transient";
        case TransferErrorKind::SIZE_MISMATCH:      return "size mismatch";
        case TransferErrorKind::INTEGRITY_MISMATCH: return "integrity mismatch";
        case TransferErrorKind::FATAL:              return "fatal";
    }
    return "unknown";
}

TransferResult RemoteFileSource::stream(uint64_t offset, const StreamStart& on_start,
                                        const ByteSink& sink) {
    auto conn = channel_.ensure_connected();
    if (conn.is_err()) return TransferResult::Err(TransferErrorKind::TRANSIENT, conn.error);

    auto size = channel_.stat_size(path_);
    if (size.is_err()) {
        return TransferResult::Err(TransferErrorKind::TRANSIENT, size.error);
    }
    if (!size.value) {
        return TransferResult::Err(TransferErrorKind::FATAL, "no such remote file: " + path_);
    }

    StreamInfo info;
    info.total_size = *size.value;
    info.range_honored = offset <= *size.value;
    if (!info.range_honored) offset = 0;
    if (!on_start(info)) {
        return TransferResult::Err(TransferErrorKind::FATAL, "stream refused by receiver");
    }

    auto r = channel_.read_from(path_, offset, sink);
    if (r.is_err()) {
        return TransferResult::Err(TransferErrorKind::TRANSIENT, r.error);
    }
    return TransferResult::Ok(offset + r.value, offset);
}
