#include "panxfer/events/events.hpp"

namespace panxfer::events {

const char* to_string(TransferStatus status) noexcept {
    switch (status) {
        case TransferStatus::Hashing: return "hashing";
        case TransferStatus::Uploading: return "uploading";
        case TransferStatus::Downloading: return "downloading";
        case TransferStatus::Finished: return "finished";
        case TransferStatus::Error: return "error";
    }
    return "unknown";
}

} // namespace panxfer::events
