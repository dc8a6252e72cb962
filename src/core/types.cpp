#include "cleanbook/types.hpp"
#include "core/digest.hpp"

namespace cleanbook {

std::string Artifact::identityHash() const {
    auto hex = core::Digest::toHex(core::Digest::sha256(path.string()));
    return hex.substr(0, 8);
}

const char* toString(DeletionMode mode) {
    switch (mode) {
        case DeletionMode::DRY_RUN:     return "DRY_RUN";
        case DeletionMode::INTERACTIVE: return "INTERACTIVE";
        case DeletionMode::FORCE:       return "FORCE";
        case DeletionMode::SAFE:        return "SAFE";
    }
    return "UNKNOWN";
}

const char* toString(DeletionErrorKind kind) {
    switch (kind) {
        case DeletionErrorKind::MODIFIED_DURING_DELETION: return "modified_during_deletion";
        case DeletionErrorKind::UNSAFE_PATH:              return "unsafe_path";
        case DeletionErrorKind::NOT_FOUND:                return "not_found";
        case DeletionErrorKind::IO_ERROR:                 return "io_error";
    }
    return "unknown";
}

} // namespace cleanbook
