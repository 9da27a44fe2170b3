#include "guestdrop/core/error.hpp"

#include <sstream>

namespace guestdrop {

std::string_view to_string(ErrorKind kind) noexcept {
    switch (kind) {
        case ErrorKind::InvalidInput: return "invalid_input";
        case ErrorKind::UnsupportedType: return "unsupported_type";
        case ErrorKind::FileTooLarge: return "file_too_large";
        case ErrorKind::SessionNotFound: return "session_not_found";
        case ErrorKind::AlreadyCompleting: return "already_completing";
        case ErrorKind::IncompleteUpload: return "incomplete_upload";
        case ErrorKind::AssemblyFailed: return "assembly_failed";
        case ErrorKind::StorageIO: return "storage_io";
    }
    return "unknown";
}

bool UploadError::is_client_error() const noexcept {
    switch (kind) {
        case ErrorKind::InvalidInput:
        case ErrorKind::UnsupportedType:
        case ErrorKind::FileTooLarge:
        case ErrorKind::SessionNotFound:
        case ErrorKind::AlreadyCompleting:
        case ErrorKind::IncompleteUpload:
            return true;
        case ErrorKind::AssemblyFailed:
        case ErrorKind::StorageIO:
            return false;
    }
    return false;
}

bool UploadError::is_terminal() const noexcept {
    return kind == ErrorKind::AssemblyFailed || kind == ErrorKind::StorageIO;
}

UploadError UploadError::invalid_input(std::string message) {
    return UploadError{ErrorKind::InvalidInput, std::move(message), {}};
}

UploadError UploadError::unsupported_type(std::string message) {
    return UploadError{ErrorKind::UnsupportedType, std::move(message), {}};
}

UploadError UploadError::file_too_large(std::string message) {
    return UploadError{ErrorKind::FileTooLarge, std::move(message), {}};
}

UploadError UploadError::session_not_found(const std::string& session_id) {
    return UploadError{ErrorKind::SessionNotFound, "Unknown upload session: " + session_id, {}};
}

UploadError UploadError::already_completing(const std::string& session_id) {
    return UploadError{ErrorKind::AlreadyCompleting, "Upload session is already completing: " + session_id, {}};
}

UploadError UploadError::incomplete(std::vector<std::uint32_t> missing) {
    std::ostringstream oss;
    oss << "Upload is missing " << missing.size() << " chunk(s)";
    return UploadError{ErrorKind::IncompleteUpload, oss.str(), std::move(missing)};
}

UploadError UploadError::assembly_failed(std::string cause) {
    return UploadError{ErrorKind::AssemblyFailed, std::move(cause), {}};
}

UploadError UploadError::storage_io(std::string cause) {
    return UploadError{ErrorKind::StorageIO, std::move(cause), {}};
}

} // namespace guestdrop
