#pragma once

#include "guestdrop/core/result.hpp"

#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace guestdrop {

/**
 * @brief Failure categories reported by the upload core
 *
 * UnsupportedType and FileTooLarge are specific kinds of invalid input; they
 * get their own values so the HTTP layer can answer 415/413.
 */
enum class ErrorKind {
    InvalidInput,
    UnsupportedType,
    FileTooLarge,
    SessionNotFound,
    AlreadyCompleting,
    IncompleteUpload,
    AssemblyFailed,
    StorageIO
};

std::string_view to_string(ErrorKind kind) noexcept;

struct UploadError {
    ErrorKind kind = ErrorKind::StorageIO;
    std::string message;
    std::vector<std::uint32_t> missing; ///< Populated when kind == IncompleteUpload

    /// Caller can fix the request and retry on the same session.
    [[nodiscard]] bool is_client_error() const noexcept;

    /// The session has been purged; the client has to start over.
    [[nodiscard]] bool is_terminal() const noexcept;

    static UploadError invalid_input(std::string message);
    static UploadError unsupported_type(std::string message);
    static UploadError file_too_large(std::string message);
    static UploadError session_not_found(const std::string& session_id);
    static UploadError already_completing(const std::string& session_id);
    static UploadError incomplete(std::vector<std::uint32_t> missing);
    static UploadError assembly_failed(std::string cause);
    static UploadError storage_io(std::string cause);
};

template<typename T>
using UploadResult = Result<T, UploadError>;

} // namespace guestdrop
