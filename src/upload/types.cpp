#include "guestdrop/upload/types.hpp"

namespace guestdrop::upload {

std::string_view to_string(UploadState state) noexcept {
    switch (state) {
        case UploadState::Started: return "started";
        case UploadState::Receiving: return "receiving";
        case UploadState::Completing: return "completing";
        case UploadState::Done: return "done";
        case UploadState::Failed: return "failed";
    }
    return "unknown";
}

std::vector<std::uint32_t> SessionSnapshot::missing() const {
    std::vector<std::uint32_t> result;
    for (std::uint32_t index = kFirstChunkIndex; index < kFirstChunkIndex + total_chunks; ++index) {
        if (received.count(index) == 0) {
            result.push_back(index);
        }
    }
    return result;
}

} // namespace guestdrop::upload
