#include "guestdrop/upload/assembler.hpp"
#include "guestdrop/upload/gzip.hpp"

#include <spdlog/spdlog.h>

namespace guestdrop::upload {
namespace {

// Storage errors from deep inside assembly surface as AssemblyFailed so the
// caller sees one terminal kind; the underlying cause stays in the message.
UploadError as_assembly_failure(const UploadError& error) {
    if (error.kind == ErrorKind::AssemblyFailed) {
        return error;
    }
    return UploadError::assembly_failed(error.message);
}

} // namespace

Assembler::Assembler(FileSystem& fs, ChunkStore& chunks, SessionRegistry& registry)
    : fs_(fs), chunks_(chunks), registry_(registry) {}

UploadResult<std::uint64_t> Assembler::assemble(const std::string& session_id,
                                                std::uint32_t total_chunks,
                                                const std::filesystem::path& destination,
                                                std::uint64_t max_file_size) {
    auto missing = chunks_.list_missing(session_id, total_chunks);
    if (missing.is_error()) {
        return Err(missing.error());
    }
    if (!missing.value().empty()) {
        return Err(UploadError::incomplete(std::move(missing.value())));
    }

    auto created = fs_.create_exclusive(destination);
    if (created.is_error()) {
        cleanup(session_id);
        return Err(as_assembly_failure(created.error()));
    }

    std::unique_ptr<FileWriter> writer = std::move(created.value());
    auto streamed = stream_chunks(session_id, total_chunks, *writer, max_file_size);
    auto closed = writer->close();
    writer.reset();

    if (streamed.is_ok() && closed.is_error()) {
        streamed = Err(closed.error());
    }
    if (streamed.is_error()) {
        // Only the file created above is ours to delete.
        auto removed = fs_.remove_file(destination);
        if (removed.is_error()) {
            spdlog::warn("Could not remove partial upload {}: {}", destination.filename().string(),
                         removed.error().message);
        }
        cleanup(session_id);
        return Err(as_assembly_failure(streamed.error()));
    }

    cleanup(session_id);
    return streamed;
}

UploadResult<std::uint64_t> Assembler::stream_chunks(const std::string& session_id,
                                                     std::uint32_t total_chunks,
                                                     FileWriter& writer,
                                                     std::uint64_t max_file_size) {
    std::uint64_t total = 0;
    bool sink_called = false;
    const ByteSink sink = [&](const std::uint8_t* data, std::size_t size) -> UploadResult<void> {
        sink_called = true;
        if (total + size > max_file_size) {
            return Err(UploadError::file_too_large("assembled file exceeds " + std::to_string(max_file_size) +
                                                  " bytes"));
        }
        auto appended = writer.append(data, size);
        if (appended.is_ok()) {
            total += size;
        }
        return appended;
    };

    for (std::uint32_t index = kFirstChunkIndex; index < kFirstChunkIndex + total_chunks; ++index) {
        auto chunk = chunks_.read_chunk(session_id, index);
        if (chunk.is_error()) {
            return Err(chunk.error());
        }

        const auto& bytes = chunk.value();
        if (!is_gzip(bytes)) {
            auto appended = sink(bytes.data(), bytes.size());
            if (appended.is_error()) {
                return Err(appended.error());
            }
            continue;
        }

        sink_called = false;
        auto appended = inflate_gzip(bytes, sink);
        if (appended.is_error() && !sink_called) {
            // Nothing was inflated yet, so this is raw data that merely looks
            // like a gzip header.
            spdlog::debug("Chunk {} of upload {} is not gzip ({}), storing raw", index, session_id,
                          appended.error().message);
            appended = sink(bytes.data(), bytes.size());
        }
        if (appended.is_error()) {
            return Err(appended.error());
        }
    }
    return Ok(total);
}

void Assembler::cleanup(const std::string& session_id) {
    auto purged = chunks_.purge(session_id);
    if (purged.is_error()) {
        spdlog::warn("Could not purge chunks of upload {}: {}", session_id, purged.error().message);
    }
    registry_.remove(session_id);
}

} // namespace guestdrop::upload
