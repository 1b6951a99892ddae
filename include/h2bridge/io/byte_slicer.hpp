#pragma once

#include <cstddef>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

namespace h2bridge::io {

/// Re-chunks a byte stream into fixed-size pieces.
///
/// Input arrives in whatever fragments the transport (or a decoder) produced;
/// output is a sequence of chunks of exactly `chunk_size` bytes, with the
/// remainder held back until more input arrives or `flush()` is called.
/// Without a chunk size the slicer is a passthrough that only drops empty
/// fragments.
class byte_slicer {
public:
    /// Passthrough slicer
    byte_slicer() = default;

    /// @param chunk_size Target chunk size, or std::nullopt for passthrough
    explicit byte_slicer(std::optional<size_t> chunk_size)
        : chunk_size_(chunk_size) {
        if (chunk_size_ && *chunk_size_ == 0) {
            throw std::invalid_argument("byte_slicer: chunk size must be at least 1");
        }
    }

    /// Configured chunk size
    std::optional<size_t> chunk_size() const noexcept { return chunk_size_; }

    /// Number of bytes currently held back
    size_t buffered() const noexcept { return buffer_.size(); }

    /// Feed bytes; returns every complete chunk now available
    std::vector<std::string> slice(std::string_view content) {
        std::vector<std::string> chunks;
        if (!chunk_size_) {
            if (!content.empty()) {
                chunks.emplace_back(content);
            }
            return chunks;
        }

        buffer_.append(content);
        const size_t size = *chunk_size_;
        if (buffer_.size() < size) {
            return chunks;
        }

        const size_t whole = buffer_.size() / size;
        chunks.reserve(whole);
        for (size_t i = 0; i < whole; ++i) {
            chunks.emplace_back(buffer_, i * size, size);
        }
        // Keep the short tail for the next call (or flush)
        buffer_.erase(0, whole * size);
        return chunks;
    }

    /// Emit whatever is buffered and reset
    std::vector<std::string> flush() {
        std::vector<std::string> chunks;
        if (!buffer_.empty()) {
            chunks.push_back(std::move(buffer_));
            buffer_.clear();
        }
        return chunks;
    }

private:
    std::optional<size_t> chunk_size_;
    std::string buffer_;
};

} // namespace h2bridge::io
