#pragma once

/// @file response.hpp
/// @brief Response objects and the streaming body pipeline

#include "http_common.hpp"

#include <h2bridge/codec/decoder_factory.hpp>
#include <h2bridge/error/exception_mapper.hpp>
#include <h2bridge/error/exceptions.hpp>
#include <h2bridge/io/byte_slicer.hpp>
#include <h2bridge/log/macros.hpp>
#include <h2bridge/transport/transport.hpp>

#include <deque>
#include <exception>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace h2bridge::http {

class raw_response;

/// Pull-based reader over a response body.
///
/// Each `next()` blocks on the transport until a chunk is ready and returns
/// std::nullopt at end of body. Chunks come out of the decoder (when
/// decoding) and are re-cut to `chunk_size` bytes; only the final chunk may
/// be shorter. An error ends the stream: chunks already returned stay valid
/// and every later `next()` rethrows the same error.
class body_reader {
public:
    body_reader(raw_response& raw, std::optional<size_t> chunk_size, bool decode_content)
        : raw_(&raw), slicer_(chunk_size), decode_(decode_content) {}

    std::optional<std::string> next();

    /// Drain the rest of the body into one string
    std::string read_all() {
        std::string out;
        while (auto chunk = next()) {
            out += *chunk;
        }
        return out;
    }

    bool done() const noexcept { return phase_ == phase::done && ready_.empty(); }

private:
    enum class phase {
        body,
        flush,
        done
    };

    std::optional<std::string> pull();

    void push(std::vector<std::string> chunks) {
        for (auto& c : chunks) {
            ready_.push_back(std::move(c));
        }
    }

    raw_response* raw_;
    io::byte_slicer slicer_;
    bool decode_;
    phase phase_ = phase::body;
    std::deque<std::string> ready_;
    std::exception_ptr error_;
};

/// Body stream of a response plus its per-response decoder.
/// Owned by `response`; not shared between responses.
///
/// A body that failed, or was closed before its end, stays failed: every
/// reader created afterwards rethrows the recorded error.
class raw_response {
public:
    raw_response(std::unique_ptr<transport::byte_stream> stream, const http::headers& headers,
                 bool decode_content = false)
        : stream_(std::move(stream))
        , content_encoding_(to_lower(headers.get("Content-Encoding")))
        , decode_content_(decode_content) {}

    ~raw_response() {
        try {
            close();
        } catch (const std::exception& e) {
            H2BRIDGE_LOG_WARNING("error closing response stream: {}", e.what());
        }
    }

    raw_response(const raw_response&) = delete;
    raw_response& operator=(const raw_response&) = delete;

    /// Body re-cut to `amt`-byte chunks (nullopt keeps transport framing),
    /// decoded unless `decode_content` (or the constructor default) says no
    body_reader stream(std::optional<size_t> amt = 65536, std::optional<bool> decode_content = std::nullopt) {
        return body_reader(*this, amt, decode_content.value_or(decode_content_));
    }

    /// Undecoded body, re-cut to `chunk_size` when given
    body_reader iter_raw(std::optional<size_t> chunk_size = std::nullopt) {
        return body_reader(*this, chunk_size, false);
    }

    /// Whole body in one string
    std::string read(bool decode_content) {
        return stream(std::nullopt, decode_content).read_all();
    }

    /// Return the connection to the transport. Safe to call repeatedly.
    void release_conn() { close(); }

    /// Close the body stream. Safe to call repeatedly.
    /// Closing before the end of the body makes later reads fail.
    void close() {
        if (closed_) return;
        closed_ = true;
        if (!stream_) return;
        if (!finished_ && !failure_) {
            failure_ = std::make_exception_ptr(
                error::read_error("response body was closed before it was fully read"));
        }
        stream_->close();
    }

    bool closed() const noexcept { return closed_; }

    const std::string& content_encoding() const noexcept { return content_encoding_; }

private:
    friend class body_reader;

    codec::content_decoder& decoder() {
        if (!decoder_) {
            decoder_ = codec::make_decoder(content_encoding_);
        }
        return *decoder_;
    }

    /// Next transport fragment; closes the stream at end of body
    std::optional<std::string> next_raw() {
        if (failure_) {
            std::rethrow_exception(failure_);
        }
        if (closed_ || !stream_) {
            return std::nullopt;
        }
        auto chunk = error::map_transport_errors([this] { return stream_->read(); });
        if (!chunk) {
            finished_ = true;
            close();
        }
        return chunk;
    }

    /// Record the first body failure and release the connection
    void fail(std::exception_ptr error) {
        if (!failure_) {
            failure_ = std::move(error);
        }
        try {
            close();
        } catch (const std::exception& e) {
            H2BRIDGE_LOG_WARNING("error closing failed response stream: {}", e.what());
        }
    }

    std::unique_ptr<transport::byte_stream> stream_;
    std::string content_encoding_;
    bool decode_content_;
    bool closed_ = false;
    bool finished_ = false;
    std::exception_ptr failure_;
    std::unique_ptr<codec::content_decoder> decoder_;
};

inline std::optional<std::string> body_reader::next() {
    if (error_) {
        std::rethrow_exception(error_);
    }
    try {
        return pull();
    } catch (...) {
        error_ = std::current_exception();
        phase_ = phase::done;
        ready_.clear();
        H2BRIDGE_LOG_DEBUG("body stream failed, closing it");
        raw_->fail(error_);
        throw;
    }
}

inline std::optional<std::string> body_reader::pull() {
    while (ready_.empty()) {
        switch (phase_) {
            case phase::body: {
                auto raw = raw_->next_raw();
                if (!raw) {
                    phase_ = phase::flush;
                    break;
                }
                if (decode_) {
                    push(slicer_.slice(raw_->decoder().decode(*raw)));
                } else {
                    push(slicer_.slice(*raw));
                }
                break;
            }
            case phase::flush:
                if (decode_) {
                    push(slicer_.slice(raw_->decoder().flush()));
                }
                push(slicer_.flush());
                phase_ = phase::done;
                break;
            case phase::done:
                return std::nullopt;
        }
    }
    std::string chunk = std::move(ready_.front());
    ready_.pop_front();
    return chunk;
}

/// Response handed back by http2_adapter::send
class response {
public:
    int status_code = 0;
    http::headers headers;
    /// Text encoding from Content-Type, if it can be determined
    std::optional<std::string> encoding;
    std::string version;
    std::string reason;
    std::string url;
    std::unique_ptr<raw_response> raw;
    /// Chunk size used by iter_content() when none is given
    size_t default_chunk_size = 65536;

    /// True for status codes below 400
    bool ok() const noexcept { return status_code > 0 && status_code < 400; }

    /// Decoded body, re-cut to `chunk_size`
    body_reader iter_content(std::optional<size_t> chunk_size) {
        return raw->stream(chunk_size, true);
    }

    body_reader iter_content() {
        return iter_content(default_chunk_size);
    }

    /// Decoded body, read on first call and cached.
    /// A failed read is not cached; calling again rethrows the failure.
    const std::string& content() {
        if (!content_) {
            content_ = raw->read(true);
        }
        return *content_;
    }

    /// Release the connection. Safe to call repeatedly.
    void close() {
        if (raw) {
            raw->close();
        }
    }

private:
    std::optional<std::string> content_;
};

} // namespace h2bridge::http
