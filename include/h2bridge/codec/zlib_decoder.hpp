#pragma once

#include "content_decoder.hpp"

#include <h2bridge/error/exceptions.hpp>
#include <h2bridge/log/macros.hpp>

#include <fmt/format.h>
#include <zlib.h>

#include <algorithm>
#include <array>
#include <limits>
#include <memory>
#include <string>
#include <string_view>

namespace h2bridge::codec {

/// RAII wrapper around an inflating z_stream.
/// z_stream keeps a pointer back to itself, so the wrapper is pinned; reset
/// it by replacing the owning unique_ptr.
class inflate_stream {
public:
    /// Outcome of feeding one slice of input
    struct result {
        std::string output;
        std::string_view unused;  ///< Input left over after the end of the stream
    };

    /// @param window_bits zlib window bits: MAX_WBITS for zlib framing,
    /// -MAX_WBITS for raw deflate, 16 + MAX_WBITS for gzip
    /// @param max_slice Largest input handed to zlib at once; avail_in is a
    /// uInt, so longer input is fed in several slices
    explicit inflate_stream(int window_bits, size_t max_slice = std::numeric_limits<uInt>::max())
        : max_slice_(std::max<size_t>(1, std::min<size_t>(max_slice, std::numeric_limits<uInt>::max()))) {
        int ret = inflateInit2(&stream_, window_bits);
        if (ret != Z_OK) {
            throw error::content_decoding_error(
                fmt::format("Error {} while preparing to decompress data: {}", ret, zError(ret)));
        }
    }

    ~inflate_stream() {
        inflateEnd(&stream_);
    }

    inflate_stream(const inflate_stream&) = delete;
    inflate_stream& operator=(const inflate_stream&) = delete;

    /// True once the end of the compressed stream was reached
    bool finished() const noexcept { return finished_; }

    /// Inflate as much of `input` as belongs to this stream
    result inflate(std::string_view input) {
        result r;
        size_t offset = 0;
        while (!finished_ && offset < input.size()) {
            const size_t slice = std::min(input.size() - offset, max_slice_);
            stream_.next_in = reinterpret_cast<Bytef*>(const_cast<char*>(input.data() + offset));
            stream_.avail_in = static_cast<uInt>(slice);
            offset += slice;
            inflate_slice(r.output);
            // Input zlib did not take; only non-zero once the stream ended
            offset -= stream_.avail_in;
        }
        r.unused = input.substr(offset);
        return r;
    }

private:
    void inflate_slice(std::string& output) {
        std::array<char, 16384> buffer;
        for (;;) {
            stream_.next_out = reinterpret_cast<Bytef*>(buffer.data());
            stream_.avail_out = static_cast<uInt>(buffer.size());

            int ret = ::inflate(&stream_, Z_NO_FLUSH);
            output.append(buffer.data(), buffer.size() - stream_.avail_out);

            if (ret == Z_STREAM_END) {
                finished_ = true;
                return;
            }
            if (ret == Z_BUF_ERROR) {
                // No progress possible until more input arrives
                return;
            }
            if (ret != Z_OK) {
                throw error::content_decoding_error(fmt::format(
                    "Error {} while decompressing data: {}", ret,
                    stream_.msg ? stream_.msg : zError(ret)));
            }
            if (stream_.avail_in == 0 && stream_.avail_out != 0) {
                return;
            }
        }
    }

    z_stream stream_{};
    size_t max_slice_;
    bool finished_ = false;
};

/// Content-Encoding: deflate.
/// Servers disagree on whether "deflate" means zlib-framed or raw deflate;
/// the zlib framing is tried first and the first failure switches to raw.
class deflate_decoder final : public content_decoder {
public:
    deflate_decoder() : stream_(std::make_unique<inflate_stream>(MAX_WBITS)) {}

    std::string decode(std::string_view data) override {
        if (data.empty()) {
            return {};
        }

        const bool was_first_try = first_try_;
        first_try_ = false;
        try {
            return stream_->inflate(data).output;
        } catch (const error::content_decoding_error& e) {
            if (!was_first_try) {
                throw;
            }
            H2BRIDGE_LOG_DEBUG("deflate: zlib framing rejected ({}), retrying as raw deflate", e.what());
            stream_ = std::make_unique<inflate_stream>(-MAX_WBITS);
            return decode(data);
        }
    }

    std::string flush() override {
        // inflate() drains all available output eagerly
        return {};
    }

private:
    std::unique_ptr<inflate_stream> stream_;
    bool first_try_ = true;
};

/// Content-Encoding: gzip, including concatenated members
class gzip_decoder final : public content_decoder {
public:
    enum class state {
        first_member,
        other_members,
        swallow_data
    };

    gzip_decoder() : stream_(std::make_unique<inflate_stream>(16 + MAX_WBITS)) {}

    std::string decode(std::string_view data) override {
        std::string out;
        if (state_ == state::swallow_data || data.empty()) {
            return out;
        }

        for (;;) {
            inflate_stream::result r;
            try {
                r = stream_->inflate(data);
            } catch (const error::content_decoding_error& e) {
                const state previous = state_;
                // Ignore everything after the first error
                state_ = state::swallow_data;
                if (previous == state::other_members) {
                    H2BRIDGE_LOG_DEBUG("gzip: ignoring trailing data ({})", e.what());
                    return out;
                }
                throw;
            }

            out += r.output;
            if (r.unused.empty()) {
                return out;
            }
            data = r.unused;
            state_ = state::other_members;
            stream_ = std::make_unique<inflate_stream>(16 + MAX_WBITS);
        }
    }

    std::string flush() override {
        return {};
    }

    state current_state() const noexcept { return state_; }

private:
    std::unique_ptr<inflate_stream> stream_;
    state state_ = state::first_member;
};

} // namespace h2bridge::codec
