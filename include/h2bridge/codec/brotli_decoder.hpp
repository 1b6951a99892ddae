#pragma once

#include "content_decoder.hpp"

#include <h2bridge/error/exceptions.hpp>

#include <brotli/decode.h>
#include <fmt/format.h>

#include <array>
#include <cstdint>
#include <memory>
#include <new>
#include <string>
#include <string_view>

namespace h2bridge::codec {

/// Content-Encoding: br
class brotli_decoder final : public content_decoder {
public:
    brotli_decoder()
        : state_(BrotliDecoderCreateInstance(nullptr, nullptr, nullptr), &BrotliDecoderDestroyInstance) {
        if (!state_) {
            throw std::bad_alloc();
        }
    }

    std::string decode(std::string_view data) override {
        std::string out;
        if (data.empty()) {
            return out;
        }
        seen_data_ = true;

        const auto* next_in = reinterpret_cast<const uint8_t*>(data.data());
        size_t avail_in = data.size();
        std::array<uint8_t, 16384> buffer;

        for (;;) {
            uint8_t* next_out = buffer.data();
            size_t avail_out = buffer.size();
            auto res = BrotliDecoderDecompressStream(state_.get(), &avail_in, &next_in,
                                                     &avail_out, &next_out, nullptr);
            out.append(reinterpret_cast<const char*>(buffer.data()), buffer.size() - avail_out);

            if (res == BROTLI_DECODER_RESULT_ERROR) {
                auto code = BrotliDecoderGetErrorCode(state_.get());
                throw error::content_decoding_error(
                    fmt::format("Brotli decoder error {}: {}", static_cast<int>(code),
                                BrotliDecoderErrorString(code)));
            }
            if (res == BROTLI_DECODER_RESULT_NEEDS_MORE_OUTPUT) {
                continue;
            }
            if (res == BROTLI_DECODER_RESULT_SUCCESS && avail_in != 0) {
                throw error::content_decoding_error("Brotli decoder error: data after end of stream");
            }
            return out;
        }
    }

    /// Fails if the stream stopped short of its final meta-block
    std::string flush() override {
        if (!seen_data_) {
            return {};
        }
        if (!BrotliDecoderIsFinished(state_.get())) {
            throw error::content_decoding_error("Brotli decoder error: truncated stream");
        }
        return {};
    }

private:
    std::unique_ptr<BrotliDecoderState, decltype(&BrotliDecoderDestroyInstance)> state_;
    bool seen_data_ = false;
};

} // namespace h2bridge::codec
