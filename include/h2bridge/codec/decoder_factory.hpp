#pragma once

#include "content_decoder.hpp"
#include "zlib_decoder.hpp"
#include "brotli_decoder.hpp"

#include <algorithm>
#include <array>
#include <cctype>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

namespace h2bridge::codec {

inline std::unique_ptr<content_decoder> make_decoder(std::string_view encoding);

/// Several codings applied in sequence.
/// Content-Encoding lists codings in the order they were applied, so the
/// stages run in reverse.
class multi_decoder final : public content_decoder {
public:
    /// @param encodings Comma-separated coding names, in application order
    explicit multi_decoder(std::string_view encodings) {
        size_t start = 0;
        for (;;) {
            size_t end = encodings.find(',', start);
            decoders_.push_back(make_decoder(encodings.substr(start, end - start)));
            if (end == std::string_view::npos) break;
            start = end + 1;
        }
        std::reverse(decoders_.begin(), decoders_.end());
    }

    std::string decode(std::string_view data) override {
        std::string buffer(data);
        for (auto& d : decoders_) {
            buffer = d->decode(buffer);
        }
        return buffer;
    }

    std::string flush() override {
        std::string buffer;
        for (auto& d : decoders_) {
            buffer = d->decode(buffer);
            buffer += d->flush();
        }
        return buffer;
    }

    size_t stages() const noexcept { return decoders_.size(); }

private:
    std::vector<std::unique_ptr<content_decoder>> decoders_;
};

namespace detail {

inline std::string normalize_coding(std::string_view token) {
    while (!token.empty() && std::isspace(static_cast<unsigned char>(token.front()))) {
        token.remove_prefix(1);
    }
    while (!token.empty() && std::isspace(static_cast<unsigned char>(token.back()))) {
        token.remove_suffix(1);
    }
    std::string lower(token);
    for (char& c : lower) {
        c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    }
    return lower;
}

struct decoder_entry {
    std::string_view name;
    std::unique_ptr<content_decoder> (*create)();
};

template<typename D>
std::unique_ptr<content_decoder> create() {
    return std::make_unique<D>();
}

inline constexpr std::array<decoder_entry, 6> supported_decoders{{
    {"identity", &create<identity_decoder>},
    {"gzip",     &create<gzip_decoder>},
    {"x-gzip",   &create<gzip_decoder>},
    {"deflate",  &create<deflate_decoder>},
    {"br",       &create<brotli_decoder>},
    {"brotli",   &create<brotli_decoder>},
}};

} // namespace detail

/// Build the decoder for a Content-Encoding value.
/// Unknown codings decode as identity.
inline std::unique_ptr<content_decoder> make_decoder(std::string_view encoding) {
    if (encoding.find(',') != std::string_view::npos) {
        return std::make_unique<multi_decoder>(encoding);
    }

    auto name = detail::normalize_coding(encoding);
    for (const auto& entry : detail::supported_decoders) {
        if (entry.name == name) {
            return entry.create();
        }
    }
    return std::make_unique<identity_decoder>();
}

} // namespace h2bridge::codec
