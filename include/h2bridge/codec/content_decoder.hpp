#pragma once

#include <string>
#include <string_view>

namespace h2bridge::codec {

/// Streaming decoder for one Content-Encoding stage.
///
/// `decode` is fed successive slices of the encoded body and returns whatever
/// output they produce. `flush` is called once at end of body and returns
/// the remaining output. Framing violations raise
/// `error::content_decoding_error`.
class content_decoder {
public:
    virtual ~content_decoder() = default;

    virtual std::string decode(std::string_view data) = 0;
    virtual std::string flush() = 0;
};

/// Unencoded data
class identity_decoder final : public content_decoder {
public:
    std::string decode(std::string_view data) override { return std::string(data); }
    std::string flush() override { return {}; }
};

} // namespace h2bridge::codec
