#include "codec.h"
#include "core/constants.h"
#include <array>
#include <cctype>
#include <cmath>

namespace helios {
namespace codec {

namespace {

constexpr char kAlphabet[] =
    "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789+/";

const std::array<int8_t, 256>& decode_table() {
    static const std::array<int8_t, 256> table = [] {
        std::array<int8_t, 256> t{};
        t.fill(-1);
        for (int i = 0; i < 64; ++i) {
            t[static_cast<unsigned char>(kAlphabet[i])] = static_cast<int8_t>(i);
        }
        return t;
    }();
    return table;
}

} // namespace

std::string encode_bytes(const uint8_t* data, size_t size) {
    std::string out;
    out.reserve(((size + 2) / 3) * 4);

    size_t i = 0;
    for (; i + 2 < size; i += 3) {
        uint32_t n = (static_cast<uint32_t>(data[i]) << 16) |
                     (static_cast<uint32_t>(data[i + 1]) << 8) |
                     static_cast<uint32_t>(data[i + 2]);
        out.push_back(kAlphabet[(n >> 18) & 0x3F]);
        out.push_back(kAlphabet[(n >> 12) & 0x3F]);
        out.push_back(kAlphabet[(n >> 6) & 0x3F]);
        out.push_back(kAlphabet[n & 0x3F]);
    }

    size_t remaining = size - i;
    if (remaining == 1) {
        uint32_t n = static_cast<uint32_t>(data[i]) << 16;
        out.push_back(kAlphabet[(n >> 18) & 0x3F]);
        out.push_back(kAlphabet[(n >> 12) & 0x3F]);
        out += "==";
    } else if (remaining == 2) {
        uint32_t n = (static_cast<uint32_t>(data[i]) << 16) |
                     (static_cast<uint32_t>(data[i + 1]) << 8);
        out.push_back(kAlphabet[(n >> 18) & 0x3F]);
        out.push_back(kAlphabet[(n >> 12) & 0x3F]);
        out.push_back(kAlphabet[(n >> 6) & 0x3F]);
        out.push_back('=');
    }
    return out;
}

std::string encode_bytes(const Bytes& buffer) {
    return encode_bytes(buffer.data(), buffer.size());
}

Result<Bytes> decode_bytes(const std::string& text) {
    const auto& table = decode_table();
    Bytes out;
    out.reserve((text.size() / 4) * 3);

    uint32_t acc = 0;
    int bits = 0;
    size_t symbols = 0;
    size_t padding = 0;

    for (char ch : text) {
        unsigned char c = static_cast<unsigned char>(ch);
        if (std::isspace(c)) continue;
        if (c == '=') {
            ++padding;
            continue;
        }
        if (padding > 0) {
            return make_decode_error("base64: data after padding");
        }
        int8_t v = table[c];
        if (v < 0) {
            return make_decode_error("base64: invalid character 0x" +
                                     std::to_string(static_cast<int>(c)));
        }
        acc = (acc << 6) | static_cast<uint32_t>(v);
        bits += 6;
        ++symbols;
        if (bits >= 8) {
            bits -= 8;
            out.push_back(static_cast<uint8_t>((acc >> bits) & 0xFF));
        }
    }

    if (symbols % 4 == 1) {
        return make_decode_error("base64: truncated final group");
    }
    if (padding > 2 || (padding > 0 && (symbols + padding) % 4 != 0)) {
        return make_decode_error("base64: invalid padding");
    }
    return out;
}

Sample float_to_int16_sample(float value) {
    if (!std::isfinite(value)) return 0;
    double scaled = std::trunc(static_cast<double>(value) * constants::audio::PCM_SCALE);
    // Wrap into [0, 65536) then reinterpret as signed 16-bit.
    double wrapped = std::fmod(scaled, 65536.0);
    if (wrapped < 0) wrapped += 65536.0;
    int32_t n = static_cast<int32_t>(wrapped);
    return static_cast<Sample>(n >= 32768 ? n - 65536 : n);
}

PcmBuffer float_to_int16_pcm(const float* samples, size_t count) {
    PcmBuffer pcm(count);
    for (size_t i = 0; i < count; ++i) {
        pcm[i] = float_to_int16_sample(samples[i]);
    }
    return pcm;
}

PcmBuffer float_to_int16_pcm(const std::vector<float>& samples) {
    return float_to_int16_pcm(samples.data(), samples.size());
}

Bytes pcm_to_bytes(const PcmBuffer& pcm) {
    Bytes bytes(pcm.size() * 2);
    for (size_t i = 0; i < pcm.size(); ++i) {
        uint16_t u = static_cast<uint16_t>(pcm[i]);
        bytes[2 * i] = static_cast<uint8_t>(u & 0xFF);
        bytes[2 * i + 1] = static_cast<uint8_t>(u >> 8);
    }
    return bytes;
}

Result<PlayableBuffer> decode_audio_samples(const Bytes& bytes, int sample_rate, int channel_count) {
    if (sample_rate <= 0 || channel_count <= 0) {
        return make_decode_error("invalid audio format: rate=" + std::to_string(sample_rate) +
                                 " channels=" + std::to_string(channel_count));
    }
    if (bytes.empty()) {
        return make_decode_error("empty audio payload");
    }
    const size_t frame_bytes = 2 * static_cast<size_t>(channel_count);
    if (bytes.size() % frame_bytes != 0) {
        return make_decode_error("audio payload of " + std::to_string(bytes.size()) +
                                 " bytes is not a multiple of " + std::to_string(frame_bytes));
    }

    const size_t frame_count = bytes.size() / frame_bytes;
    PlayableBuffer buffer;
    buffer.sample_rate = sample_rate;
    buffer.channels = channel_count;
    buffer.channel_data.assign(channel_count, std::vector<float>(frame_count));

    for (size_t frame = 0; frame < frame_count; ++frame) {
        for (int ch = 0; ch < channel_count; ++ch) {
            size_t offset = (frame * channel_count + ch) * 2;
            uint16_t u = static_cast<uint16_t>(bytes[offset]) |
                         static_cast<uint16_t>(static_cast<uint16_t>(bytes[offset + 1]) << 8);
            int32_t s = u >= 32768 ? static_cast<int32_t>(u) - 65536 : static_cast<int32_t>(u);
            buffer.channel_data[ch][frame] =
                static_cast<float>(s / constants::audio::PCM_SCALE);
        }
    }
    return buffer;
}

} // namespace codec
} // namespace helios
