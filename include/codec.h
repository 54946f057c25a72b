#pragma once

#include "common.h"
#include "errors.h"
#include <string>
#include <vector>

namespace helios {

/**
 * @brief Decoded audio ready for the output device
 *
 * De-interleaved normalized float samples, one vector per channel.
 */
struct PlayableBuffer {
    int sample_rate = 0;
    int channels = 0;
    std::vector<std::vector<float>> channel_data;

    size_t frames() const {
        return channel_data.empty() ? 0 : channel_data.front().size();
    }

    /// Length in seconds
    double duration() const {
        return sample_rate > 0 ? static_cast<double>(frames()) / sample_rate : 0.0;
    }
};

/**
 * @brief Transport encoding and PCM sample conversion
 */
namespace codec {

/**
 * @brief base64-encode a byte buffer (standard alphabet, '=' padded)
 */
std::string encode_bytes(const uint8_t* data, size_t size);
std::string encode_bytes(const Bytes& buffer);

/**
 * @brief Decode base64 text; exact inverse of encode_bytes()
 *
 * ASCII whitespace is skipped; padding may be omitted.
 * @return DecodeError on characters outside the alphabet, data after
 *         padding, or a truncated final group
 */
Result<Bytes> decode_bytes(const std::string& text);

/**
 * @brief Scale one float sample by 32768 and truncate toward zero
 *
 * No clamping: values outside [-1, 1) wrap modulo 2^16, so 1.0 yields
 * -32768. NaN and infinities yield 0.
 */
Sample float_to_int16_sample(float value);

PcmBuffer float_to_int16_pcm(const float* samples, size_t count);
PcmBuffer float_to_int16_pcm(const std::vector<float>& samples);

/// Serialize int16 samples little-endian
Bytes pcm_to_bytes(const PcmBuffer& pcm);

/**
 * @brief Interpret bytes as interleaved little-endian int16 PCM
 * @return Buffer of sample / 32768 per channel, or DecodeError when the
 *         input is empty, not a whole number of frames, or the format is
 *         not positive
 */
Result<PlayableBuffer> decode_audio_samples(const Bytes& bytes, int sample_rate, int channel_count);

} // namespace codec

} // namespace helios
