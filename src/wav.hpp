#pragma once

#include <cstdint>
#include <expected>
#include <filesystem>
#include <span>
#include <string>
#include <vector>

// PCM WAV handling for the 16 kHz, 16-bit, mono input both engines expect.
namespace wav {

constexpr uint32_t kSampleRate = 16000;
constexpr uint16_t kChannels = 1;
constexpr uint16_t kBitsPerSample = 16;

// Wraps int16 samples in a canonical 44-byte-header mono WAV.
inline std::vector<uint8_t> encode(std::span<const int16_t> samples, uint32_t sample_rate) {
    const auto data_size = static_cast<uint32_t>(samples.size_bytes());
    constexpr uint16_t block_align = kChannels * kBitsPerSample / 8;

    std::vector<uint8_t> out;
    out.reserve(44 + data_size);
    auto tag = [&out](const char* t) { out.insert(out.end(), t, t + 4); };
    auto le = [&out](uint32_t v, int width) {
        for (int i = 0; i < width; ++i) {
            out.push_back(static_cast<uint8_t>(v >> (8 * i)));
        }
    };

    tag("RIFF");
    le(36 + data_size, 4);
    tag("WAVE");

    tag("fmt ");
    le(16, 4);
    le(1, 2); // PCM
    le(kChannels, 2);
    le(sample_rate, 4);
    le(sample_rate * block_align, 4);
    le(block_align, 2);
    le(kBitsPerSample, 2);

    tag("data");
    le(data_size, 4);
    const auto* pcm = reinterpret_cast<const uint8_t*>(samples.data());
    out.insert(out.end(), pcm, pcm + data_size);
    return out;
}

// Parses a RIFF/WAVE buffer. Only 16 kHz 16-bit mono PCM is accepted;
// there is no resampling or downmixing.
std::expected<std::vector<int16_t>, std::string> decode(std::span<const uint8_t> bytes);

std::expected<std::vector<int16_t>, std::string> read_file(const std::filesystem::path& path);

// Scales int16 samples to [-1, 1).
inline std::vector<float> to_float(std::span<const int16_t> samples) {
    std::vector<float> out(samples.size());
    for (size_t i = 0; i < samples.size(); ++i) {
        out[i] = static_cast<float>(samples[i]) / 32768.0f;
    }
    return out;
}

} // namespace wav
