#include "wav.hpp"

#include <cstring>
#include <format>
#include <fstream>
#include <iterator>
#include <optional>

namespace wav {

namespace {

uint16_t read_u16(const uint8_t* p) {
    uint16_t v;
    std::memcpy(&v, p, 2);
    return v;
}

uint32_t read_u32(const uint8_t* p) {
    uint32_t v;
    std::memcpy(&v, p, 4);
    return v;
}

bool tag_is(const uint8_t* p, const char* tag) {
    return std::memcmp(p, tag, 4) == 0;
}

struct Format {
    uint16_t audio_format;
    uint16_t channels;
    uint32_t sample_rate;
    uint16_t bits_per_sample;
};

} // namespace

std::expected<std::vector<int16_t>, std::string> decode(std::span<const uint8_t> bytes) {
    if (bytes.size() < 12 || !tag_is(bytes.data(), "RIFF") || !tag_is(bytes.data() + 8, "WAVE")) {
        return std::unexpected("not a RIFF/WAVE file");
    }

    std::optional<Format> fmt;
    std::optional<std::span<const uint8_t>> data;

    size_t pos = 12;
    while (pos + 8 <= bytes.size()) {
        const uint8_t* chunk = bytes.data() + pos;
        uint32_t chunk_size = read_u32(chunk + 4);
        size_t body = pos + 8;

        if (tag_is(chunk, "data")) {
            // Streaming writers leave the size at 0 or 0xFFFFFFFF; take what is there.
            size_t available = bytes.size() - body;
            size_t size = (chunk_size == 0 || chunk_size > available) ? available : chunk_size;
            data = bytes.subspan(body, size);
            // An unsized data chunk runs to the end of the buffer.
            if (fmt || size != chunk_size) break;
            pos = body + size + (size & 1);
            continue;
        }

        if (chunk_size > bytes.size() - body) {
            return std::unexpected("truncated WAV chunk");
        }

        if (tag_is(chunk, "fmt ")) {
            if (chunk_size < 16) {
                return std::unexpected("truncated WAV chunk");
            }
            const uint8_t* f = bytes.data() + body;
            fmt = Format{
                .audio_format = read_u16(f),
                .channels = read_u16(f + 2),
                .sample_rate = read_u32(f + 4),
                .bits_per_sample = read_u16(f + 14),
            };
        }

        // Chunks are word aligned.
        pos = body + chunk_size + (chunk_size & 1);
    }

    if (!fmt) return std::unexpected("missing fmt chunk");
    if (!data) return std::unexpected("missing data chunk");

    // 0xFFFE is WAVE_FORMAT_EXTENSIBLE, which plain 16-bit writers also emit.
    bool pcm = fmt->audio_format == 1 || fmt->audio_format == 0xFFFE;
    if (!pcm || fmt->channels != kChannels || fmt->sample_rate != kSampleRate ||
        fmt->bits_per_sample != kBitsPerSample) {
        return std::unexpected(std::format(
            "unsupported WAV format: expected 16 kHz 16-bit mono PCM, got {} Hz {}-bit "
            "{}-channel (format {})",
            fmt->sample_rate, fmt->bits_per_sample, fmt->channels, fmt->audio_format));
    }

    std::vector<int16_t> samples(data->size() / sizeof(int16_t));
    if (!samples.empty()) {
        std::memcpy(samples.data(), data->data(), samples.size() * sizeof(int16_t));
    }
    return samples;
}

std::expected<std::vector<int16_t>, std::string> read_file(const std::filesystem::path& path) {
    std::ifstream f(path, std::ios::binary);
    if (!f.is_open()) {
        return std::unexpected("cannot open audio file: " + path.string());
    }

    std::vector<uint8_t> bytes((std::istreambuf_iterator<char>(f)),
                               std::istreambuf_iterator<char>());
    if (f.bad()) {
        return std::unexpected("failed to read audio file: " + path.string());
    }

    auto samples = decode(bytes);
    if (!samples) {
        return std::unexpected(path.string() + ": " + samples.error());
    }
    return samples;
}

} // namespace wav
