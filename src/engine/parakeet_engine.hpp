#pragma once

#include "engine.hpp"

#include <cstdint>
#include <istream>
#include <memory>
#include <onnxruntime_cxx_api.h>
#include <span>
#include <string>
#include <vector>

// TDT greedy decoding pieces that do not touch the runtime.
namespace parakeet {

// Upper bound on tokens emitted for a single encoder frame before the
// decoder is forced to move on.
constexpr int kMaxTokensPerStep = 10;

struct Vocabulary {
    std::vector<std::string> tokens; // indexed by id
    int64_t blank_id = 0;            // "<blk>", otherwise the highest id
};

// Parses "token id" lines. `source` names the input in error messages.
std::expected<Vocabulary, std::string> parse_vocab(std::istream& in, const std::string& source);

struct Cursor {
    int64_t frame = 0;
    int emitted = 0; // tokens emitted on the current frame
};

// Applies one joint-network decision to the cursor. Returns true when
// `token` is emitted.
bool step(Cursor& cursor, int64_t token, int64_t duration, int64_t blank_id);

// Concatenates token pieces, turns word markers into spaces, trims.
std::string detokenize(std::span<const std::string> vocab, std::span<const int64_t> tokens);

} // namespace parakeet

// Quantized engine: a NeMo Parakeet TDT model directory run through ONNX
// Runtime. Language is always auto-detected by the model.
class ParakeetEngine : public Engine {
public:
    struct ModelFiles {
        std::filesystem::path preprocessor;
        std::filesystem::path encoder;
        std::filesystem::path decoder_joint;
        std::filesystem::path vocab;
    };

    // File names inside the model directory for the given quantization.
    static ModelFiles model_files(const std::filesystem::path& dir, Quantization quantization);

    explicit ParakeetEngine(EngineOptions options);
    ~ParakeetEngine() override;

    ParakeetEngine(const ParakeetEngine&) = delete;
    ParakeetEngine& operator=(const ParakeetEngine&) = delete;

    std::expected<void, std::string>
        load_model(const std::filesystem::path& model_path, const ModelParams& params) override;

    std::expected<TranscriptionResult, std::string>
        transcribe(const std::filesystem::path& audio_path, const InferenceParams& params) override;

    EngineState state() const override { return state_; }

private:
    struct Encoded {
        std::vector<float> frames; // [n_frames, dim], row-major
        int64_t n_frames = 0;
        int64_t dim = 0;
    };

    Encoded encode(std::span<const float> pcm);
    std::vector<int64_t> decode(const Encoded& enc);

    EngineOptions options_;
    EngineState state_ = EngineState::Uninitialized;

    // Created by load_model so that runtime errors surface as load failures.
    Ort::Env env_{nullptr};
    Ort::SessionOptions session_opts_{nullptr};
    Ort::MemoryInfo mem_info_{nullptr};
    std::unique_ptr<Ort::Session> preprocessor_;
    std::unique_ptr<Ort::Session> encoder_;
    std::unique_ptr<Ort::Session> decoder_joint_;

    parakeet::Vocabulary vocab_;
    std::vector<int64_t> state_shape_; // [layers, 1, hidden]
};
