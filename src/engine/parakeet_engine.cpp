#include "parakeet_engine.hpp"
#include "../text.hpp"
#include "../wav.hpp"

#include <algorithm>
#include <array>
#include <fstream>
#include <functional>
#include <iterator>
#include <numeric>
#include <string_view>

namespace fs = std::filesystem;

namespace {

// SentencePiece word boundary marker (U+2581).
constexpr std::string_view kWordMarker = "\xE2\x96\x81";

int64_t argmax(const float* begin, const float* end) {
    return std::distance(begin, std::max_element(begin, end));
}

std::string quantization_suffix(Quantization quantization) {
    switch (quantization) {
        case Quantization::Int8:
            return ".int8";
    }
    return {};
}

} // namespace

namespace parakeet {

std::expected<Vocabulary, std::string> parse_vocab(std::istream& in, const std::string& source) {
    std::vector<std::pair<std::string, int64_t>> entries;
    int64_t max_id = -1;
    std::string line;
    while (std::getline(in, line)) {
        if (!line.empty() && line.back() == '\r') line.pop_back();
        if (line.empty()) continue;

        auto sep = line.rfind(' ');
        if (sep == std::string::npos || sep == 0) {
            return std::unexpected("malformed vocabulary line: " + line);
        }
        int64_t id = 0;
        try {
            id = std::stoll(line.substr(sep + 1));
        } catch (const std::exception&) {
            return std::unexpected("malformed vocabulary line: " + line);
        }
        if (id < 0) {
            return std::unexpected("malformed vocabulary line: " + line);
        }
        entries.emplace_back(line.substr(0, sep), id);
        max_id = std::max(max_id, id);
    }

    if (entries.empty()) {
        return std::unexpected("empty vocabulary: " + source);
    }

    Vocabulary vocab;
    vocab.tokens.assign(max_id + 1, std::string{});
    vocab.blank_id = max_id;
    for (auto& [token, id] : entries) {
        if (token == "<blk>") vocab.blank_id = id;
        vocab.tokens[id] = std::move(token);
    }
    return vocab;
}

bool step(Cursor& cursor, int64_t token, int64_t duration, int64_t blank_id) {
    bool emit = token != blank_id;
    if (emit) ++cursor.emitted;

    if (duration > 0) {
        cursor.frame += duration;
        cursor.emitted = 0;
    } else if (!emit || cursor.emitted == kMaxTokensPerStep) {
        cursor.frame += 1;
        cursor.emitted = 0;
    }
    return emit;
}

std::string detokenize(std::span<const std::string> vocab, std::span<const int64_t> tokens) {
    std::string joined;
    for (auto id : tokens) {
        if (id >= 0 && id < static_cast<int64_t>(vocab.size())) {
            joined += vocab[id];
        }
    }

    std::string out;
    out.reserve(joined.size());
    for (size_t pos = 0; pos < joined.size();) {
        if (joined.compare(pos, kWordMarker.size(), kWordMarker) == 0) {
            out += ' ';
            pos += kWordMarker.size();
        } else {
            out += joined[pos++];
        }
    }
    return text::trim(out);
}

} // namespace parakeet

ParakeetEngine::ModelFiles ParakeetEngine::model_files(const fs::path& dir,
                                                       Quantization quantization) {
    auto suffix = quantization_suffix(quantization);
    return ModelFiles{
        .preprocessor = dir / "nemo128.onnx",
        .encoder = dir / ("encoder-model" + suffix + ".onnx"),
        .decoder_joint = dir / ("decoder_joint-model" + suffix + ".onnx"),
        .vocab = dir / "vocab.txt",
    };
}

ParakeetEngine::ParakeetEngine(EngineOptions options) : options_(options) {}

ParakeetEngine::~ParakeetEngine() = default;

std::expected<void, std::string>
ParakeetEngine::load_model(const fs::path& model_path, const ModelParams& params) {
    const auto& parakeet_params = std::get<ParakeetModelParams>(params);

    auto fail = [this](std::string msg) -> std::expected<void, std::string> {
        state_ = EngineState::Failed;
        return std::unexpected(std::move(msg));
    };

    std::error_code ec;
    if (!fs::is_directory(model_path, ec)) {
        return fail("parakeet model path is not a directory: " + model_path.string());
    }

    auto files = model_files(model_path, parakeet_params.quantization);
    for (const auto& file : {files.preprocessor, files.encoder, files.decoder_joint, files.vocab}) {
        if (!fs::exists(file, ec)) {
            return fail("missing " + file.filename().string() + " in model directory " +
                        model_path.string());
        }
    }

    std::ifstream vocab_file(files.vocab);
    if (!vocab_file.is_open()) {
        return fail("cannot open vocabulary: " + files.vocab.string());
    }
    auto vocab = parakeet::parse_vocab(vocab_file, files.vocab.string());
    if (!vocab) {
        return fail(vocab.error());
    }
    vocab_ = std::move(*vocab);

    try {
        env_ = Ort::Env(options_.verbose ? ORT_LOGGING_LEVEL_WARNING : ORT_LOGGING_LEVEL_FATAL,
                        "transcribe-cli");
        mem_info_ = Ort::MemoryInfo::CreateCpu(OrtArenaAllocator, OrtMemTypeDefault);
        session_opts_ = Ort::SessionOptions();
        session_opts_.SetIntraOpNumThreads(options_.n_threads);
        session_opts_.SetGraphOptimizationLevel(GraphOptimizationLevel::ORT_ENABLE_ALL);

        preprocessor_ = std::make_unique<Ort::Session>(env_, files.preprocessor.c_str(), session_opts_);
        encoder_ = std::make_unique<Ort::Session>(env_, files.encoder.c_str(), session_opts_);
        decoder_joint_ = std::make_unique<Ort::Session>(env_, files.decoder_joint.c_str(), session_opts_);

        // Recurrent state is [layers, batch, hidden]; batch is dynamic.
        Ort::AllocatorWithDefaultOptions alloc;
        state_shape_.clear();
        for (size_t i = 0; i < decoder_joint_->GetInputCount(); ++i) {
            std::string name = decoder_joint_->GetInputNameAllocated(i, alloc).get();
            if (name != "input_states_1") continue;
            auto shape = decoder_joint_->GetInputTypeInfo(i).GetTensorTypeAndShapeInfo().GetShape();
            if (shape.size() == 3) {
                state_shape_ = {shape[0], 1, shape[2]};
            }
        }
        if (state_shape_.empty()) {
            return fail("unexpected decoder state layout in " + files.decoder_joint.string());
        }
    } catch (const Ort::Exception& e) {
        return fail(e.what());
    }

    state_ = EngineState::Ready;
    return {};
}

std::expected<TranscriptionResult, std::string>
ParakeetEngine::transcribe(const fs::path& audio_path, const InferenceParams& /*params*/) {
    auto samples = wav::read_file(audio_path);
    if (!samples) {
        return std::unexpected(samples.error());
    }
    auto pcm = wav::to_float(*samples);

    try {
        auto enc = encode(pcm);
        auto tokens = decode(enc);
        return TranscriptionResult{.text = parakeet::detokenize(vocab_.tokens, tokens)};
    } catch (const Ort::Exception& e) {
        return std::unexpected(e.what());
    }
}

ParakeetEngine::Encoded ParakeetEngine::encode(std::span<const float> pcm) {
    std::array<int64_t, 2> wave_shape{1, static_cast<int64_t>(pcm.size())};
    std::array<int64_t, 1> len_shape{1};
    int64_t wave_len = static_cast<int64_t>(pcm.size());

    std::vector<Ort::Value> pre_in;
    pre_in.push_back(Ort::Value::CreateTensor<float>(
        mem_info_, const_cast<float*>(pcm.data()), pcm.size(), wave_shape.data(), wave_shape.size()));
    pre_in.push_back(Ort::Value::CreateTensor<int64_t>(
        mem_info_, &wave_len, 1, len_shape.data(), len_shape.size()));

    const char* pre_in_names[] = {"waveforms", "waveforms_lens"};
    const char* pre_out_names[] = {"features", "features_lens"};
    auto features = preprocessor_->Run(Ort::RunOptions{nullptr}, pre_in_names, pre_in.data(),
                                       pre_in.size(), pre_out_names, 2);

    const char* enc_in_names[] = {"audio_signal", "length"};
    const char* enc_out_names[] = {"outputs", "encoded_lengths"};
    auto enc_out = encoder_->Run(Ort::RunOptions{nullptr}, enc_in_names, features.data(),
                                 features.size(), enc_out_names, 2);

    // Encoder output is [1, dim, time]; transpose to one row per frame.
    auto shape = enc_out[0].GetTensorTypeAndShapeInfo().GetShape();
    int64_t dim = shape[1];
    int64_t t_max = shape[2];
    int64_t n_frames = std::min(enc_out[1].GetTensorData<int64_t>()[0], t_max);
    const float* data = enc_out[0].GetTensorData<float>();

    Encoded enc{.frames = std::vector<float>(n_frames * dim), .n_frames = n_frames, .dim = dim};
    for (int64_t t = 0; t < n_frames; ++t) {
        for (int64_t d = 0; d < dim; ++d) {
            enc.frames[t * dim + d] = data[d * t_max + t];
        }
    }
    return enc;
}

std::vector<int64_t> ParakeetEngine::decode(const Encoded& enc) {
    auto state_size = static_cast<size_t>(std::accumulate(
        state_shape_.begin(), state_shape_.end(), int64_t{1}, std::multiplies<>()));
    std::vector<float> state1(state_size, 0.0f);
    std::vector<float> state2(state_size, 0.0f);

    std::array<int64_t, 3> frame_shape{1, enc.dim, 1};
    std::array<int64_t, 2> target_shape{1, 1};
    std::array<int64_t, 1> len_shape{1};
    std::vector<float> frame(enc.dim);

    const char* in_names[] = {"encoder_outputs", "targets", "target_length",
                              "input_states_1", "input_states_2"};
    const char* out_names[] = {"outputs", "output_states_1", "output_states_2"};

    auto vocab_size = static_cast<int64_t>(vocab_.tokens.size());
    std::vector<int64_t> tokens;
    parakeet::Cursor cursor;

    while (cursor.frame < enc.n_frames) {
        std::copy_n(enc.frames.begin() + cursor.frame * enc.dim, enc.dim, frame.begin());
        auto target = static_cast<int32_t>(tokens.empty() ? vocab_.blank_id : tokens.back());
        int32_t target_len = 1;

        std::vector<Ort::Value> in;
        in.push_back(Ort::Value::CreateTensor<float>(
            mem_info_, frame.data(), frame.size(), frame_shape.data(), frame_shape.size()));
        in.push_back(Ort::Value::CreateTensor<int32_t>(
            mem_info_, &target, 1, target_shape.data(), target_shape.size()));
        in.push_back(Ort::Value::CreateTensor<int32_t>(
            mem_info_, &target_len, 1, len_shape.data(), len_shape.size()));
        in.push_back(Ort::Value::CreateTensor<float>(
            mem_info_, state1.data(), state1.size(), state_shape_.data(), state_shape_.size()));
        in.push_back(Ort::Value::CreateTensor<float>(
            mem_info_, state2.data(), state2.size(), state_shape_.data(), state_shape_.size()));

        auto out = decoder_joint_->Run(Ort::RunOptions{nullptr}, in_names, in.data(), in.size(),
                                       out_names, 3);

        const float* logits = out[0].GetTensorData<float>();
        auto n_logits = static_cast<int64_t>(out[0].GetTensorTypeAndShapeInfo().GetElementCount());
        int64_t token = argmax(logits, logits + vocab_size);
        int64_t duration = n_logits > vocab_size ? argmax(logits + vocab_size, logits + n_logits) : 0;

        if (parakeet::step(cursor, token, duration, vocab_.blank_id)) {
            // The prediction network only advances on emitted tokens.
            std::copy_n(out[1].GetTensorData<float>(), state_size, state1.begin());
            std::copy_n(out[2].GetTensorData<float>(), state_size, state2.begin());
            tokens.push_back(token);
        }
    }

    return tokens;
}
