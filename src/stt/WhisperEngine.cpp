/**
 * WhisperEngine.cpp - whisper.cpp recognition with prompt biasing
 */

#include "hpv/stt/WhisperEngine.hpp"

#include <iostream>
#include <sstream>

#include "whisper.h"

namespace hpv::stt {

struct WhisperEngine::Impl {
    std::string model_path;
    int n_threads;

    // whisper_full_params keeps raw pointers into these
    std::string language = "en";
    std::string prompt;

    whisper_context* ctx = nullptr;
    whisper_full_params params;
    std::string error;

    Impl(std::string path, int threads) : model_path(std::move(path)), n_threads(threads) {}

    ~Impl() {
        if (ctx) {
            whisper_free(ctx);
            ctx = nullptr;
        }
    }
};

WhisperEngine::WhisperEngine(std::string model_path, int n_threads)
    : impl_(std::make_unique<Impl>(std::move(model_path), n_threads)) {
}

WhisperEngine::~WhisperEngine() = default;

bool WhisperEngine::open(const RecognitionSettings& settings) {
    if (!impl_->ctx) {
        struct whisper_context_params cparams = whisper_context_default_params();
        impl_->ctx = whisper_init_from_file_with_params(impl_->model_path.c_str(), cparams);

        if (!impl_->ctx) {
            impl_->error = "failed to load model " + impl_->model_path;
            std::cerr << "[WhisperEngine] " << impl_->error << std::endl;
            return false;
        }
        std::cout << "[WhisperEngine] Model loaded: " << impl_->model_path << std::endl;
    }

    impl_->language = languageFromLocale(settings.locale);

    // Whisper has no phrase list; the decoder prompt plays that role.
    std::ostringstream prompt;
    for (size_t i = 0; i < settings.phrases.size(); ++i) {
        prompt << (i ? ", " : "") << settings.phrases[i];
    }
    impl_->prompt = prompt.str();

    impl_->params = whisper_full_default_params(WHISPER_SAMPLING_GREEDY);
    impl_->params.language = impl_->language.c_str();
    impl_->params.n_threads = impl_->n_threads;
    impl_->params.print_progress = false;
    impl_->params.print_timestamps = false;
    impl_->params.print_realtime = false;
    impl_->params.print_special = false;
    impl_->params.translate = false;
    impl_->params.no_context = true;
    impl_->params.suppress_blank = true;
    if (!impl_->prompt.empty()) {
        impl_->params.initial_prompt = impl_->prompt.c_str();
    }

    std::cout << "[WhisperEngine] Language: " << impl_->language
              << ", threads: " << impl_->n_threads
              << ", bias phrases: " << settings.phrases.size() << std::endl;
    return true;
}

bool WhisperEngine::isReady() const {
    return impl_->ctx != nullptr;
}

RecognitionResult WhisperEngine::recognize(const std::vector<float>& pcm, bool interim) {
    RecognitionResult result;
    if (!impl_->ctx) {
        result.error = "model not loaded";
        return result;
    }
    if (pcm.empty()) {
        result.ok = true;
        return result;
    }

    whisper_full_params params = impl_->params;
    params.single_segment = interim;

    int rc = whisper_full(impl_->ctx, params, pcm.data(), static_cast<int>(pcm.size()));
    if (rc != 0) {
        result.error = "whisper_full failed: " + std::to_string(rc);
        return result;
    }

    const whisper_token eot = whisper_token_eot(impl_->ctx);
    double probSum = 0.0;
    int tokens = 0;

    const int n_segments = whisper_full_n_segments(impl_->ctx);
    for (int i = 0; i < n_segments; ++i) {
        const char* segment_text = whisper_full_get_segment_text(impl_->ctx, i);
        if (segment_text) {
            result.text += segment_text;
        }

        const int n_tokens = whisper_full_n_tokens(impl_->ctx, i);
        for (int t = 0; t < n_tokens; ++t) {
            // Timestamp and control tokens sort after end-of-text
            if (whisper_full_get_token_id(impl_->ctx, i, t) >= eot) continue;
            probSum += whisper_full_get_token_p(impl_->ctx, i, t);
            ++tokens;
        }
    }

    result.ok = true;
    result.confidence = tokens > 0 ? static_cast<float>(probSum / tokens) : 0.0f;
    return result;
}

std::string WhisperEngine::lastError() const {
    return impl_->error;
}

std::string WhisperEngine::getModelInfo() const {
    if (!isReady()) {
        return "Model not loaded";
    }
    return "whisper (" + impl_->model_path + ")";
}

} // namespace hpv::stt
