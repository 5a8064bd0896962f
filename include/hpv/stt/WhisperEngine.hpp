/**
 * WhisperEngine.hpp - Local speech recognition with whisper.cpp
 *
 * The model is loaded once by open() and stays resident.
 */

#pragma once

#include "hpv/stt/RecognitionEngine.hpp"

namespace hpv::stt {

class WhisperEngine : public RecognitionEngine {
public:
    WhisperEngine(std::string model_path, int n_threads = 4);
    ~WhisperEngine() override;

    WhisperEngine(const WhisperEngine&) = delete;
    WhisperEngine& operator=(const WhisperEngine&) = delete;

    bool open(const RecognitionSettings& settings) override;
    bool isReady() const override;

    /**
     * Greedy decode. Confidence is the mean probability of the text tokens.
     */
    RecognitionResult recognize(const std::vector<float>& pcm, bool interim) override;

    std::string name() const override { return "whisper"; }
    std::string lastError() const override;

    std::string getModelInfo() const;

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace hpv::stt
