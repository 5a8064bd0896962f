/**
 * FvadClassifier.cpp - Speech probability from libfvad votes
 */

#include "hpv/audio/SpeechClassifier.hpp"

#include <fvad.h>
#include <algorithm>
#include <cstdint>
#include <iostream>
#include <vector>

namespace hpv::audio {

struct FvadClassifier::Impl {
    Fvad* vad = nullptr;
    int sample_rate = 16000;
    size_t slice_samples = 160;  // 10ms
    std::vector<int16_t> slice16;
};

FvadClassifier::FvadClassifier(int sample_rate, FvadMode mode)
    : pImpl_(std::make_unique<Impl>())
{
    pImpl_->sample_rate = sample_rate;
    pImpl_->slice_samples = static_cast<size_t>(sample_rate / 100);
    pImpl_->slice16.resize(pImpl_->slice_samples);

    pImpl_->vad = fvad_new();
    if (!pImpl_->vad) {
        std::cerr << "[VAD] Failed to create fvad instance" << std::endl;
        return;
    }

    if (fvad_set_sample_rate(pImpl_->vad, sample_rate) < 0) {
        std::cerr << "[VAD] Invalid sample rate: " << sample_rate << std::endl;
        fvad_free(pImpl_->vad);
        pImpl_->vad = nullptr;
        return;
    }

    if (fvad_set_mode(pImpl_->vad, static_cast<int>(mode)) < 0) {
        std::cerr << "[VAD] Invalid fvad mode " << static_cast<int>(mode) << std::endl;
    }
}

FvadClassifier::~FvadClassifier() {
    if (pImpl_->vad) {
        fvad_free(pImpl_->vad);
    }
}

float FvadClassifier::classify(const float* frame, size_t count) {
    if (!pImpl_->vad || count < pImpl_->slice_samples) {
        return 0.0f;
    }

    int slices = 0;
    int voiced = 0;

    for (size_t offset = 0; offset + pImpl_->slice_samples <= count;
         offset += pImpl_->slice_samples) {
        for (size_t i = 0; i < pImpl_->slice_samples; ++i) {
            float sample = std::clamp(frame[offset + i], -1.0f, 1.0f);
            pImpl_->slice16[i] = static_cast<int16_t>(sample * 32767.0f);
        }

        int result = fvad_process(pImpl_->vad, pImpl_->slice16.data(),
                                  pImpl_->slice_samples);
        if (result < 0) {
            std::cerr << "[VAD] fvad_process rejected frame" << std::endl;
            return 0.0f;
        }
        voiced += (result == 1) ? 1 : 0;
        ++slices;
    }

    return static_cast<float>(voiced) / static_cast<float>(slices);
}

void FvadClassifier::reset() {
    if (pImpl_->vad) {
        fvad_reset(pImpl_->vad);
    }
}

bool FvadClassifier::isValid() const {
    return pImpl_->vad != nullptr;
}

} // namespace hpv::audio
