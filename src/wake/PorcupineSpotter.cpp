/**
 * PorcupineSpotter.cpp - Porcupine wake word detection
 */

#include "hpv/wake/KeywordSpotter.hpp"

#include <algorithm>
#include <cstdint>
#include <iostream>
#include <vector>

// Porcupine C API
extern "C" {
#include "pv_porcupine.h"
}

namespace hpv::wake {

struct PorcupineSpotter::Impl {
    pv_porcupine_t* porcupine = nullptr;
    int frame_length = 512;
    std::vector<int16_t> accumulator;
    core::Error error{core::ErrorKind::ModelLoad, "PorcupineSpotter", "not loaded"};

    bool fail(const std::string& message) {
        error.message = message;
        std::cerr << "[WakeWord] " << message << std::endl;
        return false;
    }

    void release() {
        if (porcupine) {
            pv_porcupine_delete(porcupine);
            porcupine = nullptr;
        }
        accumulator.clear();
    }
};

PorcupineSpotter::PorcupineSpotter() : impl_(std::make_unique<Impl>()) {}

PorcupineSpotter::~PorcupineSpotter() {
    impl_->release();
}

bool PorcupineSpotter::load(const KeywordModel& model) {
    impl_->release();

    if (model.access_key.empty()) {
        return impl_->fail("No Porcupine access key");
    }
    if (model.keyword_paths.empty()) {
        return impl_->fail("No keyword model paths provided");
    }

    std::vector<const char*> paths;
    for (const auto& p : model.keyword_paths) {
        paths.push_back(p.c_str());
    }

    std::vector<float> sensitivities = model.sensitivities;
    sensitivities.resize(model.keyword_paths.size(), 0.5f);

    pv_status_t status = pv_porcupine_init(
        model.access_key.c_str(),
        model.params_path.c_str(),
        "cpu",
        static_cast<int32_t>(paths.size()),
        paths.data(),
        sensitivities.data(),
        &impl_->porcupine
    );

    if (status != PV_STATUS_SUCCESS) {
        impl_->porcupine = nullptr;
        return impl_->fail(std::string("Failed to initialize Porcupine: ") +
                           pv_status_to_string(status));
    }

    impl_->frame_length = pv_porcupine_frame_length();
    impl_->accumulator.reserve(static_cast<size_t>(impl_->frame_length) * 2);

    std::cout << "[WakeWord] Porcupine " << pv_porcupine_version()
              << " loaded " << paths.size() << " keyword(s), frame_length="
              << impl_->frame_length << std::endl;
    return true;
}

bool PorcupineSpotter::isReady() const {
    return impl_->porcupine != nullptr;
}

int PorcupineSpotter::process(const float* samples, size_t count) {
    if (!impl_->porcupine) return -1;

    for (size_t i = 0; i < count; ++i) {
        float sample = std::clamp(samples[i], -1.0f, 1.0f);
        impl_->accumulator.push_back(static_cast<int16_t>(sample * 32767.0f));
    }

    int detected = -1;
    const size_t frame = static_cast<size_t>(impl_->frame_length);
    size_t offset = 0;

    while (impl_->accumulator.size() - offset >= frame) {
        int32_t keyword_index = -1;
        pv_status_t status = pv_porcupine_process(
            impl_->porcupine, impl_->accumulator.data() + offset, &keyword_index);
        offset += frame;

        if (status != PV_STATUS_SUCCESS) {
            std::cerr << "[WakeWord] Process error: " << pv_status_to_string(status) << std::endl;
            continue;
        }
        if (keyword_index >= 0) {
            detected = keyword_index;
        }
    }

    impl_->accumulator.erase(impl_->accumulator.begin(), impl_->accumulator.begin() + offset);
    return detected;
}

void PorcupineSpotter::reset() {
    impl_->accumulator.clear();
}

int PorcupineSpotter::frameLength() const {
    return impl_->frame_length;
}

core::Error PorcupineSpotter::lastError() const {
    return impl_->error;
}

std::string PorcupineSpotter::version() {
    return pv_porcupine_version();
}

} // namespace hpv::wake
