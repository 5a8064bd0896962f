/**
 * KeywordSpotter.hpp - Dedicated wake-word model adapter
 *
 * One implementation per engine, chosen when the detector is built. A
 * spotter that fails to load reports a ModelLoad error and the attention
 * detector falls back to transcription-based wake matching.
 */

#pragma once

#include "hpv/core/Error.hpp"

#include <memory>
#include <string>
#include <vector>

namespace hpv::wake {

struct KeywordModel {
    std::string access_key;
    std::string params_path;                 // Engine parameter file
    std::vector<std::string> keyword_paths;  // Precompiled wake models
    std::vector<float> sensitivities;        // Defaults to 0.5 per keyword
};

class KeywordSpotter {
public:
    virtual ~KeywordSpotter() = default;

    virtual bool load(const KeywordModel& model) = 0;
    virtual bool isReady() const = 0;

    /**
     * Feed 16kHz mono audio. Returns the detected keyword index, or -1.
     */
    virtual int process(const float* samples, size_t count) = 0;

    virtual void reset() = 0;
    virtual int frameLength() const = 0;
    virtual std::string name() const = 0;
    virtual core::Error lastError() const = 0;
};

/**
 * The keyword engine this build was configured with, or nullptr when none
 * is available.
 */
std::unique_ptr<KeywordSpotter> createKeywordSpotter();

#ifdef HPV_HAS_PORCUPINE

class PorcupineSpotter : public KeywordSpotter {
public:
    PorcupineSpotter();
    ~PorcupineSpotter() override;

    PorcupineSpotter(const PorcupineSpotter&) = delete;
    PorcupineSpotter& operator=(const PorcupineSpotter&) = delete;

    bool load(const KeywordModel& model) override;
    bool isReady() const override;
    int process(const float* samples, size_t count) override;
    void reset() override;
    int frameLength() const override;
    std::string name() const override { return "porcupine"; }
    core::Error lastError() const override;

    static std::string version();

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

#endif

} // namespace hpv::wake
