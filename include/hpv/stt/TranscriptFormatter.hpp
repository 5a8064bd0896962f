/**
 * TranscriptFormatter.hpp - Disfluency removal and punctuation restoration
 */

#pragma once

#include <string>
#include <vector>

namespace hpv::stt {

struct FormatterOptions {
    bool remove_disfluencies = true;
    bool restore_punctuation = true;
    std::vector<std::string> fillers = {
        "um", "umm", "uh", "uhh", "uhm", "er", "erm", "ah", "hmm", "mm", "mhm"
    };
};

class TranscriptFormatter {
public:
    explicit TranscriptFormatter(FormatterOptions options = {});

    std::string format(const std::string& text) const;

    /**
     * Drops filler words and immediate word repeats ("the the").
     */
    std::string removeDisfluencies(const std::string& text) const;

    /**
     * Capitalises the sentence start and "i", adds a terminal mark
     * ('?' after a leading question word, '.' otherwise).
     */
    static std::string restorePunctuation(const std::string& text);

private:
    FormatterOptions options_;
};

} // namespace hpv::stt
