/**
 * TranscriptFormatter.cpp - Recognizer output clean-up
 */

#include "hpv/stt/TranscriptFormatter.hpp"

#include <algorithm>
#include <cctype>
#include <sstream>

namespace hpv::stt {

namespace {

// Lowercase letters/apostrophes only, for comparing words
std::string bare(const std::string& word) {
    std::string out;
    for (unsigned char c : word) {
        if (std::isalpha(c) || c == '\'') {
            out.push_back(static_cast<char>(std::tolower(c)));
        }
    }
    return out;
}

const std::vector<std::string> kQuestionWords = {
    "what", "why", "how", "when", "where", "who", "which", "whose",
    "is", "are", "can", "could", "do", "does", "did", "will", "would",
    "should", "shall", "may", "am", "was", "were", "have", "has"
};

} // namespace

TranscriptFormatter::TranscriptFormatter(FormatterOptions options)
    : options_(std::move(options)) {
}

std::string TranscriptFormatter::format(const std::string& text) const {
    std::string out = text;
    if (options_.remove_disfluencies) {
        out = removeDisfluencies(out);
    }
    if (options_.restore_punctuation) {
        out = restorePunctuation(out);
    }
    return out;
}

std::string TranscriptFormatter::removeDisfluencies(const std::string& text) const {
    std::istringstream stream(text);
    std::string word;
    std::string previous;
    std::string out;

    while (stream >> word) {
        std::string key = bare(word);
        if (key.empty()) {
            // Lone punctuation sticks to the previous word
            out += word;
            continue;
        }
        if (std::find(options_.fillers.begin(), options_.fillers.end(), key) != options_.fillers.end()) {
            continue;
        }
        if (key == previous) {
            continue;
        }
        if (!out.empty()) out.push_back(' ');
        out += word;
        previous = key;
    }
    return out;
}

std::string TranscriptFormatter::restorePunctuation(const std::string& text) {
    // Trim
    size_t begin = text.find_first_not_of(" \t\r\n");
    if (begin == std::string::npos) return "";
    size_t end = text.find_last_not_of(" \t\r\n");
    std::string out = text.substr(begin, end - begin + 1);

    // Leading punctuation left over from removed fillers
    while (!out.empty() && (out[0] == ',' || out[0] == ' ')) {
        out.erase(0, 1);
    }
    if (out.empty()) return out;

    out[0] = static_cast<char>(std::toupper(static_cast<unsigned char>(out[0])));

    for (size_t i = 0; i < out.size(); ++i) {
        if (out[i] != 'i') continue;
        bool startOk = (i == 0) || out[i - 1] == ' ';
        bool endOk = (i + 1 == out.size()) || out[i + 1] == ' ' || out[i + 1] == '\'' ||
                     std::ispunct(static_cast<unsigned char>(out[i + 1]));
        if (startOk && endOk) out[i] = 'I';
    }

    char last = out.back();
    if (last == ',' || last == ';' || last == ':') {
        out.pop_back();
        last = out.empty() ? '\0' : out.back();
    }
    if (last != '.' && last != '?' && last != '!') {
        std::istringstream stream(out);
        std::string first;
        stream >> first;
        bool question = std::find(kQuestionWords.begin(), kQuestionWords.end(), bare(first)) != kQuestionWords.end();
        out.push_back(question ? '?' : '.');
    }
    return out;
}

} // namespace hpv::stt
