/**
 * WakeMatcher.hpp - Wake phrase detection over (possibly garbled) transcripts
 *
 * Pure text functions: normalize, tokenize, merge known two-word wake
 * phrases into single tokens, then look for an exact, fuzzy (edit distance
 * <= 1) or near-bigram match. Fuzzy matching is bounded to short candidate
 * tokens so long utterances do not produce false positives.
 */

#pragma once

#include <optional>
#include <regex>
#include <string>
#include <utility>
#include <vector>

namespace hpv::wake {

enum class MatchKind {
    Exact,
    Fuzzy,
    Bigram
};

const char* toString(MatchKind kind);

struct WakeMatch {
    std::string phrase;
    MatchKind kind = MatchKind::Exact;
};

struct WakeDetection {
    std::string normalized;
    std::vector<std::string> tokens;   // After bigram merging
    std::optional<WakeMatch> matched;
    bool hasWakeWord = false;
};

struct WakeMatcherConfig {
    std::vector<std::string> wake_words = {
        "pal", "paul", "pel", "pale", "pail", "pow", "pol",
        "listen", "listenpal", "heypal"
    };
    // Short tokens eligible for edit-distance matching
    std::vector<std::string> fuzzy_candidates = {
        "pal", "paul", "pel", "pale", "pail", "pow", "pol"
    };
    // Merged as first+second, e.g. "hey" "pal" -> "heypal"
    std::vector<std::pair<std::string, std::string>> bigrams = {
        {"hey", "pal"},
        {"listen", "pal"}
    };
    double echo_overlap_threshold = 0.7;
};

class WakeMatcher {
public:
    explicit WakeMatcher(WakeMatcherConfig config = {});

    WakeDetection detect(const std::string& raw, bool skip_fuzzy = false) const;

    /**
     * Cheap regex test for a probable wake fragment, used while the AI is
     * speaking before running full detection.
     */
    bool passesEarlyFilter(const std::string& raw) const;

    /**
     * Word-boundary containment of any wake word (two-word phrases included)
     * in already normalized text.
     */
    bool simpleContains(const std::string& normalized) const;

    /**
     * True if every token also appears in the AI's own text, a wake word is
     * among them, and more than grace_ms passed since the AI started
     * speaking. Such a wake is the assistant hearing itself.
     */
    bool suppressIfAIMatch(const std::vector<std::string>& tokens,
                           const std::string& ai_text,
                           long long elapsed_ms,
                           long long grace_ms = 600) const;

    /**
     * Fraction of transcript tokens that occur in ai_text.
     */
    static double tokenOverlap(const std::string& transcript, const std::string& ai_text);

    bool isEcho(const std::string& transcript, const std::string& ai_text) const;

    /**
     * Raw text following the first wake phrase ("Hey pal, what is X?" ->
     * "what is X?"). Returns the whole text when no wake phrase is found.
     */
    std::string stripWakePhrase(const std::string& raw) const;

    /**
     * True when the text holds a wake phrase and nothing else.
     */
    bool isWakeOnly(const std::string& raw) const;

    std::vector<std::string> mergeBigrams(const std::vector<std::string>& tokens) const;

    const WakeMatcherConfig& config() const { return config_; }

    static std::string normalize(const std::string& raw);
    static std::vector<std::string> tokenize(const std::string& normalized);
    static int levenshtein(const std::string& a, const std::string& b);

private:
    bool isWakeWord(const std::string& token) const;
    std::optional<WakeMatch> fuzzyMatch(const std::vector<std::string>& tokens) const;

    WakeMatcherConfig config_;
    std::regex earlyFilter_;
};

} // namespace hpv::wake
