/**
 * WakeMatcher.cpp - Normalization, bigram merging and bounded fuzzy matching
 */

#include "hpv/wake/WakeMatcher.hpp"

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <regex>
#include <sstream>
#include <unordered_set>

namespace hpv::wake {

const char* toString(MatchKind kind) {
    switch (kind) {
        case MatchKind::Exact:  return "exact";
        case MatchKind::Fuzzy:  return "fuzzy";
        case MatchKind::Bigram: return "bigram";
    }
    return "unknown";
}

namespace {

bool contains(const std::vector<std::string>& list, const std::string& value) {
    return std::find(list.begin(), list.end(), value) != list.end();
}

bool similar(const std::string& a, const std::string& b) {
    return WakeMatcher::levenshtein(a, b) <= 1;
}

} // namespace

WakeMatcher::WakeMatcher(WakeMatcherConfig config)
    : config_(std::move(config))
{
    // \b(pal|paul|...|hey pal|listen pal)\b
    std::ostringstream pattern;
    pattern << "\\b(";
    bool first = true;
    for (const auto& word : config_.wake_words) {
        std::string alternative = word;
        for (const auto& [lead, tail] : config_.bigrams) {
            if (word == lead + tail) {
                alternative = lead + " " + tail;
            }
        }
        pattern << (first ? "" : "|") << alternative;
        first = false;
    }
    pattern << ")\\b";
    earlyFilter_ = std::regex(pattern.str(), std::regex::icase);
}

std::string WakeMatcher::normalize(const std::string& raw) {
    std::string out;
    out.reserve(raw.size());
    bool pendingSpace = false;

    for (unsigned char c : raw) {
        if (std::isalpha(c)) {
            if (pendingSpace && !out.empty()) {
                out.push_back(' ');
            }
            pendingSpace = false;
            out.push_back(static_cast<char>(std::tolower(c)));
        } else {
            pendingSpace = true;
        }
    }
    return out;
}

std::vector<std::string> WakeMatcher::tokenize(const std::string& normalized) {
    std::vector<std::string> tokens;
    std::istringstream stream(normalized);
    std::string token;
    while (stream >> token) {
        tokens.push_back(token);
    }
    return tokens;
}

std::vector<std::string> WakeMatcher::mergeBigrams(const std::vector<std::string>& tokens) const {
    std::vector<std::string> result = tokens;
    for (size_t i = 0; i + 1 < tokens.size(); ++i) {
        for (const auto& [lead, tail] : config_.bigrams) {
            if (tokens[i] == lead && tokens[i + 1] == tail) {
                std::string merged = lead + tail;
                if (!contains(result, merged)) {
                    result.push_back(merged);
                }
            }
        }
    }
    return result;
}

int WakeMatcher::levenshtein(const std::string& a, const std::string& b) {
    const size_t m = a.size();
    const size_t n = b.size();
    if (m == 0) return static_cast<int>(n);
    if (n == 0) return static_cast<int>(m);

    std::vector<int> prev(n + 1);
    std::vector<int> curr(n + 1);
    for (size_t j = 0; j <= n; ++j) prev[j] = static_cast<int>(j);

    for (size_t i = 1; i <= m; ++i) {
        curr[0] = static_cast<int>(i);
        for (size_t j = 1; j <= n; ++j) {
            int cost = (a[i - 1] == b[j - 1]) ? 0 : 1;
            curr[j] = std::min({prev[j] + 1, curr[j - 1] + 1, prev[j - 1] + cost});
        }
        std::swap(prev, curr);
    }
    return prev[n];
}

bool WakeMatcher::isWakeWord(const std::string& token) const {
    return contains(config_.wake_words, token);
}

std::optional<WakeMatch> WakeMatcher::fuzzyMatch(const std::vector<std::string>& tokens) const {
    for (const auto& token : tokens) {
        for (const auto& candidate : config_.fuzzy_candidates) {
            if (token.empty() || token[0] != candidate[0]) continue;
            if (std::abs(static_cast<int>(token.size()) - static_cast<int>(candidate.size())) > 1) continue;
            if (similar(token, candidate)) {
                return WakeMatch{candidate, MatchKind::Fuzzy};
            }
        }
    }

    // Near-miss pairs such as "hay pal" or "listen bal"
    for (size_t i = 0; i + 1 < tokens.size(); ++i) {
        for (const auto& [lead, tail] : config_.bigrams) {
            if (similar(tokens[i], lead) && similar(tokens[i + 1], tail)) {
                return WakeMatch{lead + tail, MatchKind::Bigram};
            }
        }
    }

    return std::nullopt;
}

WakeDetection WakeMatcher::detect(const std::string& raw, bool skip_fuzzy) const {
    WakeDetection detection;
    detection.normalized = normalize(raw);
    auto base = tokenize(detection.normalized);
    detection.tokens = mergeBigrams(base);

    // Merged two-word phrases take precedence over their component words
    for (size_t i = base.size(); i < detection.tokens.size(); ++i) {
        if (isWakeWord(detection.tokens[i])) {
            detection.matched = WakeMatch{detection.tokens[i], MatchKind::Bigram};
            detection.hasWakeWord = true;
            return detection;
        }
    }

    for (const auto& token : base) {
        if (isWakeWord(token)) {
            detection.matched = WakeMatch{token, MatchKind::Exact};
            detection.hasWakeWord = true;
            return detection;
        }
    }

    if (!skip_fuzzy) {
        detection.matched = fuzzyMatch(base);
        detection.hasWakeWord = detection.matched.has_value();
    }

    return detection;
}

std::string WakeMatcher::stripWakePhrase(const std::string& raw) const {
    // Keep raw words (case, punctuation) aligned with their normalized form
    std::vector<std::string> words;
    std::vector<std::string> keys;
    std::istringstream stream(raw);
    std::string word;
    while (stream >> word) {
        std::string key;
        for (char c : normalize(word)) {
            if (c != ' ') key.push_back(c);
        }
        words.push_back(word);
        keys.push_back(key);
    }

    auto isCandidate = [this](const std::string& key) {
        if (key.empty()) return false;
        if (isWakeWord(key)) return true;
        for (const auto& candidate : config_.fuzzy_candidates) {
            if (key[0] == candidate[0] && similar(key, candidate)) return true;
        }
        return false;
    };

    size_t cut = words.size() + 1;
    for (size_t i = 0; i < keys.size() && cut > words.size(); ++i) {
        if (i + 1 < keys.size()) {
            for (const auto& [lead, tail] : config_.bigrams) {
                if (similar(keys[i], lead) && similar(keys[i + 1], tail)) {
                    cut = i + 2;
                    break;
                }
            }
            if (cut <= words.size()) break;
        }
        if (isCandidate(keys[i])) {
            cut = i + 1;
        }
    }

    if (cut > words.size()) {
        return raw;
    }

    std::string rest;
    for (size_t i = cut; i < words.size(); ++i) {
        if (!rest.empty()) rest.push_back(' ');
        rest += words[i];
    }
    // Punctuation that belonged to the wake phrase
    size_t start = rest.find_first_not_of(" ,.;:!?-");
    return start == std::string::npos ? "" : rest.substr(start);
}

bool WakeMatcher::isWakeOnly(const std::string& raw) const {
    if (!detect(raw).hasWakeWord) return false;
    return normalize(stripWakePhrase(raw)).empty();
}

bool WakeMatcher::passesEarlyFilter(const std::string& raw) const {
    return std::regex_search(raw, earlyFilter_);
}

bool WakeMatcher::simpleContains(const std::string& normalized) const {
    std::string padded = " " + normalized + " ";
    for (const auto& word : config_.wake_words) {
        if (padded.find(" " + word + " ") != std::string::npos) {
            return true;
        }
    }
    for (const auto& [lead, tail] : config_.bigrams) {
        if (isWakeWord(lead + tail) &&
            padded.find(" " + lead + " " + tail + " ") != std::string::npos) {
            return true;
        }
    }
    return false;
}

bool WakeMatcher::suppressIfAIMatch(const std::vector<std::string>& tokens,
                                    const std::string& ai_text,
                                    long long elapsed_ms,
                                    long long grace_ms) const {
    if (ai_text.empty()) return false;

    // Merged so "heypal" in the transcript matches "hey pal" in the AI text
    auto aiTokens = mergeBigrams(tokenize(normalize(ai_text)));
    std::unordered_set<std::string> aiSet(aiTokens.begin(), aiTokens.end());

    bool allFromAI = std::all_of(tokens.begin(), tokens.end(),
        [&aiSet](const std::string& t) { return aiSet.count(t) > 0; });
    bool wakePresent = std::any_of(tokens.begin(), tokens.end(),
        [this](const std::string& t) { return isWakeWord(t); });

    return wakePresent && allFromAI && elapsed_ms > grace_ms;
}

double WakeMatcher::tokenOverlap(const std::string& transcript, const std::string& ai_text) {
    auto tokens = tokenize(normalize(transcript));
    if (tokens.empty() || ai_text.empty()) return 0.0;

    auto aiTokens = tokenize(normalize(ai_text));
    std::unordered_set<std::string> aiSet(aiTokens.begin(), aiTokens.end());

    size_t shared = 0;
    for (const auto& token : tokens) {
        if (aiSet.count(token)) ++shared;
    }
    return static_cast<double>(shared) / static_cast<double>(tokens.size());
}

bool WakeMatcher::isEcho(const std::string& transcript, const std::string& ai_text) const {
    return tokenOverlap(transcript, ai_text) >= config_.echo_overlap_threshold;
}

} // namespace hpv::wake
