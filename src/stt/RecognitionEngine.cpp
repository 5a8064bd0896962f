/**
 * RecognitionEngine.cpp - Shared engine helpers
 */

#include "hpv/stt/RecognitionEngine.hpp"

#include <cctype>

namespace hpv::stt {

std::string languageFromLocale(const std::string& locale) {
    auto dash = locale.find_first_of("-_");
    std::string lang = locale.substr(0, dash);
    for (auto& c : lang) {
        c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    }
    return lang.empty() ? "en" : lang;
}

} // namespace hpv::stt
