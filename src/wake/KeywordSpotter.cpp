/**
 * KeywordSpotter.cpp - Engine selection
 */

#include "hpv/wake/KeywordSpotter.hpp"

#include <iostream>

namespace hpv::wake {

std::unique_ptr<KeywordSpotter> createKeywordSpotter() {
#ifdef HPV_HAS_PORCUPINE
    return std::make_unique<PorcupineSpotter>();
#else
    std::cout << "[KeywordSpotter] Built without a keyword engine" << std::endl;
    return nullptr;
#endif
}

} // namespace hpv::wake
