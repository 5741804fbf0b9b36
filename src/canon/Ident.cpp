#include "canon/Ident.hpp"

namespace canon {

Ident Ident::forText(std::string_view text) {
    Ident ident;
    ident.rawText = text;
    if (text.empty()) {
        return ident;
    }

    ident.attributes.effectful = text.back() == kEffectfulSuffix;
    ident.attributes.ignored = text.front() == kIgnoredPrefix;
    ident.attributes.reassignable = text.size() > 1 && text.back() == kReassignableSuffix;

    for (size_t i = 1; i < text.size(); ++i) {
        if (text[i] == '_' && text[i - 1] == '_') {
            ident.problems.subsequentUnderscores = true;
            break;
        }
    }

    return ident;
}

} // namespace canon
