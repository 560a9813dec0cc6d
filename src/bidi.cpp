#include "bidi.h"
#include <memory>
#include <stdexcept>
#include <vector>
#include <unicode/ubidi.h>
#include <unicode/unistr.h>

std::string bidi_display(const std::string &logical) {
    if (logical.empty())
        return logical;
    icu::UnicodeString src = icu::UnicodeString::fromUTF8(logical);
    UErrorCode status = U_ZERO_ERROR;
    std::unique_ptr<UBiDi, decltype(&ubidi_close)> bidi(ubidi_openSized(src.length(), 0, &status), &ubidi_close);
    if (U_FAILURE(status))
        throw std::runtime_error(std::string("ubidi_openSized: ") + u_errorName(status));

    ubidi_setPara(bidi.get(), src.getBuffer(), src.length(), UBIDI_DEFAULT_LTR, nullptr, &status);
    if (U_FAILURE(status))
        throw std::runtime_error(std::string("ubidi_setPara: ") + u_errorName(status));

    std::vector<UChar> buf((size_t) src.length() + 1);
    int32_t n = ubidi_writeReordered(bidi.get(), buf.data(), (int32_t) buf.size(), UBIDI_DO_MIRRORING, &status);
    if (U_FAILURE(status))
        throw std::runtime_error(std::string("ubidi_writeReordered: ") + u_errorName(status));

    std::string out;
    icu::UnicodeString(buf.data(), n).toUTF8String(out);
    return out;
}
