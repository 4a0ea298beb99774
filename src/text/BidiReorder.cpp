#include "text/BidiReorder.h"

#include <unicode/ubidi.h>
#include <unicode/unistr.h>

#include <memory>
#include <vector>

namespace {

struct BidiDeleter {
    void operator()(UBiDi* bidi) const {
        if (bidi) {
            ubidi_close(bidi);
        }
    }
};

using BidiPtr = std::unique_ptr<UBiDi, BidiDeleter>;

UBiDiLevel BaseLevel(TextDirection base) {
    return base == TextDirection::RightToLeft ? UBIDI_RTL : UBIDI_LTR;
}

// `text` must outlive the returned paragraph.
BidiPtr OpenParagraph(const icu::UnicodeString& text, TextDirection base, Error* error) {
    UErrorCode status = U_ZERO_ERROR;
    BidiPtr bidi(ubidi_openSized(text.length(), 0, &status));
    if (U_FAILURE(status) || !bidi) {
        SetError(error, ErrorCode::InvalidInput, std::string("ubidi_openSized: ") + u_errorName(status));
        return nullptr;
    }
    ubidi_setPara(bidi.get(), text.getBuffer(), text.length(), BaseLevel(base), nullptr, &status);
    if (U_FAILURE(status)) {
        SetError(error, ErrorCode::InvalidInput, std::string("ubidi_setPara: ") + u_errorName(status));
        return nullptr;
    }
    return bidi;
}

} // namespace

std::u32string Utf8ToCodepoints(const std::string& utf8) {
    icu::UnicodeString text = icu::UnicodeString::fromUTF8(utf8);
    std::u32string out;
    out.reserve(static_cast<size_t>(text.length()));
    for (int32_t i = 0; i < text.length(); i = text.moveIndex32(i, 1)) {
        out.push_back(static_cast<char32_t>(text.char32At(i)));
    }
    return out;
}

std::string CodepointsToUtf8(const std::u32string& text) {
    icu::UnicodeString unicode;
    for (char32_t cp : text) {
        unicode.append(static_cast<UChar32>(cp));
    }
    std::string out;
    unicode.toUTF8String(out);
    return out;
}

bool SplitVisualRuns(const std::string& utf8, TextDirection base, std::vector<BidiRun>* out, Error* error) {
    out->clear();
    if (utf8.empty()) {
        return true;
    }
    icu::UnicodeString text = icu::UnicodeString::fromUTF8(utf8);
    BidiPtr bidi = OpenParagraph(text, base, error);
    if (!bidi) {
        return false;
    }

    UErrorCode status = U_ZERO_ERROR;
    int32_t count = ubidi_countRuns(bidi.get(), &status);
    if (U_FAILURE(status)) {
        return SetError(error, ErrorCode::InvalidInput, std::string("ubidi_countRuns: ") + u_errorName(status));
    }
    for (int32_t i = 0; i < count; ++i) {
        int32_t start = 0;
        int32_t length = 0;
        UBiDiDirection direction = ubidi_getVisualRun(bidi.get(), i, &start, &length);
        BidiRun run;
        text.tempSubString(start, length).toUTF8String(run.text);
        run.direction = direction == UBIDI_RTL ? TextDirection::RightToLeft : TextDirection::LeftToRight;
        out->push_back(std::move(run));
    }
    return true;
}

bool ReorderToVisual(const std::string& utf8, TextDirection base, std::u32string* out, Error* error) {
    out->clear();
    if (utf8.empty()) {
        return true;
    }
    icu::UnicodeString text = icu::UnicodeString::fromUTF8(utf8);
    BidiPtr bidi = OpenParagraph(text, base, error);
    if (!bidi) {
        return false;
    }

    std::vector<UChar> visual(static_cast<size_t>(text.length()) + 1);
    UErrorCode status = U_ZERO_ERROR;
    int32_t length = ubidi_writeReordered(bidi.get(), visual.data(), static_cast<int32_t>(visual.size()),
                                          UBIDI_DO_MIRRORING | UBIDI_REMOVE_BIDI_CONTROLS, &status);
    if (U_FAILURE(status)) {
        return SetError(error, ErrorCode::InvalidInput, std::string("ubidi_writeReordered: ") + u_errorName(status));
    }

    icu::UnicodeString reordered(visual.data(), length);
    for (int32_t i = 0; i < reordered.length(); i = reordered.moveIndex32(i, 1)) {
        out->push_back(static_cast<char32_t>(reordered.char32At(i)));
    }
    return true;
}
