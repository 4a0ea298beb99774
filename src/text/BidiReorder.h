#pragma once

#include "util/Error.h"

#include <string>
#include <vector>

enum class TextDirection { LeftToRight, RightToLeft };

// A directional run of the logical text. Runs are listed in visual order
// (left to right) but each run's text stays in logical order.
struct BidiRun {
    std::string text; // UTF-8
    TextDirection direction = TextDirection::LeftToRight;
};

bool SplitVisualRuns(const std::string& utf8, TextDirection base, std::vector<BidiRun>* out, Error* error);

// Full Unicode bidi reordering into display order, with mirrored brackets.
bool ReorderToVisual(const std::string& utf8, TextDirection base, std::u32string* out, Error* error);

std::u32string Utf8ToCodepoints(const std::string& utf8);
std::string CodepointsToUtf8(const std::u32string& text);
