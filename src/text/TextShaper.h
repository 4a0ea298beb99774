#pragma once

#include "text/BidiReorder.h"
#include "text/FontFace.h"
#include "util/Error.h"

#include <memory>
#include <string>
#include <vector>

// Positions are FreeType 26.6 pixels.
struct PositionedGlyph {
    unsigned int glyph_index = 0;
    long x_advance = 0;
    long x_offset = 0;
    long y_offset = 0;
};

// Glyphs in visual order, left to right.
struct GlyphRun {
    std::vector<PositionedGlyph> glyphs;
    long advance_width = 0;
};

class TextShapingStrategy {
public:
    virtual ~TextShapingStrategy() = default;

    virtual const char* Name() const = 0;

    // `text` is in logical order; `base` is the paragraph direction.
    virtual bool Shape(const FontFace& font,
                       const std::string& text,
                       TextDirection base,
                       GlyphRun* out,
                       Error* error) const = 0;
};

// Bidi itemisation plus HarfBuzz OpenType shaping per run. Right-to-left
// runs skip pair positioning (kern, dist).
class NativeShapingStrategy : public TextShapingStrategy {
public:
    const char* Name() const override { return "native"; }
    bool Shape(const FontFace& font,
               const std::string& text,
               TextDirection base,
               GlyphRun* out,
               Error* error) const override;
};

// Reorders to display order first, then lays glyphs out left to right from
// the character map and nominal advances, with no contextual shaping or kerning.
class PreShapedStrategy : public TextShapingStrategy {
public:
    const char* Name() const override { return "preshaped"; }
    bool Shape(const FontFace& font,
               const std::string& text,
               TextDirection base,
               GlyphRun* out,
               Error* error) const override;
};

enum class ShapingMode { Auto, Native, PreShaped };

bool ParseShapingMode(const std::string& text, ShapingMode* out);

// True when the linked HarfBuzz carries its OpenType shaper.
bool ProbeNativeShaping();

std::unique_ptr<TextShapingStrategy> CreateShapingStrategy(ShapingMode mode, Error* error);

// Left-to-right layout of already visual-order code points.
bool LayoutLeftToRight(const FontFace& font, const std::u32string& visual, GlyphRun* out, Error* error);
