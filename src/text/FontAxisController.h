#pragma once

#include "render/RenderSpec.h"
#include "util/Error.h"

#include <ft2build.h>
#include FT_FREETYPE_H

#include <map>
#include <string>
#include <vector>

struct FontAxis {
    std::string tag;  // OpenType tag, e.g. "wght"
    std::string name; // as named in the font
    double minimum = 0.0;
    double def = 0.0;
    double maximum = 0.0;
    unsigned int index = 0; // position in the font's fvar table
};

struct FontAxisTable {
    std::string path;
    std::vector<FontAxis> axes; // in fvar order

    int IndexOf(const std::string& tag) const;
    std::string TagList() const;
};

// Variable font axes differ in count and order between families, so the
// axis table is read from each font file (once per path) and requests are
// placed by the discovered index.
class FontAxisController {
public:
    explicit FontAxisController(FT_Library library);

    bool Discover(const std::string& path, FT_Face face, const FontAxisTable** out, Error* error);
    bool Apply(const std::string& path, FT_Face face, const std::vector<AxisSetting>& settings, Error* error);

    // "weight" -> "wght", "width" -> "wdth", ...; four letter tags pass through.
    static bool AxisTagFor(const std::string& axis, std::string* tag);

    size_t DiscoveredFontCount() const { return tables_.size(); }

private:
    FT_Library library_;
    std::map<std::string, FontAxisTable> tables_;
};
