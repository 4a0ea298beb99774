#include "text/FontAxisController.h"

#include FT_MULTIPLE_MASTERS_H

#include <algorithm>
#include <iostream>

namespace {

std::string TagToString(FT_ULong tag) {
    std::string out(4, ' ');
    out[0] = static_cast<char>((tag >> 24) & 0xFF);
    out[1] = static_cast<char>((tag >> 16) & 0xFF);
    out[2] = static_cast<char>((tag >> 8) & 0xFF);
    out[3] = static_cast<char>(tag & 0xFF);
    return out;
}

double FixedToDouble(FT_Fixed value) {
    return static_cast<double>(value) / 65536.0;
}

FT_Fixed DoubleToFixed(double value) {
    return static_cast<FT_Fixed>(value * 65536.0 + (value < 0 ? -0.5 : 0.5));
}

} // namespace

int FontAxisTable::IndexOf(const std::string& tag) const {
    for (const auto& axis : axes) {
        if (axis.tag == tag) {
            return static_cast<int>(axis.index);
        }
    }
    return -1;
}

std::string FontAxisTable::TagList() const {
    if (axes.empty()) {
        return "none";
    }
    std::string out;
    for (const auto& axis : axes) {
        if (!out.empty()) {
            out += ", ";
        }
        out += axis.tag;
    }
    return out;
}

FontAxisController::FontAxisController(FT_Library library) : library_(library) {}

bool FontAxisController::AxisTagFor(const std::string& axis, std::string* tag) {
    static const std::map<std::string, std::string> kSemantic = {
        { "weight", "wght" },
        { "width", "wdth" },
        { "slant", "slnt" },
        { "italic", "ital" },
        { "optical_size", "opsz" },
    };
    auto it = kSemantic.find(axis);
    if (it != kSemantic.end()) {
        *tag = it->second;
        return true;
    }
    if (axis.size() == 4) {
        *tag = axis;
        return true;
    }
    return false;
}

bool FontAxisController::Discover(const std::string& path, FT_Face face, const FontAxisTable** out, Error* error) {
    auto cached = tables_.find(path);
    if (cached != tables_.end()) {
        *out = &cached->second;
        return true;
    }
    if (!face) {
        return SetError(error, ErrorCode::AssetMissing, "no face for " + path);
    }

    FontAxisTable table;
    table.path = path;
    if (FT_HAS_MULTIPLE_MASTERS(face)) {
        FT_MM_Var* mm = nullptr;
        FT_Error err = FT_Get_MM_Var(face, &mm);
        if (err != 0 || !mm) {
            return SetError(error, ErrorCode::UnsupportedAxis,
                            "cannot read variation axes of " + path + " (FreeType error " + std::to_string(err) + ")");
        }
        for (FT_UInt i = 0; i < mm->num_axis; ++i) {
            const FT_Var_Axis& axis = mm->axis[i];
            FontAxis entry;
            entry.tag = TagToString(axis.tag);
            entry.name = axis.name ? axis.name : entry.tag;
            entry.minimum = FixedToDouble(axis.minimum);
            entry.def = FixedToDouble(axis.def);
            entry.maximum = FixedToDouble(axis.maximum);
            entry.index = i;
            table.axes.push_back(entry);
        }
        FT_Done_MM_Var(library_, mm);
    }

    std::cout << "Fonts: " << path << " axes [" << table.TagList() << "]\n";
    auto inserted = tables_.emplace(path, std::move(table));
    *out = &inserted.first->second;
    return true;
}

bool FontAxisController::Apply(const std::string& path,
                               FT_Face face,
                               const std::vector<AxisSetting>& settings,
                               Error* error) {
    const FontAxisTable* table = nullptr;
    if (!Discover(path, face, &table, error)) {
        return false;
    }
    if (settings.empty()) {
        return true;
    }

    std::vector<FT_Fixed> coords;
    coords.reserve(table->axes.size());
    for (const auto& axis : table->axes) {
        coords.push_back(DoubleToFixed(axis.def));
    }

    for (const auto& setting : settings) {
        std::string tag;
        if (!FontAxisController::AxisTagFor(setting.axis, &tag)) {
            return SetError(error, ErrorCode::UnsupportedAxis, "unknown axis name '" + setting.axis + "'");
        }
        int index = table->IndexOf(tag);
        if (index < 0) {
            return SetError(error, ErrorCode::UnsupportedAxis,
                            path + " has no '" + tag + "' axis (axes: " + table->TagList() + ")");
        }
        const FontAxis& axis = table->axes[static_cast<size_t>(index)];
        double value = std::clamp(setting.value, axis.minimum, axis.maximum);
        if (value != setting.value) {
            std::cerr << "Fonts: " << tag << "=" << setting.value << " clamped to " << value << " for " << path << "\n";
        }
        coords[static_cast<size_t>(index)] = DoubleToFixed(value);
    }

    FT_Error err = FT_Set_Var_Design_Coordinates(face, static_cast<FT_UInt>(coords.size()), coords.data());
    if (err != 0) {
        return SetError(error, ErrorCode::UnsupportedAxis,
                        "cannot set variation of " + path + " (FreeType error " + std::to_string(err) + ")");
    }
    return true;
}
