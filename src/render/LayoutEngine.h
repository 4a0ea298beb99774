#pragma once

#include "render/RenderSpec.h"
#include "util/Error.h"

#include <SDL.h>

#include <vector>

struct HeaderLayout {
    SDL_Rect band{};
    SDL_Point logo_anchor{}; // top-left
    int date_right_x = 0;
    int center_y = 0;
};

struct RowLayout {
    SDL_Rect row{};          // content columns only, padding excluded
    int center_y = 0;
    SDL_Point icon_anchor{}; // top-left of the icon square
    SDL_Rect temp_zone{};    // temperature label is centred in here
    int name_right_x = 0;    // city names are right-aligned on this edge
    bool has_separator = false;
    int separator_y = 0;
};

struct CardLayout {
    int row_count = 0;
    int row_height = 0;
    int top_padding = 0;
    int bottom_padding = 0;
    int content_left = 0;
    int content_right = 0;
    HeaderLayout header;
    std::vector<RowLayout> rows;
};

// Geometry for `row_count` rows below the header. The list is centred in the
// space under the header and always accounts for every pixel row:
// header + rows + top + bottom == canvas height.
bool ComputeCardLayout(const RenderSpec& spec, int row_count, CardLayout* out, Error* error);

int CenteredTop(int center_y, int height);
int CenteredLeft(const SDL_Rect& zone, int width);
int RightAlignedLeft(int right_x, int width);
