#include "render/LayoutEngine.h"

#include <algorithm>

bool ComputeCardLayout(const RenderSpec& spec, int row_count, CardLayout* out, Error* error) {
    if (row_count <= 0) {
        return SetError(error, ErrorCode::InvalidInput, "layout needs at least one row");
    }
    if (row_count > spec.max_rows) {
        return SetError(error, ErrorCode::InvalidInput,
                        "layout supports at most " + std::to_string(spec.max_rows) + " rows, got " +
                        std::to_string(row_count));
    }
    int available = spec.canvas_height - spec.header_height;
    if (available <= 0) {
        return SetError(error, ErrorCode::InvalidInput, "header leaves no room for rows");
    }
    int row_h = std::min(spec.row_height, available / row_count);
    if (row_h <= 0) {
        return SetError(error, ErrorCode::InvalidInput, "too many rows for the canvas height");
    }

    CardLayout layout;
    layout.row_count = row_count;
    layout.row_height = row_h;
    int free_space = available - row_count * row_h;
    layout.top_padding = free_space / 2;
    layout.bottom_padding = free_space - layout.top_padding;
    layout.content_left = spec.padding_left;
    layout.content_right = spec.canvas_width - spec.padding_right;

    layout.header.band = { 0, 0, spec.canvas_width, spec.header_height };
    layout.header.logo_anchor = { layout.content_left, spec.logo_margin_top };
    layout.header.date_right_x = layout.content_right;
    layout.header.center_y = spec.header_height / 2;

    int content_w = layout.content_right - layout.content_left;
    int name_left = layout.content_right - spec.name_column_width;
    int temp_left = layout.content_left + spec.icon_size + spec.element_spacing;
    int temp_right = std::max(temp_left, name_left - spec.element_spacing);

    int y = spec.header_height + layout.top_padding;
    layout.rows.reserve(row_count);
    for (int i = 0; i < row_count; ++i) {
        RowLayout row;
        row.row = { layout.content_left, y, content_w, row_h };
        row.center_y = y + row_h / 2;
        row.icon_anchor = { layout.content_left, CenteredTop(row.center_y, spec.icon_size) };
        row.temp_zone = { temp_left, y, temp_right - temp_left, row_h };
        row.name_right_x = layout.content_right;
        row.has_separator = i > 0;
        row.separator_y = y;
        layout.rows.push_back(row);
        y += row_h;
    }

    *out = std::move(layout);
    return true;
}

int CenteredTop(int center_y, int height) {
    return center_y - height / 2;
}

int CenteredLeft(const SDL_Rect& zone, int width) {
    return zone.x + (zone.w - width) / 2;
}

int RightAlignedLeft(int right_x, int width) {
    return right_x - width;
}
