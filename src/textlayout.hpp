// SPDX-License-Identifier: Apache-2.0
// Copyright 2025 Jussi Pakkanen

#pragma once

#include <pdfcommon.hpp>

#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace pagewright::internal {

struct LayoutOptions {
    double font_size = 12;
    FontStyle style = FontStyle::Normal;
    FontFamily family = FontFamily::Helvetica;
    std::optional<double> max_width;
    // X for every line after the first. If not set, lines keep the starting X.
    std::optional<double> wrap_x;
    // Headings are laid out as a single line with their own line height.
    std::optional<HeadingLevel> heading;
};

struct LayoutResult {
    std::vector<TextElement> elements;
    // If set, the last element did not fit and must not be drawn.
    bool page_break_needed = false;
    // Text of the flagged line plus all words that were not laid out.
    std::string remaining;
};

class TextLayoutEngine {
public:
    explicit TextLayoutEngine(const FontTable &fonts) : fonts{fonts} {}

    LayoutResult layout(std::string_view text,
                        std::optional<double> x,
                        std::optional<double> y,
                        const LayoutOptions &opts,
                        std::optional<Cursor> cursor) const;

    static double estimate_width(std::string_view text, double font_size, FontStyle style);
    static double line_height(double font_size, std::optional<HeadingLevel> heading = {});

    // Converts the Y of a top-left anchored box into PDF space.
    static double flip_y(double y, double font_size) {
        return PageGeometry::height - y - font_size;
    }

    const FontTable &font_table() const { return fonts; }

private:
    const FontTable &fonts;
};

} // namespace pagewright::internal
