// SPDX-License-Identifier: Apache-2.0
// Copyright 2022-2025 Jussi Pakkanen

#pragma once

#include <errorhandling.hpp>

#include <optional>
#include <vector>
#include <array>
#include <string>
#include <string_view>
#include <cstddef>
#include <cstdint>

namespace pagewright::internal {

// Fixed page geometry, A4 portrait.
struct PageGeometry {
    static constexpr double width = 595.28;
    static constexpr double height = 841.89;
    static constexpr double margin = 50.0;

    static constexpr double printable_width() { return width - 2 * margin; }
    static constexpr double bottom_limit() { return height - margin; }
};

// Heading sizes are the only ones that get the larger line height ratios.
enum class HeadingLevel : int32_t { H1 = 1, H2 = 2, H3 = 3 };

constexpr double heading_size(HeadingLevel l) {
    switch(l) {
    case HeadingLevel::H1:
        return 24.0;
    case HeadingLevel::H2:
        return 18.0;
    case HeadingLevel::H3:
        return 14.0;
    }
    return 12.0;
}

enum class FontFamily : int32_t { Helvetica, Times, Courier, Symbol };

enum class FontStyle : int32_t { Normal, Bold, Italic, BoldItalic };

inline bool is_bold(FontStyle s) { return s == FontStyle::Bold || s == FontStyle::BoldItalic; }
inline bool is_italic(FontStyle s) { return s == FontStyle::Italic || s == FontStyle::BoldItalic; }

// Unknown names map to Helvetica.
FontFamily parse_font_family(std::string_view name);

class RgbColor {
public:
    RgbColor() = default;
    RgbColor(uint8_t r, uint8_t g, uint8_t b) : r{r}, g{g}, b{b} {}

    // Accepts "RRGGBB" and "#RRGGBB". Anything else is black.
    static RgbColor from_hex(std::optional<std::string_view> hex);
    static RgbColor black() { return RgbColor{}; }

    double red_unit() const { return r / 255.0; }
    double green_unit() const { return g / 255.0; }
    double blue_unit() const { return b / 255.0; }

    std::string to_hex() const;

    bool operator==(const RgbColor &o) const = default;

private:
    uint8_t r = 0;
    uint8_t g = 0;
    uint8_t b = 0;
};

struct FontResource {
    const char *resource_name; // Without the slash.
    const char *base_font;
    bool winansi;
};

// The eight builtin font slots every document carries.
class FontTable {
public:
    static constexpr size_t num_fonts = 8;

    static const FontTable &standard();

    const FontResource &resource_for(FontFamily family, FontStyle style) const;
    const std::array<FontResource, num_fonts> &resources() const { return fonts; }

private:
    explicit FontTable(std::array<FontResource, num_fonts> fonts) : fonts{fonts} {}

    std::array<FontResource, num_fonts> fonts;
};

class TextElement {
public:
    std::string text;
    double x = 0;
    double y = 0;
    double font_size = 12;
    FontStyle style = FontStyle::Normal;
    FontFamily family = FontFamily::Helvetica;
    RgbColor color;
    bool strikethrough = false;
    bool page_break_needed = false;

    int32_t rotation() const { return rotation_; }
    double scale_x() const { return scale_x_; }
    double scale_y() const { return scale_y_; }
    double opacity() const { return opacity_; }

    void set_rotation(int32_t degrees);
    void set_scale(double sx, double sy);
    void set_opacity(double o);

    bool is_transformed() const { return rotation_ != 0 || scale_x_ != 1.0 || scale_y_ != 1.0; }

private:
    int32_t rotation_ = 0;
    double scale_x_ = 1.0;
    double scale_y_ = 1.0;
    double opacity_ = 1.0;
};

enum class DrawMode : int32_t { Stroke, Fill, Both };

struct RectElement {
    double x = 0;
    double y = 0;
    double w = 0;
    double h = 0;
    DrawMode mode = DrawMode::Stroke;
    std::optional<std::string> stroke_color;
    std::optional<std::string> fill_color;
    std::optional<double> stroke_width;
    // Emitted as is, for shapes a rectangle can not express.
    std::optional<std::string> raw_operators;
};

struct ImageSize {
    int32_t w;
    int32_t h;
};

struct ImageElement {
    std::string identifier;
    std::string format;
    std::vector<std::byte> data;
    double x = 0;
    double y = 0;
    double w = 0;
    double h = 0;
    std::optional<ImageSize> pixel_size;
    // Single channel JPEG data, drawn with DeviceGray.
    bool grayscale = false;
};

struct Cursor {
    double x;
    double y;
};

} // namespace pagewright::internal
