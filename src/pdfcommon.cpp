// SPDX-License-Identifier: Apache-2.0
// Copyright 2022-2025 Jussi Pakkanen

#include <pdfcommon.hpp>
#include <logging.hpp>

#include <fmt/core.h>

#include <cmath>
#include <cctype>

namespace pagewright::internal {

namespace {

bool iequals(std::string_view a, std::string_view b) {
    if(a.size() != b.size()) {
        return false;
    }
    for(size_t i = 0; i < a.size(); ++i) {
        if(std::tolower((unsigned char)a[i]) != std::tolower((unsigned char)b[i])) {
            return false;
        }
    }
    return true;
}

int hexval(char c) {
    if(c >= '0' && c <= '9') {
        return c - '0';
    }
    if(c >= 'a' && c <= 'f') {
        return c - 'a' + 10;
    }
    if(c >= 'A' && c <= 'F') {
        return c - 'A' + 10;
    }
    return -1;
}

} // namespace

FontFamily parse_font_family(std::string_view name) {
    if(iequals(name, "Helvetica")) {
        return FontFamily::Helvetica;
    }
    if(iequals(name, "Times") || iequals(name, "Times-Roman")) {
        return FontFamily::Times;
    }
    if(iequals(name, "Courier")) {
        return FontFamily::Courier;
    }
    if(iequals(name, "Symbol")) {
        return FontFamily::Symbol;
    }
    get_logger()->debug("Unsupported font family '{}', using Helvetica.", name);
    return FontFamily::Helvetica;
}

RgbColor RgbColor::from_hex(std::optional<std::string_view> hex) {
    if(!hex) {
        return RgbColor{};
    }
    std::string_view digits = *hex;
    if(!digits.empty() && digits.front() == '#') {
        digits.remove_prefix(1);
    }
    if(digits.size() != 6) {
        get_logger()->debug("Malformed color '{}', using black.", *hex);
        return RgbColor{};
    }
    std::array<uint8_t, 3> channels;
    for(size_t i = 0; i < 3; ++i) {
        const int high = hexval(digits[2 * i]);
        const int low = hexval(digits[2 * i + 1]);
        if(high < 0 || low < 0) {
            get_logger()->debug("Malformed color '{}', using black.", *hex);
            return RgbColor{};
        }
        channels[i] = uint8_t(high * 16 + low);
    }
    return RgbColor{channels[0], channels[1], channels[2]};
}

std::string RgbColor::to_hex() const { return fmt::format("{:02X}{:02X}{:02X}", r, g, b); }

const FontTable &FontTable::standard() {
    // clang-format off
    static const FontTable table{std::array<FontResource, num_fonts>{
        FontResource{"F1", "Helvetica", true},
        FontResource{"F2", "Helvetica-Bold", true},
        FontResource{"F3", "Helvetica-Oblique", true},
        FontResource{"F4", "Helvetica-BoldOblique", true},
        FontResource{"F5", "Times-Roman", true},
        FontResource{"F6", "Times-Bold", true},
        FontResource{"F7", "Courier", true},
        FontResource{"F8", "Symbol", false},
    }};
    // clang-format on
    return table;
}

const FontResource &FontTable::resource_for(FontFamily family, FontStyle style) const {
    switch(family) {
    case FontFamily::Helvetica:
        return fonts.at((size_t)style);
    case FontFamily::Times:
        // No italic slot, italics fall back to the upright variant.
        return is_bold(style) ? fonts.at(5) : fonts.at(4);
    case FontFamily::Courier:
        return fonts.at(6);
    case FontFamily::Symbol:
        return fonts.at(7);
    }
    return fonts.at(0);
}

void TextElement::set_rotation(int32_t degrees) {
    rotation_ = degrees % 360;
    if(rotation_ < 0) {
        rotation_ += 360;
    }
}

void TextElement::set_scale(double sx, double sy) {
    if(!(sx > 0) || !(sy > 0) || !std::isfinite(sx) || !std::isfinite(sy)) {
        get_logger()->debug("Invalid text scale {} {}, using 1.0.", sx, sy);
        scale_x_ = 1.0;
        scale_y_ = 1.0;
        return;
    }
    scale_x_ = sx;
    scale_y_ = sy;
}

void TextElement::set_opacity(double o) {
    if(std::isnan(o)) {
        opacity_ = 1.0;
    } else if(o < 0.0) {
        opacity_ = 0.0;
    } else if(o > 1.0) {
        opacity_ = 1.0;
    } else {
        opacity_ = o;
    }
}

} // namespace pagewright::internal
