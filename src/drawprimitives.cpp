// SPDX-License-Identifier: Apache-2.0
// Copyright 2025 Jussi Pakkanen

#include <drawprimitives.hpp>
#include <commandstreamformatter.hpp>
#include <textlayout.hpp>
#include <utils.hpp>

#include <fmt/core.h>

#include <algorithm>
#include <cmath>
#include <numbers>

namespace pagewright::internal {

namespace {

const double STRIKE_POSITION = 0.3;
const double STRIKE_THICKNESS = 0.05;

void set_stroke(CommandStreamFormatter &cmds, const RgbColor &c) {
    cmds.append_color_command(c.red_unit(), c.green_unit(), c.blue_unit(), "RG");
}

void set_nonstroke(CommandStreamFormatter &cmds, const RgbColor &c) {
    cmds.append_color_command(c.red_unit(), c.green_unit(), c.blue_unit(), "rg");
}

std::optional<std::string_view> as_view(const std::optional<std::string> &s) {
    if(s) {
        return std::string_view{*s};
    }
    return {};
}

} // namespace

rvoe<std::string> rect_operators(const RectElement &rect, double page_height) {
    if(rect.raw_operators) {
        return *rect.raw_operators;
    }
    const double pdf_y = page_height - rect.y - rect.h;
    const auto stroke = RgbColor::from_hex(as_view(rect.stroke_color));
    const auto fill = RgbColor::from_hex(as_view(rect.fill_color));
    CommandStreamFormatter cmds;
    ERCV(cmds.q());
    switch(rect.mode) {
    case DrawMode::Stroke:
        cmds.append_command(rect.stroke_width.value_or(1.0), "w");
        set_stroke(cmds, stroke);
        cmds.append_command(rect.x, pdf_y, rect.w, rect.h, "re");
        cmds.append("S");
        break;
    case DrawMode::Fill:
        set_nonstroke(cmds, fill);
        cmds.append_command(rect.x, pdf_y, rect.w, rect.h, "re");
        cmds.append("f");
        break;
    case DrawMode::Both:
        cmds.append_command(rect.stroke_width.value_or(1.0), "w");
        set_stroke(cmds, stroke);
        set_nonstroke(cmds, fill);
        cmds.append_command(rect.x, pdf_y, rect.w, rect.h, "re");
        cmds.append("B");
        break;
    }
    ERCV(cmds.Q());
    return cmds.steal();
}

rvoe<std::string> text_operators(const TextElement &text,
                                 const FontTable &fonts,
                                 std::optional<std::string_view> gs_name) {
    const auto &font = fonts.resource_for(text.family, text.style);
    const double baseline_y = TextLayoutEngine::flip_y(text.y, text.font_size);
    const std::string encoded = font.winansi ? utf8_to_winansi(text.text) : text.text;
    const double text_width =
        TextLayoutEngine::estimate_width(encoded, text.font_size, text.style);
    CommandStreamFormatter cmds;

    ERCV(cmds.q());
    if(gs_name) {
        cmds.append(fmt::format("/{} gs", *gs_name));
    }
    // Rotated or scaled text is drawn in its own coordinate system anchored
    // at the baseline start.
    double origin_x = text.x;
    double origin_y = baseline_y;
    if(text.is_transformed()) {
        const double angle = text.rotation() * std::numbers::pi / 180.0;
        const double cosv = std::cos(angle);
        const double sinv = std::sin(angle);
        cmds.append_command(text.scale_x() * cosv,
                           text.scale_x() * sinv,
                           -text.scale_y() * sinv,
                           text.scale_y() * cosv,
                           text.x,
                           baseline_y,
                           "cm");
        origin_x = 0;
        origin_y = 0;
    }
    ERCV(cmds.BT());
    cmds.append(fmt::format("/{} {:f} Tf", font.resource_name, text.font_size));
    set_nonstroke(cmds, text.color);
    cmds.append_command(origin_x, origin_y, "Td");
    cmds.append(fmt::format("({}) Tj", pdfstring_quote(encoded)));
    ERCV(cmds.ET());
    if(text.strikethrough) {
        const double line_y = origin_y + text.font_size * STRIKE_POSITION;
        cmds.append_command(std::max(0.5, text.font_size * STRIKE_THICKNESS), "w");
        set_stroke(cmds, text.color);
        cmds.append_command(origin_x, line_y, "m");
        cmds.append_command(origin_x + text_width, line_y, "l");
        cmds.append("S");
    }
    ERCV(cmds.Q());
    return cmds.steal();
}

rvoe<std::string> image_placement_operators(const ImageElement &image,
                                            std::string_view xobj_name) {
    const double pdf_y = PageGeometry::height - image.y - image.h;
    CommandStreamFormatter cmds;
    ERCV(cmds.q());
    cmds.append_command(image.w, 0, 0, image.h, image.x, pdf_y, "cm");
    cmds.append(fmt::format("/{} Do", xobj_name));
    ERCV(cmds.Q());
    return cmds.steal();
}

} // namespace pagewright::internal
