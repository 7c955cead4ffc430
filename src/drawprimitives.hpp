// SPDX-License-Identifier: Apache-2.0
// Copyright 2025 Jussi Pakkanen

#pragma once

#include <pdfcommon.hpp>
#include <errorhandling.hpp>

#include <optional>
#include <string>
#include <string_view>

namespace pagewright::internal {

// Operators that draw the rectangle, Y flipped into PDF space.
rvoe<std::string> rect_operators(const RectElement &rect,
                                 double page_height = PageGeometry::height);

// gs_name is the ExtGState resource (without slash) for non-opaque text.
rvoe<std::string> text_operators(const TextElement &text,
                                 const FontTable &fonts,
                                 std::optional<std::string_view> gs_name);

rvoe<std::string> image_placement_operators(const ImageElement &image, std::string_view xobj_name);

} // namespace pagewright::internal
