// SPDX-License-Identifier: Apache-2.0
// Copyright 2025 Jussi Pakkanen

#pragma once

#include <pdfcommon.hpp>

#include <cstddef>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace pagewright::internal {

struct EmbeddedImage {
    std::string normalized_format;
    std::vector<std::string> filter_chain; // Names without the leading slash.
    std::string color_space;
    std::string hex_payload; // Terminated with '>'.
    size_t byte_length;
};

std::string normalize_image_format(std::string_view tag);

std::vector<std::string> filter_chain_for(std::string_view normalized_format);

EmbeddedImage embed_image(std::span<const std::byte> raw_bytes, std::string_view format_tag);

// The dictionary of an image XObject. The payload goes in the stream.
std::string image_dictionary(const EmbeddedImage &image, int32_t width, int32_t height);

// Pixel size of the image XObject: the intrinsic size when known, otherwise
// the placement box rounded to whole units.
ImageSize xobject_size(const ImageElement &image);

} // namespace pagewright::internal
