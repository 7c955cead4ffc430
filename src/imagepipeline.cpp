// SPDX-License-Identifier: Apache-2.0
// Copyright 2025 Jussi Pakkanen

#include <imagepipeline.hpp>
#include <pdfdict.hpp>
#include <logging.hpp>
#include <utils.hpp>

#include <algorithm>
#include <cctype>
#include <cmath>

namespace pagewright::internal {

namespace {

const char *ASCIIHEX_FILTER = "ASCIIHexDecode";
const char *DCT_FILTER = "DCTDecode";
const char *FLATE_FILTER = "FlateDecode";

int32_t box_to_pixels(double v) { return std::max(1, (int32_t)std::lround(v)); }

} // namespace

std::string normalize_image_format(std::string_view tag) {
    std::string upper;
    upper.reserve(tag.size());
    for(const char c : tag) {
        upper.push_back((char)std::toupper((unsigned char)c));
    }
    if(upper.empty() || upper == "JPG" || upper == "JPEG") {
        return "JPEG";
    }
    if(upper == "PNG") {
        return upper;
    }
    return std::string{tag};
}

std::vector<std::string> filter_chain_for(std::string_view normalized_format) {
    if(normalized_format == "PNG") {
        return {ASCIIHEX_FILTER, FLATE_FILTER};
    }
    if(normalized_format != "JPEG") {
        get_logger()->debug("No filter chain for image format '{}', using JPEG's.",
                            normalized_format);
    }
    return {ASCIIHEX_FILTER, DCT_FILTER};
}

EmbeddedImage embed_image(std::span<const std::byte> raw_bytes, std::string_view format_tag) {
    EmbeddedImage result;
    result.normalized_format = normalize_image_format(format_tag);
    result.filter_chain = filter_chain_for(result.normalized_format);
    result.color_space = "DeviceRGB";
    result.hex_payload = hex_encode(raw_bytes);
    result.hex_payload += '>';
    result.byte_length = result.hex_payload.size();
    return result;
}

std::string image_dictionary(const EmbeddedImage &image, int32_t width, int32_t height) {
    std::vector<std::string> filters;
    for(const auto &f : image.filter_chain) {
        filters.push_back("/" + f);
    }
    PdfDict dict;
    dict.add("/Type", "/XObject");
    dict.add("/Subtype", "/Image");
    dict.add("/Width", width);
    dict.add("/Height", height);
    dict.add_name("/ColorSpace", image.color_space);
    dict.add("/BitsPerComponent", int32_t{8});
    dict.add_array("/Filter", filters);
    dict.add("/Length", image.byte_length);
    return dict.str();
}

ImageSize xobject_size(const ImageElement &image) {
    if(image.pixel_size) {
        return *image.pixel_size;
    }
    return ImageSize{box_to_pixels(image.w), box_to_pixels(image.h)};
}

} // namespace pagewright::internal
