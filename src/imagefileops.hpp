// SPDX-License-Identifier: Apache-2.0
// Copyright 2022-2025 Jussi Pakkanen

#pragma once

#include <pdfcommon.hpp>
#include <errorhandling.hpp>

#include <cstddef>
#include <filesystem>
#include <span>
#include <string>
#include <vector>

namespace pagewright::internal {

// An image ready for embedding. JPEG files keep their original bytes,
// PNG files are decoded to 8 bit RGB and deflated.
struct LoadedImage {
    std::string format;
    std::vector<std::byte> payload;
    ImageSize size;
    bool grayscale = false;
};

rvoe<LoadedImage> load_image_file(const std::filesystem::path &fname);
rvoe<LoadedImage> load_image_from_memory(std::span<const std::byte> buf);

} // namespace pagewright::internal
