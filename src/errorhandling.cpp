// SPDX-License-Identifier: Apache-2.0
// Copyright 2024-2025 Jussi Pakkanen

#include <errorhandling.hpp>
#include <array>

namespace pagewright::internal {

// clang-format off

const std::array<const char *, (std::size_t)ErrorCode::NumErrors> error_texts{
"No error.",
"Table has no columns.",
"Table has no output target bound.",
"There can be only one call to the finalize function.",
"Document has already been finalized.",
"No pages defined.",
"Bad ID number.",
"Could not open file.",
"Failed to load data from file.",
"Writing to file failed.",
"File does not exist.",
"Compression failure.",
"Unsupported file format.",
"Invalid image size.",
"Image has no data.",
"Draw state end mismatch.",
"Invalid UTF-8 string.",
"Heading level must be 1, 2 or 3.",
};

// clang-format on

const char *error_text(ErrorCode ec) noexcept {
    const int index = (int32_t)ec;
    if(index < 0 || (std::size_t)index >= error_texts.size()) {
        return "Invalid error code.";
    }
    return error_texts[index];
}

} // namespace pagewright::internal
