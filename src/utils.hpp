// SPDX-License-Identifier: Apache-2.0
// Copyright 2022-2025 Jussi Pakkanen

#pragma once

#include <errorhandling.hpp>

#include <cstddef>
#include <cstdio>
#include <filesystem>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace pagewright::internal {

template<class... Ts> struct overloaded : Ts... {
    using Ts::operator()...;
};

rvoe<std::string> flate_compress(std::string_view data);

rvoe<std::vector<std::byte>> load_file_as_bytes(const std::filesystem::path &fname);
rvoe<std::vector<std::byte>> load_file_as_bytes(FILE *f);

rvoe<std::string> load_file_as_string(const std::filesystem::path &fname);

bool is_valid_utf8(std::string_view input);

// Converts UTF-8 to the single byte encoding used with the builtin fonts.
// Characters outside of Latin-1 become question marks.
std::string utf8_to_winansi(std::string_view input);

// Produces the contents of a literal string, without the parentheses.
std::string pdfstring_quote(std::string_view raw_string);

std::string pdfname_quote(std::string_view raw_string);

// Uppercase, two characters per byte.
std::string hex_encode(std::span<const std::byte> data);

std::string current_date_string();

std::string_view span2sv(std::span<const std::byte> s);
std::span<const std::byte> str2span(std::string_view s);

struct FileCloser {
    void operator()(FILE *f) const {
        if(f) {
            fclose(f);
        }
    }
};

} // namespace pagewright::internal
