// SPDX-License-Identifier: Apache-2.0
// Copyright 2024-2025 Jussi Pakkanen

#include <pdfdict.hpp>

#include <fmt/core.h>

#include <iterator>

namespace pagewright::internal {

std::string object_ref(int32_t object_number) { return fmt::format("{} 0 R", object_number); }

void PdfDict::add(std::string_view key, std::string_view value) {
    lines.push_back(fmt::format("{} {}", key, value));
}

void PdfDict::add(std::string_view key, int32_t value) {
    lines.push_back(fmt::format("{} {}", key, value));
}

void PdfDict::add(std::string_view key, size_t value) {
    lines.push_back(fmt::format("{} {}", key, value));
}

void PdfDict::add(std::string_view key, double value) {
    lines.push_back(fmt::format("{} {:f}", key, value));
}

void PdfDict::add_name(std::string_view key, std::string_view name) {
    lines.push_back(fmt::format("{} /{}", key, name));
}

void PdfDict::add_ref(std::string_view key, int32_t object_number) {
    lines.push_back(fmt::format("{} {} 0 R", key, object_number));
}

void PdfDict::add_string(std::string_view key, std::string_view quoted) {
    lines.push_back(fmt::format("{} ({})", key, quoted));
}

void PdfDict::add_array(std::string_view key, const std::vector<std::string> &items) {
    std::string line{key};
    line += " [";
    for(const auto &i : items) {
        line += ' ';
        line += i;
    }
    line += " ]";
    lines.push_back(std::move(line));
}

void PdfDict::add_dict(std::string_view key, const PdfDict &sub) {
    lines.push_back(fmt::format("{} <<", key));
    for(const auto &l : sub.lines) {
        lines.push_back("  " + l);
    }
    lines.push_back(">>");
}

std::string PdfDict::str() const {
    std::string out{"<<\n"};
    auto app = std::back_inserter(out);
    for(const auto &l : lines) {
        fmt::format_to(app, "  {}\n", l);
    }
    out += ">>\n";
    return out;
}

} // namespace pagewright::internal
