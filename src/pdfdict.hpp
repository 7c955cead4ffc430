// SPDX-License-Identifier: Apache-2.0
// Copyright 2024-2025 Jussi Pakkanen

#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace pagewright::internal {

// A PDF dictionary with one "/Key value" entry per line. Nested
// dictionaries are indented two spaces per level and arrays are
// written on a single line.
class PdfDict {
public:
    void add(std::string_view key, std::string_view value);
    void add(std::string_view key, const char *value) { add(key, std::string_view{value}); }
    void add(std::string_view key, int32_t value);
    void add(std::string_view key, size_t value);
    void add(std::string_view key, double value);

    void add_name(std::string_view key, std::string_view name);
    void add_ref(std::string_view key, int32_t object_number);
    // The string must already be quoted.
    void add_string(std::string_view key, std::string_view quoted);
    void add_array(std::string_view key, const std::vector<std::string> &items);
    void add_dict(std::string_view key, const PdfDict &sub);

    bool empty() const { return lines.empty(); }
    std::string str() const;

private:
    std::vector<std::string> lines;
};

std::string object_ref(int32_t object_number);

} // namespace pagewright::internal
