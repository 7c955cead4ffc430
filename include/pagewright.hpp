// SPDX-License-Identifier: Apache-2.0
// Copyright 2024-2025 Jussi Pakkanen

#pragma once

// The functionality in this header is neither ABI nor API stable.

#include <document.hpp>
#include <outputsink.hpp>

#include <cstddef>
#include <cstdio>
#include <cstdlib>
#include <filesystem>
#include <optional>
#include <span>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#if defined(__cpp_exceptions)
#define PAGEWRIGHT_ERROR_HAPPENED(error_string) throw PdfException(error_string)
#else
#define PAGEWRIGHT_ERROR_HAPPENED(error_string)                                                    \
    fprintf(stderr, "Pagewright error: %s\n", error_string);                                       \
    std::abort()
#endif

namespace pagewright {

class PdfException : public std::runtime_error {
public:
    PdfException(const char *msg) : std::runtime_error(msg) {}
};

using internal::CellStyle;
using internal::Column;
using internal::DocumentMetadata;
using internal::DocumentOptions;
using internal::DrawMode;
using internal::FileSink;
using internal::FontFamily;
using internal::FontStyle;
using internal::HeaderPolicy;
using internal::ImageBox;
using internal::MemorySink;
using internal::OutputSink;
using internal::RectElement;
using internal::TableOptions;
using internal::TableRow;
using internal::TableTheme;
using internal::TextAlign;
using internal::TextOptions;

namespace detail {

template<typename T> T unwrap(internal::rvoe<T> &&rc) {
    if(!rc) {
        PAGEWRIGHT_ERROR_HAPPENED(internal::error_text(rc.error()));
    }
    return std::move(rc.value());
}

inline void unwrap(internal::rvoe<internal::NoReturnValue> &&rc) {
    if(!rc) {
        PAGEWRIGHT_ERROR_HAPPENED(internal::error_text(rc.error()));
    }
}

// Runs one internal call. Failures are reported as PdfException in both
// error handling modes.
template<typename Func> auto check(Func &&f) {
#if defined(PAGEWRIGHT_USE_EXCEPTIONS)
    try {
        return unwrap(f());
    } catch(internal::ErrorCode ec) {
        throw PdfException(internal::error_text(ec));
    }
#else
    return unwrap(f());
#endif
}

} // namespace detail

class Document {
public:
    explicit Document(DocumentOptions opts = {}) : d{std::move(opts)} {}

    void add_text(std::string_view text, const TextOptions &opts = {}) {
        detail::check([&] { return d.add_text(text, opts); });
    }

    void add_heading(std::string_view text, int32_t level, const TextOptions &opts = {}) {
        detail::check([&] { return d.add_heading(text, level, opts); });
    }

    std::string
    add_image(std::span<const std::byte> bytes, std::string_view format, const ImageBox &box) {
        return detail::check([&] { return d.add_image(bytes, format, box); });
    }

    std::string add_image_file(const std::filesystem::path &fname,
                               std::optional<ImageBox> box = {}) {
        return detail::check([&] { return d.add_image_file(fname, box); });
    }

    void add_rect(const RectElement &rect) { detail::check([&] { return d.add_rect(rect); }); }

    double draw_table(const std::vector<Column> &columns,
                      const std::vector<TableRow> &rows,
                      const TableOptions &opts = {}) {
        return detail::check([&] { return d.draw_table(columns, rows, opts); });
    }

    double cursor_y() const { return d.cursor_y(); }
    void set_cursor_y(double y) { d.set_cursor_y(y); }

    void new_page() { detail::check([&] { return d.new_page(); }); }
    int32_t num_pages() const { return d.num_pages(); }

    std::string serialize() const { return detail::check([&] { return d.serialize(); }); }
    std::string finalize(OutputSink &sink) {
        return detail::check([&] { return d.finalize(sink); });
    }

private:
    internal::Document d;
};

} // namespace pagewright
