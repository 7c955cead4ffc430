// SPDX-License-Identifier: Apache-2.0
// Copyright 2024-2025 Jussi Pakkanen

#include <pagewright.hpp>
#include <utils.hpp>
#include "testcheck.hpp"

#include <filesystem>
#include <string>
#include <vector>

namespace {

int test_public_api() {
    pagewright::DocumentOptions opts;
    opts.metadata.title = "Public API";
    opts.metadata.creator = "cpptest";
    pagewright::Document doc(opts);
    doc.add_heading("Summary", 2);
    pagewright::TextOptions body;
    body.max_width = 200;
    doc.add_text("Short paragraph of text that wraps onto a second line.", body);

    std::vector<pagewright::Column> cols(1);
    cols[0].title = "Item";
    cols[0].key = "item";
    const double end_y = doc.draw_table(cols, {pagewright::TableRow{{"item", "widget"}}});
    PW_CHECK(end_y > 50);
    PW_CHECK(doc.cursor_y() == end_y);
    PW_CHECK(doc.num_pages() == 1);

    const auto pdf = doc.serialize();
    PW_CHECK(pdf.starts_with("%PDF-1.4\n"));
    PW_CHECK(pdf.find("/Title (Public API)") != std::string::npos);

    pagewright::MemorySink sink;
    PW_CHECK(doc.finalize(sink) == "memory:0");
    return 0;
}

int test_exceptions() {
    pagewright::Document doc;
    bool thrown = false;
    try {
        doc.add_heading("Nope", 7);
    } catch(const pagewright::PdfException &e) {
        thrown = true;
        PW_CHECK(std::string{e.what()} ==
                 pagewright::internal::error_text(
                     pagewright::internal::ErrorCode::InvalidHeadingLevel));
    }
    PW_CHECK(thrown);

    pagewright::MemorySink sink;
    doc.finalize(sink);
    thrown = false;
    try {
        doc.add_text("late");
    } catch(const pagewright::PdfException &) {
        thrown = true;
    }
    PW_CHECK(thrown);
    return 0;
}

int test_file_sink() {
    const auto fname = std::filesystem::temp_directory_path() / "pagewright_cpptest.pdf";
    std::filesystem::remove(fname);
    pagewright::Document doc;
    doc.add_text("Written to disk");
    pagewright::FileSink sink(fname);
    PW_CHECK(doc.finalize(sink) == fname.string());

    auto contents = pagewright::internal::load_file_as_string(fname);
    std::filesystem::remove(fname);
    PW_CHECK(contents);
    PW_CHECK(contents->starts_with("%PDF-1.4\n"));
    PW_CHECK(contents->ends_with("%%EOF\n"));
    PW_CHECK(!std::filesystem::exists(fname.string() + "~"));

    pagewright::Document unwritable;
    unwritable.add_text("Nowhere");
    pagewright::FileSink bad_sink("/nonexistent directory/out.pdf");
    bool thrown = false;
    try {
        unwritable.finalize(bad_sink);
    } catch(const pagewright::PdfException &) {
        thrown = true;
    }
    PW_CHECK(thrown);
    return 0;
}

} // namespace

int main() {
    PW_RUN(test_public_api);
    PW_RUN(test_exceptions);
    PW_RUN(test_file_sink);
    return 0;
}
