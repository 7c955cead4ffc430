// SPDX-License-Identifier: Apache-2.0
// Copyright 2025 Jussi Pakkanen

#include <tablerenderer.hpp>
#include <utils.hpp>
#include "testcheck.hpp"

#include <algorithm>
#include <cmath>
#include <string>
#include <vector>

using namespace pagewright::internal;

namespace {

bool near(double a, double b) { return std::abs(a - b) < 1e-6; }

class RecordingCanvas : public TableCanvas {
public:
    rvoe<NoReturnValue> draw_rect(const RectElement &rect) override {
        rects.push_back(rect);
        RETOK;
    }
    rvoe<NoReturnValue> draw_text(const TextElement &text) override {
        texts.push_back(text);
        RETOK;
    }
    rvoe<NoReturnValue> start_new_page() override {
        ++new_pages;
        RETOK;
    }
    double next_block_y() const override { return block_y; }

    size_t count_text(std::string_view s) const {
        return std::count_if(
            texts.begin(), texts.end(), [s](const TextElement &e) { return e.text == s; });
    }

    std::vector<RectElement> rects;
    std::vector<TextElement> texts;
    int new_pages = 0;
    double block_y = 50;
};

std::vector<Column> two_columns() {
    std::vector<Column> cols(2);
    cols[0].title = "Name";
    cols[0].key = "name";
    cols[1].title = "Qty";
    cols[1].key = "qty";
    return cols;
}

std::vector<TableRow> make_rows(size_t n) {
    std::vector<TableRow> rows;
    for(size_t i = 0; i < n; ++i) {
        rows.push_back(TableRow{{"name", "item"}, {"qty", std::to_string(i)}});
    }
    return rows;
}

int test_errors() {
    TableRenderer unbound;
    auto rc = unbound.draw(two_columns(), make_rows(1), TableOptions{});
    PW_CHECK(!rc);
    PW_CHECK(rc.error() == ErrorCode::NoOutputTarget);

    RecordingCanvas canvas;
    TableRenderer renderer(&canvas);
    rc = renderer.draw({}, make_rows(1), TableOptions{});
    PW_CHECK(!rc);
    PW_CHECK(rc.error() == ErrorCode::NoColumns);
    PW_CHECK(canvas.rects.empty());
    PW_CHECK(canvas.texts.empty());
    return 0;
}

int test_column_widths() {
    std::vector<Column> cols(3);
    cols[0].width = 100;
    auto widths = TableRenderer::column_widths(cols, PageGeometry::printable_width());
    PW_CHECK(widths.size() == 3);
    PW_CHECK(widths[0] == 100);
    PW_CHECK(near(widths[1], 197.64));
    PW_CHECK(near(widths[2], 197.64));

    cols[1].width = 600;
    widths = TableRenderer::column_widths(cols, PageGeometry::printable_width());
    PW_CHECK(widths[2] == 0);

    widths = TableRenderer::column_widths(two_columns(), 300);
    PW_CHECK(widths[0] == 150);
    PW_CHECK(widths[1] == 150);
    return 0;
}

int test_fit_cell_text() {
    PW_CHECK(TableRenderer::fit_cell_text("short", 40, 10, FontStyle::Normal) == "short");
    PW_CHECK(TableRenderer::fit_cell_text("abcdefghij", 40, 10, FontStyle::Normal) == "abcd...");
    PW_CHECK(TableRenderer::fit_cell_text("abcdefghij", 5, 10, FontStyle::Normal) == "...");

    const std::string accented{"\xc3\xa9\xc3\xa9\xc3\xa9\xc3\xa9\xc3\xa9\xc3\xa9\xc3\xa9"};
    const auto cut = TableRenderer::fit_cell_text(accented, 40, 10, FontStyle::Normal);
    PW_CHECK(cut.ends_with("..."));
    PW_CHECK(cut.size() < accented.size());
    PW_CHECK(is_valid_utf8(cut));
    return 0;
}

int test_grid() {
    RecordingCanvas canvas;
    TableRenderer renderer(&canvas);
    TableOptions opts;
    opts.start_y = 100;
    auto rc = renderer.draw(two_columns(), make_rows(3), opts);
    PW_CHECK(rc);
    // 100 + 24 + 3 * 20, plus the margin.
    PW_CHECK(near(*rc, 234));
    PW_CHECK(canvas.new_pages == 0);
    PW_CHECK(canvas.texts.size() == 8);
    // Two header fills, outline, one column divider, three row dividers.
    PW_CHECK(canvas.rects.size() == 7);

    PW_CHECK(canvas.rects[0].mode == DrawMode::Fill);
    PW_CHECK(canvas.rects[0].fill_color == "E6E6E6");
    PW_CHECK(canvas.texts[0].text == "Name");
    PW_CHECK(canvas.texts[0].style == FontStyle::Bold);
    PW_CHECK(canvas.texts[0].font_size == 10);
    PW_CHECK(canvas.texts[0].x == 55);
    PW_CHECK(canvas.texts[0].y == 107);
    PW_CHECK(canvas.texts[2].text == "item");
    PW_CHECK(canvas.texts[2].style == FontStyle::Normal);
    PW_CHECK(canvas.texts[2].y == 129);

    const auto &outline = canvas.rects[2];
    PW_CHECK(outline.mode == DrawMode::Stroke);
    PW_CHECK(outline.stroke_width == 1.0);
    PW_CHECK(outline.x == 50);
    PW_CHECK(outline.y == 100);
    PW_CHECK(near(outline.w, PageGeometry::printable_width()));
    PW_CHECK(outline.h == 84);
    for(size_t i = 3; i < canvas.rects.size(); ++i) {
        PW_CHECK(canvas.rects[i].raw_operators);
        PW_CHECK(canvas.rects[i].raw_operators->find(" m\n") != std::string::npos);
    }
    return 0;
}

int test_striped() {
    RecordingCanvas canvas;
    TableRenderer renderer(&canvas);
    TableOptions opts;
    opts.theme = TableTheme::Striped;
    opts.start_y = 100;
    opts.header_style.fill_color = "FF0000";
    auto rc = renderer.draw(two_columns(), make_rows(2), opts);
    PW_CHECK(rc);
    PW_CHECK(near(*rc, 214));
    // Header fills and the second row's fills, no lines.
    PW_CHECK(canvas.rects.size() == 4);
    for(const auto &r : canvas.rects) {
        PW_CHECK(r.mode == DrawMode::Fill);
        PW_CHECK(!r.raw_operators);
    }
    PW_CHECK(canvas.rects[0].fill_color == "333333");
    PW_CHECK(canvas.texts[0].color == RgbColor(255, 255, 255));
    PW_CHECK(canvas.rects[2].fill_color == "F2F2F2");
    PW_CHECK(canvas.rects[2].y == 144);
    return 0;
}

int test_pagination() {
    RecordingCanvas canvas;
    TableRenderer renderer(&canvas);
    TableOptions opts;
    opts.start_y = 700;
    auto rc = renderer.draw(two_columns(), make_rows(10), opts);
    PW_CHECK(rc);
    PW_CHECK(canvas.new_pages == 1);
    PW_CHECK(canvas.count_text("Name") == 2);
    PW_CHECK(canvas.count_text("Qty") == 2);
    PW_CHECK(canvas.count_text("item") == 10);
    // Three rows fit below the header, seven go on the next page.
    PW_CHECK(near(*rc, 50 + 24 + 7 * 20 + 50));

    RecordingCanvas first_only;
    renderer.bind(&first_only);
    opts.header = HeaderPolicy::FirstPageOnly;
    rc = renderer.draw(two_columns(), make_rows(10), opts);
    PW_CHECK(rc);
    PW_CHECK(first_only.new_pages == 1);
    PW_CHECK(first_only.count_text("Name") == 1);
    PW_CHECK(near(*rc, 50 + 7 * 20 + 50));

    RecordingCanvas never;
    renderer.bind(&never);
    opts.header = HeaderPolicy::Never;
    rc = renderer.draw(two_columns(), make_rows(10), opts);
    PW_CHECK(rc);
    PW_CHECK(never.new_pages == 1);
    PW_CHECK(never.count_text("Name") == 0);
    PW_CHECK(near(*rc, 220));
    return 0;
}

int test_header_does_not_fit() {
    RecordingCanvas canvas;
    canvas.block_y = 780;
    TableRenderer renderer(&canvas);
    auto rc = renderer.draw(two_columns(), make_rows(1), TableOptions{});
    PW_CHECK(rc);
    PW_CHECK(canvas.new_pages == 1);
    PW_CHECK(canvas.texts[0].text == "Name");
    PW_CHECK(canvas.texts[0].y == 57);
    PW_CHECK(near(*rc, 50 + 24 + 20 + 50));
    return 0;
}

int test_header_kept_with_first_row() {
    // 760 leaves room for the header but not for a row below it.
    RecordingCanvas canvas;
    TableRenderer renderer(&canvas);
    TableOptions opts;
    opts.start_y = 760;
    opts.header = HeaderPolicy::FirstPageOnly;
    auto rc = renderer.draw(two_columns(), make_rows(2), opts);
    PW_CHECK(rc);
    PW_CHECK(canvas.new_pages == 1);
    PW_CHECK(canvas.count_text("Name") == 1);
    PW_CHECK(canvas.texts[0].text == "Name");
    PW_CHECK(near(canvas.texts[0].y, 57));
    PW_CHECK(canvas.texts[2].text == "item");
    PW_CHECK(near(canvas.texts[2].y, 79));
    PW_CHECK(near(*rc, 50 + 24 + 2 * 20 + 50));

    RecordingCanvas header_only;
    renderer.bind(&header_only);
    rc = renderer.draw(two_columns(), {}, opts);
    PW_CHECK(rc);
    PW_CHECK(header_only.new_pages == 0);
    PW_CHECK(near(header_only.texts[0].y, 767));
    return 0;
}

int test_alignment_and_missing_keys() {
    RecordingCanvas canvas;
    TableRenderer renderer(&canvas);
    auto cols = two_columns();
    cols[0].width = 200;
    cols[0].style = CellStyle{};
    cols[0].style->align = TextAlign::Right;
    cols[1].width = 200;
    cols[1].style = CellStyle{};
    cols[1].style->align = TextAlign::Center;
    TableOptions opts;
    opts.header = HeaderPolicy::Never;
    opts.start_y = 100;
    std::vector<TableRow> rows{TableRow{{"name", "abc"}, {"qty", "abc"}}, TableRow{{"qty", "x"}}};
    auto rc = renderer.draw(cols, rows, opts);
    PW_CHECK(rc);
    PW_CHECK(canvas.texts.size() == 3);
    // "abc" is 15 points wide at size 10.
    PW_CHECK(near(canvas.texts[0].x, 50 + 200 - 5 - 15));
    PW_CHECK(near(canvas.texts[1].x, 250 + 5 + (190 - 15) / 2.0));
    PW_CHECK(canvas.texts[2].text == "x");
    return 0;
}

} // namespace

int main() {
    PW_RUN(test_errors);
    PW_RUN(test_column_widths);
    PW_RUN(test_fit_cell_text);
    PW_RUN(test_grid);
    PW_RUN(test_striped);
    PW_RUN(test_pagination);
    PW_RUN(test_header_does_not_fit);
    PW_RUN(test_header_kept_with_first_row);
    PW_RUN(test_alignment_and_missing_keys);
    return 0;
}
