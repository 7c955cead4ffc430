// SPDX-License-Identifier: Apache-2.0
// Copyright 2025 Jussi Pakkanen

#include <textlayout.hpp>
#include "testcheck.hpp"

#include <cmath>
#include <string>

using namespace pagewright::internal;

namespace {

const std::string PARAGRAPH{"The quick brown fox jumps over the lazy dog again and again today"};

bool near(double a, double b) { return std::abs(a - b) < 1e-6; }

LayoutOptions wrapping(double max_width) {
    LayoutOptions opts;
    opts.max_width = max_width;
    return opts;
}

int test_fitting_text_unchanged() {
    TextLayoutEngine engine(FontTable::standard());
    auto res = engine.layout("Hello world", 100, 200, wrapping(300), {});
    PW_CHECK(res.elements.size() == 1);
    PW_CHECK(res.elements[0].text == "Hello world");
    PW_CHECK(res.elements[0].x == 100);
    PW_CHECK(res.elements[0].y == 200);
    PW_CHECK(!res.page_break_needed);
    PW_CHECK(res.remaining.empty());

    LayoutOptions unbounded;
    res = engine.layout(PARAGRAPH + PARAGRAPH, 50, 60, unbounded, {});
    PW_CHECK(res.elements.size() == 1);
    PW_CHECK(res.elements[0].text == PARAGRAPH + PARAGRAPH);
    return 0;
}

int test_wrap_keeps_start_x() {
    TextLayoutEngine engine(FontTable::standard());
    auto res = engine.layout(PARAGRAPH, 50, 100, wrapping(150), {});
    PW_CHECK(res.elements.size() == 3);
    PW_CHECK(res.elements[0].text == "The quick brown fox jumps");
    PW_CHECK(res.elements[1].text == "over the lazy dog again and");
    PW_CHECK(res.elements[2].text == "again today");
    for(size_t i = 0; i < res.elements.size(); ++i) {
        PW_CHECK(res.elements[i].x == 50);
        PW_CHECK(near(res.elements[i].y, 100 + i * 14.4));
    }

    res = engine.layout(PARAGRAPH, 120, 100, wrapping(150), {});
    PW_CHECK(res.elements.size() > 1);
    for(const auto &e : res.elements) {
        PW_CHECK(e.x == 120);
    }
    return 0;
}

int test_wrap_target_x() {
    TextLayoutEngine engine(FontTable::standard());
    auto opts = wrapping(150);
    opts.wrap_x = 60;
    auto res = engine.layout(PARAGRAPH, 120, 100, opts, {});
    PW_CHECK(res.elements.size() > 1);
    PW_CHECK(res.elements[0].x == 120);
    for(size_t i = 1; i < res.elements.size(); ++i) {
        PW_CHECK(res.elements[i].x == 60);
    }
    return 0;
}

int test_first_line_budget() {
    TextLayoutEngine engine(FontTable::standard());
    // 200 points right of the margin leaves no room on the first line.
    auto res = engine.layout(PARAGRAPH, 250, 100, wrapping(150), {});
    PW_CHECK(res.elements.size() > 1);
    PW_CHECK(res.elements[0].text == "The");
    PW_CHECK(res.elements[1].text != "quick");
    return 0;
}

int test_long_word_own_line() {
    TextLayoutEngine engine(FontTable::standard());
    auto res = engine.layout("a extraordinarilylongword b", 50, 100, wrapping(50), {});
    PW_CHECK(res.elements.size() == 3);
    PW_CHECK(res.elements[0].text == "a");
    PW_CHECK(res.elements[1].text == "extraordinarilylongword");
    PW_CHECK(res.elements[2].text == "b");
    return 0;
}

int test_headings_not_wrapped() {
    TextLayoutEngine engine(FontTable::standard());
    LayoutOptions opts = wrapping(100);
    opts.heading = HeadingLevel::H1;
    opts.font_size = heading_size(HeadingLevel::H1);
    auto res = engine.layout(PARAGRAPH, 50, 100, opts, {});
    PW_CHECK(res.elements.size() == 1);
    PW_CHECK(res.elements[0].text == PARAGRAPH);

    res = engine.layout("Heading", 50, 780, opts, {});
    PW_CHECK(res.page_break_needed);
    PW_CHECK(res.elements.size() == 1);
    PW_CHECK(res.elements[0].page_break_needed);
    PW_CHECK(res.remaining == "Heading");
    return 0;
}

int test_large_body_text_wraps() {
    TextLayoutEngine engine(FontTable::standard());
    LayoutOptions opts = wrapping(200);
    opts.font_size = heading_size(HeadingLevel::H1);
    auto res = engine.layout(PARAGRAPH, 50, 100, opts, {});
    PW_CHECK(res.elements.size() > 1);
    PW_CHECK(near(res.elements[1].y - res.elements[0].y, 24 * 1.2));
    return 0;
}

int test_page_break() {
    TextLayoutEngine engine(FontTable::standard());
    auto res = engine.layout("Hello", 50, 780, LayoutOptions{}, {});
    PW_CHECK(res.page_break_needed);
    PW_CHECK(res.elements.size() == 1);
    PW_CHECK(res.elements[0].page_break_needed);
    PW_CHECK(res.remaining == "Hello");

    res = engine.layout(PARAGRAPH, 50, 760, wrapping(150), {});
    PW_CHECK(res.page_break_needed);
    PW_CHECK(res.elements.size() == 3);
    PW_CHECK(!res.elements[0].page_break_needed);
    PW_CHECK(!res.elements[1].page_break_needed);
    PW_CHECK(res.elements[2].page_break_needed);
    PW_CHECK(res.remaining == "again today");
    return 0;
}

int test_default_position() {
    TextLayoutEngine engine(FontTable::standard());
    auto res = engine.layout("Hello", {}, {}, LayoutOptions{}, {});
    PW_CHECK(res.elements[0].x == PageGeometry::margin);
    PW_CHECK(res.elements[0].y == PageGeometry::margin);

    res = engine.layout("Hello", {}, {}, LayoutOptions{}, Cursor{50, 100});
    PW_CHECK(near(res.elements[0].y, 114.4));
    return 0;
}

int test_width_estimate() {
    const auto n = FontStyle::Normal;
    PW_CHECK(TextLayoutEngine::estimate_width("aaa", 12, n) <
             TextLayoutEngine::estimate_width("aaaa", 12, n));
    PW_CHECK(TextLayoutEngine::estimate_width("iii", 12, n) <
             TextLayoutEngine::estimate_width("iiii", 12, n));
    PW_CHECK(TextLayoutEngine::estimate_width("Hello", 12, FontStyle::Bold) >
             TextLayoutEngine::estimate_width("Hello", 12, n));
    PW_CHECK(TextLayoutEngine::estimate_width("Hello", 12, FontStyle::BoldItalic) >
             TextLayoutEngine::estimate_width("Hello", 12, FontStyle::Bold));
    PW_CHECK(TextLayoutEngine::estimate_width("mwMW", 12, n) >
             TextLayoutEngine::estimate_width("ijlr", 12, n));
    PW_CHECK(near(TextLayoutEngine::estimate_width("ab", 12, n), 12.0));
    PW_CHECK(near(TextLayoutEngine::estimate_width("i", 12, n), 3.3));
    PW_CHECK(near(TextLayoutEngine::estimate_width("m", 12, n), 8.7));

    const double small = TextLayoutEngine::estimate_width(PARAGRAPH, 12, n);
    const double large = TextLayoutEngine::estimate_width(PARAGRAPH, 24, n);
    PW_CHECK(large > 1.8 * small);
    return 0;
}

int test_line_height() {
    PW_CHECK(near(TextLayoutEngine::line_height(12), 14.4));
    PW_CHECK(near(TextLayoutEngine::line_height(24, HeadingLevel::H1), 33.6));
    PW_CHECK(near(TextLayoutEngine::line_height(18, HeadingLevel::H2), 24.3));
    PW_CHECK(near(TextLayoutEngine::line_height(14, HeadingLevel::H3), 18.2));
    PW_CHECK(near(TextLayoutEngine::line_height(10), 12.0));
    PW_CHECK(near(TextLayoutEngine::line_height(24), 28.8));
    return 0;
}

int test_flip() {
    PW_CHECK(TextLayoutEngine::flip_y(0, 0) == PageGeometry::height);
    PW_CHECK(TextLayoutEngine::flip_y(PageGeometry::height, 0) == 0);
    PW_CHECK(near(TextLayoutEngine::flip_y(100, 12), PageGeometry::height - 112));
    return 0;
}

} // namespace

int main() {
    PW_RUN(test_fitting_text_unchanged);
    PW_RUN(test_wrap_keeps_start_x);
    PW_RUN(test_wrap_target_x);
    PW_RUN(test_first_line_budget);
    PW_RUN(test_long_word_own_line);
    PW_RUN(test_headings_not_wrapped);
    PW_RUN(test_large_body_text_wraps);
    PW_RUN(test_page_break);
    PW_RUN(test_default_position);
    PW_RUN(test_width_estimate);
    PW_RUN(test_line_height);
    PW_RUN(test_flip);
    return 0;
}
