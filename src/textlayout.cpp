// SPDX-License-Identifier: Apache-2.0
// Copyright 2025 Jussi Pakkanen

#include <textlayout.hpp>

#include <array>

namespace pagewright::internal {

namespace {

// Average advance of a Helvetica glyph at 12 points.
const double BASE_CHAR_WIDTH = 6.0;
const double BOLD_FACTOR = 1.10;
const double ITALIC_FACTOR = 1.08;
const double NARROW_FACTOR = 0.55;
const double WIDE_FACTOR = 1.45;

const double BODY_LINE_RATIO = 1.2;

const std::string_view NARROW_CHARS{"ijlrtfI1.,;:!|' "};
const std::string_view WIDE_CHARS{"mwMW@%"};

struct HeadingRatio {
    HeadingLevel level;
    double ratio;
};

const std::array<HeadingRatio, 3> heading_ratios{
    HeadingRatio{HeadingLevel::H1, 1.40},
    HeadingRatio{HeadingLevel::H2, 1.35},
    HeadingRatio{HeadingLevel::H3, 1.30},
};

double char_factor(char c) {
    if(NARROW_CHARS.find(c) != std::string_view::npos) {
        return NARROW_FACTOR;
    }
    if(WIDE_CHARS.find(c) != std::string_view::npos) {
        return WIDE_FACTOR;
    }
    return 1.0;
}

std::vector<std::string_view> split_words(std::string_view text) {
    std::vector<std::string_view> words;
    size_t i = 0;
    while(i < text.size()) {
        while(i < text.size() && (text[i] == ' ' || text[i] == '\t' || text[i] == '\n' ||
                                  text[i] == '\r')) {
            ++i;
        }
        const size_t start = i;
        while(i < text.size() && text[i] != ' ' && text[i] != '\t' && text[i] != '\n' &&
              text[i] != '\r') {
            ++i;
        }
        if(i > start) {
            words.push_back(text.substr(start, i - start));
        }
    }
    return words;
}

} // namespace

double TextLayoutEngine::estimate_width(std::string_view text, double font_size, FontStyle style) {
    double units = 0;
    for(const char c : text) {
        units += char_factor(c);
    }
    double w = units * BASE_CHAR_WIDTH * font_size / 12.0;
    if(is_bold(style)) {
        w *= BOLD_FACTOR;
    }
    if(is_italic(style)) {
        w *= ITALIC_FACTOR;
    }
    return w;
}

double TextLayoutEngine::line_height(double font_size, std::optional<HeadingLevel> heading) {
    if(heading) {
        for(const auto &h : heading_ratios) {
            if(h.level == *heading) {
                return font_size * h.ratio;
            }
        }
    }
    return font_size * BODY_LINE_RATIO;
}

LayoutResult TextLayoutEngine::layout(std::string_view text,
                                      std::optional<double> x,
                                      std::optional<double> y,
                                      const LayoutOptions &opts,
                                      std::optional<Cursor> cursor) const {
    LayoutResult result;
    const double lh = line_height(opts.font_size, opts.heading);
    const double start_x = x.value_or(PageGeometry::margin);
    double cur_y = y ? *y : (cursor ? cursor->y + lh : PageGeometry::margin);

    auto make_element = [&opts](std::string_view line, double lx, double ly) {
        TextElement e;
        e.text = std::string{line};
        e.x = lx;
        e.y = ly;
        e.font_size = opts.font_size;
        e.style = opts.style;
        e.family = opts.family;
        return e;
    };
    auto overflows = [lh](double line_y) { return line_y + lh > PageGeometry::bottom_limit(); };

    double first_budget = opts.max_width.value_or(0);
    if(opts.max_width && start_x > PageGeometry::margin) {
        first_budget -= start_x - PageGeometry::margin;
    }

    if(opts.heading || !opts.max_width ||
       estimate_width(text, opts.font_size, opts.style) <= first_budget) {
        auto e = make_element(text, start_x, cur_y);
        if(overflows(cur_y)) {
            e.page_break_needed = true;
            result.page_break_needed = true;
            result.remaining = std::string{text};
        }
        result.elements.push_back(std::move(e));
        return result;
    }

    const auto words = split_words(text);
    std::string line;
    double line_x = start_x;
    double budget = first_budget;

    // Returns false when the line did not fit on the page.
    auto flush = [&](size_t next_word) -> bool {
        if(overflows(cur_y)) {
            auto e = make_element(line, line_x, cur_y);
            e.page_break_needed = true;
            result.page_break_needed = true;
            result.remaining = line;
            for(size_t j = next_word; j < words.size(); ++j) {
                result.remaining += ' ';
                result.remaining += words[j];
            }
            result.elements.push_back(std::move(e));
            return false;
        }
        result.elements.push_back(make_element(line, line_x, cur_y));
        cur_y += lh;
        line_x = opts.wrap_x.value_or(start_x);
        budget = *opts.max_width;
        return true;
    };

    for(size_t i = 0; i < words.size(); ++i) {
        const auto &word = words[i];
        if(line.empty()) {
            line = word;
            continue;
        }
        std::string spaced{" "};
        spaced += word;
        if(estimate_width(line, opts.font_size, opts.style) +
               estimate_width(spaced, opts.font_size, opts.style) <=
           budget) {
            line += spaced;
        } else {
            if(!flush(i)) {
                return result;
            }
            line = word;
        }
    }
    if(!line.empty()) {
        flush(words.size());
    }
    return result;
}

} // namespace pagewright::internal
