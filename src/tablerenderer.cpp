// SPDX-License-Identifier: Apache-2.0
// Copyright 2025 Jussi Pakkanen

#include <tablerenderer.hpp>
#include <logging.hpp>
#include <textlayout.hpp>

#include <fmt/core.h>

#include <algorithm>
#include <cmath>
#include <numeric>

namespace pagewright::internal {

namespace {

const std::string_view ELLIPSIS{"..."};

const double DEFAULT_CELL_FONT_SIZE = 10;
const double GRID_LINE_WIDTH = 0.5;
const double OUTLINE_WIDTH = 1.0;

const char *STRIPED_HEADER_FILL = "333333";
const char *STRIPED_HEADER_TEXT = "FFFFFF";
const char *DEFAULT_GRID_HEADER_FILL = "E6E6E6";
const char *DEFAULT_STRIPE_FILL = "F2F2F2";

CellStyle layered(const CellStyle &base, const CellStyle &over) {
    CellStyle s = base;
    if(over.font_size) {
        s.font_size = over.font_size;
    }
    if(over.bold) {
        s.bold = over.bold;
    }
    if(over.text_color) {
        s.text_color = over.text_color;
    }
    if(over.fill_color) {
        s.fill_color = over.fill_color;
    }
    if(over.align) {
        s.align = over.align;
    }
    return s;
}

CellStyle layered(const CellStyle &base, const std::optional<CellStyle> &over) {
    return over ? layered(base, *over) : base;
}

// A straight line in top-left coordinates, drawn with the raw operator override.
RectElement line_element(double x1, double y1, double x2, double y2) {
    RectElement r;
    r.x = std::min(x1, x2);
    r.y = std::min(y1, y2);
    r.w = std::abs(x2 - x1);
    r.h = std::abs(y2 - y1);
    r.raw_operators = fmt::format("q\n{:f} w\n0.000 0.000 0.000 RG\n{:f} {:f} m\n{:f} {:f} l\nS\nQ\n",
                                  GRID_LINE_WIDTH,
                                  x1,
                                  PageGeometry::height - y1,
                                  x2,
                                  PageGeometry::height - y2);
    return r;
}

// Backs up over UTF-8 continuation bytes so a cut never splits a character.
size_t char_boundary(std::string_view text, size_t pos) {
    while(pos > 0 && pos < text.size() && ((unsigned char)text[pos] & 0xC0) == 0x80) {
        --pos;
    }
    return pos;
}

} // namespace

struct TableRenderer::Segment {
    double top;
    // Y of every horizontal boundary inside the segment.
    std::vector<double> row_lines;
};

std::vector<double> TableRenderer::column_widths(const std::vector<Column> &columns,
                                                 double available) {
    double fixed_total = 0;
    size_t num_flexible = 0;
    for(const auto &c : columns) {
        if(c.width) {
            fixed_total += *c.width;
        } else {
            ++num_flexible;
        }
    }
    const double flexible_width =
        num_flexible > 0 ? std::max(0.0, (available - fixed_total) / num_flexible) : 0.0;
    std::vector<double> widths;
    widths.reserve(columns.size());
    for(const auto &c : columns) {
        widths.push_back(c.width.value_or(flexible_width));
    }
    return widths;
}

std::string TableRenderer::fit_cell_text(std::string_view text,
                                         double column_width,
                                         double font_size,
                                         FontStyle style) {
    const double interior = column_width - 2 * cell_padding;
    if(TextLayoutEngine::estimate_width(text, font_size, style) <= interior) {
        return std::string{text};
    }
    size_t cut = text.size();
    while(cut > 0) {
        cut = char_boundary(text, cut - 1);
        std::string candidate{text.substr(0, cut)};
        while(!candidate.empty() && candidate.back() == ' ') {
            candidate.pop_back();
        }
        candidate += ELLIPSIS;
        if(TextLayoutEngine::estimate_width(candidate, font_size, style) <= interior) {
            return candidate;
        }
    }
    return std::string{ELLIPSIS};
}

rvoe<NoReturnValue> TableRenderer::draw_cell(std::string_view text,
                                             const CellStyle &style,
                                             double x,
                                             double y,
                                             double width,
                                             double height) {
    const double font_size = style.font_size.value_or(DEFAULT_CELL_FONT_SIZE);
    const FontStyle fstyle = style.bold.value_or(false) ? FontStyle::Bold : FontStyle::Normal;
    if(style.fill_color) {
        RectElement fill;
        fill.x = x;
        fill.y = y;
        fill.w = width;
        fill.h = height;
        fill.mode = DrawMode::Fill;
        fill.fill_color = style.fill_color;
        ERCV(canvas->draw_rect(fill));
    }
    if(text.empty()) {
        RETOK;
    }
    TextElement e;
    e.text = fit_cell_text(text, width, font_size, fstyle);
    const double text_width = TextLayoutEngine::estimate_width(e.text, font_size, fstyle);
    switch(style.align.value_or(TextAlign::Left)) {
    case TextAlign::Left:
        e.x = x + cell_padding;
        break;
    case TextAlign::Center:
        e.x = x + cell_padding + (width - 2 * cell_padding - text_width) / 2;
        break;
    case TextAlign::Right:
        e.x = x + width - cell_padding - text_width;
        break;
    }
    e.y = y + (height - font_size) / 2;
    e.font_size = font_size;
    e.style = fstyle;
    e.color = RgbColor::from_hex(style.text_color);
    return canvas->draw_text(e);
}

rvoe<NoReturnValue> TableRenderer::draw_header(const std::vector<Column> &columns,
                                               const std::vector<double> &widths,
                                               const TableOptions &opts,
                                               double left,
                                               double y) {
    CellStyle base;
    base.bold = true;
    if(opts.theme == TableTheme::Grid) {
        base.fill_color = DEFAULT_GRID_HEADER_FILL;
    }
    base = layered(base, opts.header_style);
    if(opts.theme == TableTheme::Striped) {
        base.fill_color = STRIPED_HEADER_FILL;
        base.text_color = STRIPED_HEADER_TEXT;
    }
    double x = left;
    for(size_t i = 0; i < columns.size(); ++i) {
        CellStyle s = base;
        if(columns[i].style && columns[i].style->align) {
            s.align = columns[i].style->align;
        }
        ERCV(draw_cell(columns[i].title, s, x, y, widths[i], header_height));
        x += widths[i];
    }
    RETOK;
}

rvoe<NoReturnValue> TableRenderer::draw_row(const std::vector<Column> &columns,
                                            const std::vector<double> &widths,
                                            const TableRow &row,
                                            const CellStyle &row_style,
                                            double left,
                                            double y) {
    double x = left;
    for(size_t i = 0; i < columns.size(); ++i) {
        const auto it = row.find(columns[i].key);
        const std::string_view text = it == row.end() ? std::string_view{} : it->second;
        ERCV(draw_cell(text, layered(row_style, columns[i].style), x, y, widths[i], row_height));
        x += widths[i];
    }
    RETOK;
}

rvoe<NoReturnValue> TableRenderer::draw_grid(const Segment &seg,
                                             const std::vector<double> &widths,
                                             double left,
                                             double bottom) {
    if(bottom <= seg.top) {
        RETOK;
    }
    const double total = std::accumulate(widths.begin(), widths.end(), 0.0);
    RectElement outline;
    outline.x = left;
    outline.y = seg.top;
    outline.w = total;
    outline.h = bottom - seg.top;
    outline.mode = DrawMode::Stroke;
    outline.stroke_color = "000000";
    outline.stroke_width = OUTLINE_WIDTH;
    ERCV(canvas->draw_rect(outline));
    double x = left;
    for(size_t i = 0; i + 1 < widths.size(); ++i) {
        x += widths[i];
        ERCV(canvas->draw_rect(line_element(x, seg.top, x, bottom)));
    }
    for(const auto line_y : seg.row_lines) {
        if(line_y > seg.top && line_y < bottom) {
            ERCV(canvas->draw_rect(line_element(left, line_y, left + total, line_y)));
        }
    }
    RETOK;
}

rvoe<double> TableRenderer::draw(const std::vector<Column> &columns,
                                 const std::vector<TableRow> &rows,
                                 const TableOptions &opts) {
    if(!canvas) {
        get_logger()->error("Table drawn without an output target.");
        RETERR(NoOutputTarget);
    }
    if(columns.empty()) {
        get_logger()->error("Table has no columns.");
        RETERR(NoColumns);
    }
    if(!opts.margin) {
        get_logger()->debug("No table margin given, using {}.", PageGeometry::margin);
    }
    const double margin = opts.margin.value_or(PageGeometry::margin);
    const double left = margin;
    const auto widths = column_widths(columns, PageGeometry::width - 2 * margin);
    const double limit = PageGeometry::bottom_limit();

    CellStyle body_style = opts.body_style;
    CellStyle alt_style = layered(body_style, opts.alt_style);
    if(opts.theme == TableTheme::Striped && !alt_style.fill_color) {
        alt_style.fill_color = DEFAULT_STRIPE_FILL;
    }

    double y = opts.start_y.value_or(canvas->next_block_y());
    const bool has_header = opts.header != HeaderPolicy::Never;
    // The header must not be left alone at the bottom of a page.
    const double first_block = header_height + (rows.empty() ? 0 : row_height);
    if(has_header && y + first_block > limit) {
        ERCV(canvas->start_new_page());
        y = PageGeometry::margin;
    }

    Segment seg{y, {}};
    if(has_header) {
        ERCV(draw_header(columns, widths, opts, left, y));
        y += header_height;
        seg.row_lines.push_back(y);
    }
    for(size_t i = 0; i < rows.size(); ++i) {
        if(y + row_height > limit) {
            if(opts.theme == TableTheme::Grid) {
                ERCV(draw_grid(seg, widths, left, y));
            }
            ERCV(canvas->start_new_page());
            y = PageGeometry::margin;
            seg = Segment{y, {}};
            if(opts.header == HeaderPolicy::EveryPage) {
                ERCV(draw_header(columns, widths, opts, left, y));
                y += header_height;
                seg.row_lines.push_back(y);
            }
        }
        const auto &style = (i % 2 == 1) ? alt_style : body_style;
        ERCV(draw_row(columns, widths, rows[i], style, left, y));
        y += row_height;
        seg.row_lines.push_back(y);
    }
    if(opts.theme == TableTheme::Grid) {
        ERCV(draw_grid(seg, widths, left, y));
    }
    return y + margin;
}

} // namespace pagewright::internal
