// SPDX-License-Identifier: Apache-2.0
// Copyright 2025 Jussi Pakkanen

#pragma once

#include <errorhandling.hpp>
#include <pdfcommon.hpp>

#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace pagewright::internal {

enum class TableTheme : int32_t { Grid, Striped };

enum class HeaderPolicy : int32_t { EveryPage, FirstPageOnly, Never };

enum class TextAlign : int32_t { Left, Center, Right };

// Every field is optional so styles can be layered on top of each other.
struct CellStyle {
    std::optional<double> font_size;
    std::optional<bool> bold;
    std::optional<std::string> text_color;
    std::optional<std::string> fill_color;
    std::optional<TextAlign> align;
};

struct Column {
    std::string title;
    std::string key;
    std::optional<double> width;
    std::optional<CellStyle> style;
};

using TableRow = std::map<std::string, std::string>;

struct TableOptions {
    TableTheme theme = TableTheme::Grid;
    HeaderPolicy header = HeaderPolicy::EveryPage;
    std::optional<double> start_y;
    std::optional<double> margin;
    CellStyle header_style;
    CellStyle body_style;
    CellStyle alt_style;
};

// Where a table gets drawn. Implemented by the document.
class TableCanvas {
public:
    virtual ~TableCanvas() = default;

    virtual rvoe<NoReturnValue> draw_rect(const RectElement &rect) = 0;
    virtual rvoe<NoReturnValue> draw_text(const TextElement &text) = 0;
    virtual rvoe<NoReturnValue> start_new_page() = 0;
    // Y where a block placed after the current content would start.
    virtual double next_block_y() const = 0;
};

class TableRenderer {
public:
    static constexpr double row_height = 20;
    static constexpr double header_height = 24;
    static constexpr double cell_padding = 5;

    TableRenderer() = default;
    explicit TableRenderer(TableCanvas *canvas) : canvas{canvas} {}

    void bind(TableCanvas *new_canvas) { canvas = new_canvas; }

    // Returns the Y below the table, bottom margin included.
    rvoe<double> draw(const std::vector<Column> &columns,
                      const std::vector<TableRow> &rows,
                      const TableOptions &opts);

    static std::vector<double> column_widths(const std::vector<Column> &columns,
                                             double available);
    static std::string
    fit_cell_text(std::string_view text, double column_width, double font_size, FontStyle style);

private:
    struct Segment;

    rvoe<NoReturnValue> draw_header(const std::vector<Column> &columns,
                                    const std::vector<double> &widths,
                                    const TableOptions &opts,
                                    double left,
                                    double y);
    rvoe<NoReturnValue> draw_row(const std::vector<Column> &columns,
                                 const std::vector<double> &widths,
                                 const TableRow &row,
                                 const CellStyle &row_style,
                                 double left,
                                 double y);
    rvoe<NoReturnValue> draw_cell(std::string_view text,
                                  const CellStyle &style,
                                  double x,
                                  double y,
                                  double width,
                                  double height);
    rvoe<NoReturnValue> draw_grid(const Segment &seg,
                                  const std::vector<double> &widths,
                                  double left,
                                  double bottom);

    TableCanvas *canvas = nullptr;
};

} // namespace pagewright::internal
