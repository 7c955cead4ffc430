// SPDX-License-Identifier: Apache-2.0
// Copyright 2025 Jussi Pakkanen

#include <pagewright.hpp>
#include <utils.hpp>

#include <cstdio>
#include <cstring>
#include <string>
#include <string_view>
#include <vector>

namespace {

// Splits one CSV record. Double quoted fields may contain commas and
// doubled quotes.
std::vector<std::string> split_record(std::string_view line) {
    std::vector<std::string> fields;
    std::string current;
    bool quoted = false;
    for(size_t i = 0; i < line.size(); ++i) {
        const char c = line[i];
        if(quoted) {
            if(c == '"') {
                if(i + 1 < line.size() && line[i + 1] == '"') {
                    current += '"';
                    ++i;
                } else {
                    quoted = false;
                }
            } else {
                current += c;
            }
        } else if(c == '"') {
            quoted = true;
        } else if(c == ',') {
            fields.push_back(std::move(current));
            current.clear();
        } else {
            current += c;
        }
    }
    fields.push_back(std::move(current));
    return fields;
}

std::vector<std::vector<std::string>> parse_csv(std::string_view text) {
    std::vector<std::vector<std::string>> records;
    while(!text.empty()) {
        const auto eol = text.find('\n');
        std::string_view line = text.substr(0, eol);
        text = eol == std::string_view::npos ? std::string_view{} : text.substr(eol + 1);
        if(!line.empty() && line.back() == '\r') {
            line.remove_suffix(1);
        }
        if(line.empty()) {
            continue;
        }
        records.push_back(split_record(line));
    }
    return records;
}

} // namespace

int main(int argc, char **argv) {
    if(argc != 3 && argc != 4) {
        printf("%s <input csv file> <pdf output> [grid|striped]\n", argv[0]);
        return 1;
    }
    pagewright::TableOptions topts;
    if(argc == 4) {
        if(strcmp(argv[3], "striped") == 0) {
            topts.theme = pagewright::TableTheme::Striped;
        } else if(strcmp(argv[3], "grid") != 0) {
            fprintf(stderr, "Unknown theme %s.\n", argv[3]);
            return 1;
        }
    }
    auto contents = pagewright::internal::load_file_as_string(argv[1]);
    if(!contents) {
        fprintf(stderr,
                "Could not read %s: %s\n",
                argv[1],
                pagewright::internal::error_text(contents.error()));
        return 1;
    }
    const auto records = parse_csv(*contents);
    if(records.empty()) {
        fprintf(stderr, "%s has no header line.\n", argv[1]);
        return 1;
    }

    std::vector<pagewright::Column> columns;
    for(const auto &title : records.front()) {
        pagewright::Column c;
        c.title = title;
        c.key = title;
        columns.push_back(std::move(c));
    }
    std::vector<pagewright::TableRow> rows;
    for(size_t i = 1; i < records.size(); ++i) {
        pagewright::TableRow row;
        for(size_t j = 0; j < records[i].size() && j < columns.size(); ++j) {
            row[columns[j].key] = records[i][j];
        }
        rows.push_back(std::move(row));
    }

    pagewright::DocumentOptions dopts;
    dopts.metadata.title = argv[1];
    dopts.metadata.creator = "csv2pdf";
    try {
        pagewright::Document doc(dopts);
        doc.draw_table(columns, rows, topts);
        pagewright::FileSink sink(argv[2]);
        doc.finalize(sink);
    } catch(const pagewright::PdfException &e) {
        fprintf(stderr, "%s\n", e.what());
        return 1;
    }
    return 0;
}
