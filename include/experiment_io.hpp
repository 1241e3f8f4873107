#pragma once
#include "types.hpp"
#include <filesystem>
#include <fstream>
#include <json/json.h>
#include <stdexcept>
#include <string>
#include <vector>

namespace PrimeLab {

struct RunPaths {
    std::filesystem::path root;
    std::filesystem::path data_dir;
    std::filesystem::path report_path;
    std::filesystem::path params_path;
};

// Creates DIR and DIR/data
RunPaths prepare_out_dir(const std::filesystem::path &out_dir);

// Sorted keys, 2-space indent, trailing newline
std::string json_to_string(const Json::Value &value);
void write_json(const std::filesystem::path &path, const Json::Value &value);
void write_text(const std::filesystem::path &path, const std::string &text);

// One CSV series; values are written as they are passed to row()
class CsvWriter {
public:
    CsvWriter(const std::filesystem::path &path, const std::vector<std::string> &header);

    template <typename... Cols>
    void row(const Cols &...cols) {
        if (sizeof...(cols) != columns_) {
            throw std::invalid_argument("CsvWriter::row(): expected " + std::to_string(columns_) + " columns");
        }
        std::string line;
        append_cells(line, cols...);
        out_ << line << '\n';
        ++rows_;
    }

    // Variable-width row of already formatted cells
    void row_cells(const std::vector<std::string> &cells);

    size_t rows() const { return rows_; }
    const std::filesystem::path &path() const { return path_; }

private:
    std::filesystem::path path_;
    std::ofstream out_;
    size_t columns_;
    size_t rows_ = 0;

    static std::string cell(i64 v);
    static std::string cell(int v);
    static std::string cell(u64 v);
    static std::string cell(unsigned v);
    static std::string cell(long v);
    static std::string cell(unsigned long v);
    static std::string cell(double v);
    static std::string cell(const cpp_int &v);
    static std::string cell(const std::string &v);
    static std::string cell(const char *v) { return cell(std::string(v)); }

    static void append_cells(std::string &) {}
    template <typename T, typename... Rest>
    static void append_cells(std::string &line, const T &first, const Rest &...rest) {
        if (!line.empty()) line += ',';
        line += cell(first);
        append_cells(line, rest...);
    }
};

// Markdown report in the house layout: title, reproduce block, sections
class ReportBuilder {
public:
    ReportBuilder(const std::string &id, const std::string &title, const std::string &reproduce);

    ReportBuilder &line(const std::string &text = "");
    ReportBuilder &section(const std::string &heading);
    ReportBuilder &param(const std::string &key, const std::string &value);
    ReportBuilder &bullet(const std::string &text);
    ReportBuilder &table(const std::vector<std::string> &header,
                         const std::vector<std::vector<std::string>> &rows,
                         const std::string &align = "");
    ReportBuilder &outputs(const std::vector<std::string> &files);

    std::string str() const;
    void write(const std::filesystem::path &path) const;

private:
    std::vector<std::string> lines_;
};

// "[2, 3, 5]"
std::string format_list(const std::vector<i64> &v);

} // namespace PrimeLab
