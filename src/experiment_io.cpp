#include "experiment_io.hpp"
#include <cctype>
#include <fmt/format.h>
#include <stdexcept>

namespace PrimeLab {

RunPaths prepare_out_dir(const std::filesystem::path &out_dir) {
    RunPaths paths;
    paths.root = out_dir;
    paths.data_dir = out_dir / "data";
    paths.report_path = out_dir / "report.md";
    paths.params_path = out_dir / "params.json";

    std::error_code ec;
    std::filesystem::create_directories(paths.data_dir, ec);
    if (ec) {
        throw std::runtime_error("prepare_out_dir(): cannot create " + paths.data_dir.string() +
                                 ": " + ec.message());
    }
    return paths;
}

std::string json_to_string(const Json::Value &value) {
    Json::StreamWriterBuilder builder;
    builder["indentation"] = "  ";
    builder["enableYAMLCompatibility"] = true;
    builder["precision"] = 17;
    return Json::writeString(builder, value) + "\n";
}

void write_text(const std::filesystem::path &path, const std::string &text) {
    std::ofstream out(path, std::ios::binary | std::ios::trunc);
    if (!out) {
        throw std::runtime_error("write_text(): cannot open " + path.string());
    }
    out << text;
    if (!out) {
        throw std::runtime_error("write_text(): write failed for " + path.string());
    }
}

void write_json(const std::filesystem::path &path, const Json::Value &value) {
    write_text(path, json_to_string(value));
}

CsvWriter::CsvWriter(const std::filesystem::path &path, const std::vector<std::string> &header)
    : path_(path), out_(path, std::ios::binary | std::ios::trunc), columns_(header.size()) {
    if (!out_) {
        throw std::runtime_error("CsvWriter: cannot open " + path.string());
    }
    std::string line;
    for (const auto &h : header) {
        if (!line.empty()) line += ',';
        line += h;
    }
    out_ << line << '\n';
}

void CsvWriter::row_cells(const std::vector<std::string> &cells) {
    if (cells.size() != columns_) {
        throw std::invalid_argument("CsvWriter::row_cells(): expected " + std::to_string(columns_) + " columns");
    }
    std::string line;
    for (const auto &c : cells) {
        if (!line.empty()) line += ',';
        line += cell(c);
    }
    out_ << line << '\n';
    ++rows_;
}

std::string CsvWriter::cell(i64 v) { return std::to_string(v); }
std::string CsvWriter::cell(int v) { return std::to_string(v); }
std::string CsvWriter::cell(u64 v) { return std::to_string(v); }
std::string CsvWriter::cell(unsigned v) { return std::to_string(v); }
std::string CsvWriter::cell(long v) { return std::to_string(v); }
std::string CsvWriter::cell(unsigned long v) { return std::to_string(v); }
std::string CsvWriter::cell(double v) { return fmt::format("{:.10g}", v); }
std::string CsvWriter::cell(const cpp_int &v) { return v.str(); }

std::string CsvWriter::cell(const std::string &v) {
    if (v.find_first_of(",\"\n") == std::string::npos) return v;
    std::string quoted = "\"";
    for (char ch : v) {
        if (ch == '"') quoted += '"';
        quoted += ch;
    }
    return quoted + "\"";
}

ReportBuilder::ReportBuilder(const std::string &id, const std::string &title, const std::string &reproduce) {
    std::string upper = id;
    for (auto &ch : upper) ch = (char)std::toupper((unsigned char)ch);
    lines_ = {
        fmt::format("# {} — {}", upper, title),
        "",
        "**Reproduce:**",
        "",
        "```bash",
        reproduce,
        "```",
        "",
    };
}

ReportBuilder &ReportBuilder::line(const std::string &text) {
    lines_.push_back(text);
    return *this;
}

ReportBuilder &ReportBuilder::section(const std::string &heading) {
    if (!lines_.empty() && !lines_.back().empty()) lines_.emplace_back();
    lines_.push_back("## " + heading);
    return *this;
}

ReportBuilder &ReportBuilder::param(const std::string &key, const std::string &value) {
    lines_.push_back(fmt::format("- {}: `{}`", key, value));
    return *this;
}

ReportBuilder &ReportBuilder::bullet(const std::string &text) {
    lines_.push_back("- " + text);
    return *this;
}

ReportBuilder &ReportBuilder::table(const std::vector<std::string> &header,
                                    const std::vector<std::vector<std::string>> &rows,
                                    const std::string &align) {
    auto join_row = [](const std::vector<std::string> &cells) {
        std::string s = "|";
        for (const auto &c : cells) s += " " + c + " |";
        return s;
    };
    if (!lines_.empty() && !lines_.back().empty()) lines_.emplace_back();
    lines_.push_back(join_row(header));
    // align: one char per column, 'r' right-aligned, anything else left
    std::string sep = "|";
    for (size_t i = 0; i < header.size(); ++i) {
        sep += (i < align.size() && align[i] == 'r') ? "---:|" : "---|";
    }
    lines_.push_back(sep);
    for (const auto &r : rows) lines_.push_back(join_row(r));
    lines_.emplace_back();
    return *this;
}

ReportBuilder &ReportBuilder::outputs(const std::vector<std::string> &files) {
    section("Outputs");
    for (const auto &f : files) lines_.push_back("- `" + f + "`");
    return *this;
}

std::string ReportBuilder::str() const {
    std::string out;
    for (const auto &l : lines_) {
        out += l;
        out += '\n';
    }
    return out;
}

void ReportBuilder::write(const std::filesystem::path &path) const {
    write_text(path, str());
}

std::string format_list(const std::vector<i64> &v) {
    return "[" + fmt::format("{}", fmt::join(v, ", ")) + "]";
}

} // namespace PrimeLab
