#include "report_generator.hpp"
#include "../../../libmediapress/include/file_type.hpp"
#include "../../../libmediapress/include/file_utils.hpp"
#include <algorithm>
#include <array>
#include <cmath>
#include <cstdio>
#include <fstream>
#include <functional>
#include <iomanip>
#include <iterator>
#include <sstream>
#include <sys/ioctl.h>
#include <unistd.h>

namespace fs = std::filesystem;

unsigned get_terminal_width() {
    winsize w{};
    if (ioctl(STDOUT_FILENO, TIOCGWINSZ, &w) == 0 && w.ws_col > 0)
        return w.ws_col;
    return 80;
}

std::string format_size(double num_bytes) {
    static constexpr std::array<const char*, 8> units = {"", "K", "M", "G", "T", "P", "E", "Z"};
    char buf[64];
    for (const auto* unit : units) {
        if (std::abs(num_bytes) < 1000.0) {
            std::snprintf(buf, sizeof(buf), "%3.1f %sB", num_bytes, unit);
            return buf;
        }
        num_bytes /= 1000.0;
    }
    std::snprintf(buf, sizeof(buf), "%.1f YB", num_bytes);
    return buf;
}

namespace {

struct DirectorySummary {
    fs::path directory;
    uintmax_t total = 0;
    std::vector<std::pair<std::string, uintmax_t>> by_extension; ///< In first-seen order
};

std::string csv_escape(const std::string& data) {
    if (data.find_first_of(",\"\n\r") == std::string::npos) {
        return data;
    }
    std::string result;
    result.reserve(data.size() + 4);
    result.push_back('"');
    for (char c : data) {
        if (c == '"') {
            result.push_back('"'); // escape quote with another quote
        }
        result.push_back(c);
    }
    result.push_back('"');
    return result;
}

double delta_percent(const Result& r) {
    return r.success && r.size_before
               ? 100.0 * (1.0 - static_cast<double>(r.size_after) / static_cast<double>(r.size_before))
               : 0.0;
}

std::string outcome_string(const Result& r) {
    if (!r.success) return "FAIL";
    return r.compressed ? "compressed" : "copied";
}

} // namespace

void summarize_directory_files(std::ostream& os,
                               const std::string_view label,
                               const fs::path& root,
                               const std::vector<fs::path>& files) {
    std::vector<DirectorySummary> dirs;
    uintmax_t grand_total = 0;

    for (const auto& f : files) {
        if (!fs::is_regular_file(f)) continue;
        const uintmax_t size = mediapress::safe_file_size(f);
        const fs::path dir = f.parent_path();

        auto it = std::ranges::find(dirs, dir, &DirectorySummary::directory);
        if (it == dirs.end()) {
            dirs.push_back({dir, 0, {}});
            it = std::prev(dirs.end());
        }
        it->total += size;
        grand_total += size;

        const std::string ext = lowercase_extension(f);
        auto ext_it = std::ranges::find(it->by_extension, ext, &std::pair<std::string, uintmax_t>::first);
        if (ext_it == it->by_extension.end()) {
            it->by_extension.emplace_back(ext, size);
        } else {
            ext_it->second += size;
        }
    }

    std::ranges::stable_sort(dirs, std::greater{}, &DirectorySummary::total);

    os << label << " summary (" << format_size(static_cast<double>(grand_total)) << " in total):\n";
    for (auto& d : dirs) {
        const fs::path rel = d.directory.lexically_relative(root);
        os << label << " -> " << (rel.empty() ? "." : rel.string())
           << " (" << format_size(static_cast<double>(d.total)) << " in total):\n";
        std::ranges::stable_sort(d.by_extension, std::greater{}, &std::pair<std::string, uintmax_t>::second);
        for (const auto& [ext, size] : d.by_extension) {
            os << "|  " << ext << " only: " << format_size(static_cast<double>(size)) << "\n";
        }
    }
    os << "\n";
}

void print_outcome_summary(std::ostream& os,
                           const std::vector<Result>& results,
                           const unsigned num_processes,
                           const double total_seconds) {
    size_t compressed = 0;
    size_t copied = 0;
    size_t failed = 0;
    uintmax_t total_before = 0;
    uintmax_t total_after = 0;

    for (const auto& r : results) {
        if (!r.success) {
            ++failed;
            continue;
        }
        if (r.compressed) ++compressed;
        else ++copied;
        total_before += r.size_before;
        total_after += r.size_after;
    }

    os << "Compressed: " << compressed << ", copied: " << copied << ", failed: " << failed << "\n";
    const double saved = static_cast<double>(total_before) - static_cast<double>(total_after);
    os << "Total saved space: " << format_size(saved) << "\n";
    if (total_before > 0) {
        const double total_pct = 100.0 * saved / static_cast<double>(total_before);
        os << "Total reduction: " << std::fixed << std::setprecision(2) << total_pct << "%\n";
    }
    os << "Total time: " << std::fixed << std::setprecision(2)
       << total_seconds << " s (" << num_processes << " process"
       << (num_processes > 1U ? "es" : "") << ")\n";
}

bool export_csv_report(const std::vector<Result>& results,
                       const fs::path& output_path,
                       const double total_seconds) {
    std::ofstream out(output_path);
    if (!out) return false;

    out << "Input,Output,Kind,MIME,Processor,Before(B),After(B),Delta(%),Time(s),Result,Error\n";

    auto sorted = results;
    std::ranges::sort(sorted, [](const auto& a, const auto& b) {
        return a.path < b.path;
    });

    for (const auto& r : sorted) {
        std::ostringstream osspct;
        osspct << std::fixed << std::setprecision(2) << delta_percent(r);
        std::ostringstream osstime;
        osstime << std::fixed << std::setprecision(2) << r.seconds;

        out << csv_escape(r.path.string()) << ","
            << csv_escape(r.output_path.string()) << ","
            << csv_escape(r.kind) << ","
            << csv_escape(r.mime) << ","
            << csv_escape(r.processor) << ","
            << r.size_before << ","
            << r.size_after << ","
            << osspct.str() << ","
            << osstime.str() << ","
            << outcome_string(r) << ","
            << csv_escape(r.error_msg) << "\n";
    }

    out << "\n\nTotal amount of time\n";
    out << std::fixed << std::setprecision(2) << total_seconds << " seconds\n";
    return static_cast<bool>(out);
}
