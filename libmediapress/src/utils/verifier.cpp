#include "../../include/verifier.hpp"
#include "../../include/errors.hpp"
#include "../../include/file_scanner.hpp"
#include "../../include/file_utils.hpp"
#include "../../include/logger.hpp"
#include <algorithm>
#include <cstdio>
#include <string>
#include <utility>

namespace fs = std::filesystem;

namespace mediapress {

namespace {

struct NamedFile {
    std::string name;
    fs::path path;
};

std::vector<NamedFile> sorted_by_canonical_name(const fs::path& root, const std::string_view suffix) {
    std::vector<NamedFile> files;
    for (auto& f : collect_input_files(root)) {
        files.push_back({canonical_name(f, root, suffix), std::move(f)});
    }
    std::ranges::sort(files, [](const NamedFile& a, const NamedFile& b) {
        return a.name != b.name ? a.name < b.name : a.path < b.path;
    });
    return files;
}

double compression_rate(const uintmax_t input_size, const uintmax_t output_size) {
    if (input_size == 0) return 0.0;
    return 100.0 * (1.0 - static_cast<double>(output_size) / static_cast<double>(input_size));
}

} // namespace

size_t VerificationReport::compressed_count() const {
    return static_cast<size_t>(std::ranges::count_if(pairs, [](const VerifiedPair& p) { return p.compressed; }));
}

VerificationReport verify_consistency(const fs::path& input_root,
                                      const fs::path& output_root,
                                      const std::string_view suffix,
                                      const double max_compression_pct) {
    const auto inputs = sorted_by_canonical_name(input_root, {});
    const auto outputs = sorted_by_canonical_name(output_root, suffix);

    if (inputs.size() != outputs.size()) {
        throw VerificationError("The final count of output files (" + std::to_string(outputs.size()) +
                                ") did not match the input (" + std::to_string(inputs.size()) + ")");
    }

    VerificationReport report;
    report.pairs.reserve(inputs.size());
    for (size_t idx = 0; idx < inputs.size(); ++idx) {
        const auto& in = inputs[idx];
        const auto& out = outputs[idx];
        if (in.name != out.name) {
            throw VerificationError("In final consistency check, file #" + std::to_string(idx) +
                                    " did not match: '" + in.name + "' vs. '" + out.name + "'");
        }

        const double rate = compression_rate(safe_file_size(in.path), safe_file_size(out.path));
        if (rate > max_compression_pct) {
            char buf[32];
            std::snprintf(buf, sizeof(buf), "%.1f", rate);
            throw VerificationError("Compression appears to have achieved unrealistic compression rate of " +
                                    std::string(buf) + "% on '" + in.name + "'");
        }

        const bool compressed = !suffix.empty() && out.path.stem().string().ends_with(suffix);
        report.pairs.push_back({in.path, out.path, compressed, rate});
    }

    for (const auto& dir : collect_directories(input_root)) {
        const fs::path rel = dir.lexically_relative(input_root);
        if (!fs::is_directory(output_root / rel)) {
            throw VerificationError("Output directory is missing sub-directory '" + rel.generic_string() + "'");
        }
    }

    Logger::log(LogLevel::Info,
                "Verified " + std::to_string(report.pairs.size()) + " outputs (" +
                std::to_string(report.compressed_count()) + " compressed)",
                "verifier");
    return report;
}

void clean_up_temp_directory(const fs::path& temp_root) {
    const auto leftovers = collect_input_files(temp_root);
    if (!leftovers.empty()) {
        for (const auto& f : leftovers) {
            Logger::log(LogLevel::Error, "Left over in temp directory: " + f.string(), "verifier");
        }
        throw VerificationError("The temp directory is not empty (" + std::to_string(leftovers.size()) +
                                " files), but there should be nothing left there!");
    }
    fs::remove_all(temp_root);
    Logger::log(LogLevel::Debug, "Removed temp directory " + temp_root.string(), "verifier");
}

} // namespace mediapress
