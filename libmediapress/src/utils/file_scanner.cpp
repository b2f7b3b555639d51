#include "../../include/file_scanner.hpp"
#include "../../include/logger.hpp"
#include <algorithm>
#include <map>

namespace fs = std::filesystem;

namespace mediapress {

namespace {
constexpr auto kOptions = fs::directory_options::follow_directory_symlink;
}

std::vector<fs::path> collect_input_files(const fs::path& root) {
    std::vector<fs::path> result;
    for (const auto& e : fs::recursive_directory_iterator(root, kOptions)) {
        if (e.is_regular_file()) {
            result.push_back(e.path());
        }
    }
    std::ranges::sort(result);

    Logger::log(LogLevel::Info,
                "Scanner collected " + std::to_string(result.size()) + " files under " + root.string(),
                "scanner");
    return result;
}

std::vector<fs::path> collect_directories(const fs::path& root) {
    std::vector<fs::path> result;
    for (const auto& e : fs::recursive_directory_iterator(root, kOptions)) {
        if (e.is_directory()) {
            result.push_back(e.path());
        }
    }
    std::ranges::sort(result);
    return result;
}

void mirror_directory_tree(const fs::path& input, const fs::path& destination) {
    fs::create_directories(destination);
    for (const auto& dir : collect_directories(input)) {
        // lexical, so a symlinked sub-directory keeps its link name in the mirror
        fs::create_directories(destination / dir.lexically_relative(input));
    }
    Logger::log(LogLevel::Debug, "Mirrored " + input.string() + " into " + destination.string(), "scanner");
}

std::string canonical_name(const fs::path& file, const fs::path& root, const std::string_view suffix) {
    const fs::path rel = file.lexically_relative(root);
    std::string name = (rel.parent_path() / rel.stem()).generic_string();
    if (!suffix.empty() && name.ends_with(suffix)) {
        name.erase(name.size() - suffix.size());
    }
    return name;
}

std::vector<NameCollision> find_name_collisions(const fs::path& root, const std::vector<fs::path>& files) {
    std::map<std::string, std::vector<fs::path>> groups;
    for (const auto& f : files) {
        groups[canonical_name(f, root)].push_back(f);
    }

    std::vector<NameCollision> collisions;
    for (auto& [name, members] : groups) {
        if (members.size() > 1) {
            collisions.push_back(NameCollision{name, std::move(members)});
        }
    }
    return collisions;
}

} // namespace mediapress
