#include "../../include/processor_registry.hpp"
#include "../../include/jpeg_processor.hpp"
#include "../../include/png_processor.hpp"
#include "../../include/video_processor.hpp"
#include <algorithm>
#include <cctype>
#include <string_view>

namespace mediapress {
namespace {

    bool same_ignoring_case(const std::string_view a, const std::string_view b) {
        if (a.size() != b.size()) return false;
        for (size_t i = 0; i < a.size(); ++i) {
            if (std::tolower(static_cast<unsigned char>(a[i])) != std::tolower(static_cast<unsigned char>(b[i]))) {
                return false;
            }
        }
        return true;
    }

    template <typename Pred>
    std::vector<IProcessor*> collect(const std::vector<std::unique_ptr<IProcessor>>& processors, Pred&& accepts) {
        std::vector<IProcessor*> matching;
        for (const auto& processor : processors) {
            if (accepts(*processor)) {
                matching.push_back(processor.get());
            }
        }
        return matching;
    }

} // namespace

ProcessorRegistry::ProcessorRegistry() {
    processors_.emplace_back(std::make_unique<JpegProcessor>());
    processors_.emplace_back(std::make_unique<PngProcessor>());
    processors_.emplace_back(std::make_unique<VideoProcessor>());
}

ProcessorRegistry::ProcessorRegistry(std::vector<std::unique_ptr<IProcessor>> processors)
    : processors_(std::move(processors)) {}

std::vector<IProcessor*> ProcessorRegistry::find_by_mime(const std::string& mime) const {
    return collect(processors_, [&mime](const IProcessor& p) {
        const auto known = p.get_supported_mime_types();
        return std::ranges::find(known, std::string_view(mime)) != known.end();
    });
}

std::vector<IProcessor*> ProcessorRegistry::find_by_extension(const std::string& ext) const {
    if (ext.size() < 2 || ext.front() != '.') {
        return {};
    }
    return collect(processors_, [&ext](const IProcessor& p) {
        return std::ranges::any_of(p.get_supported_extensions(),
                                   [&ext](const std::string_view known) { return same_ignoring_case(known, ext); });
    });
}

IProcessor* ProcessorRegistry::find_for(const MediaKind kind, const std::string& mime) const {
    const auto candidates = find_by_mime(mime);
    const auto it = std::ranges::find_if(candidates, [kind](const IProcessor* p) { return p->get_kind() == kind; });
    return it == candidates.end() ? nullptr : *it;
}

} // namespace mediapress
