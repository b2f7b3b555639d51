/**
 * @file processor_registry.hpp
 * @brief Defines the registry for discovering and managing IProcessor instances.
 */

#ifndef MEDIAPRESS_PROCESSOR_REGISTRY_HPP
#define MEDIAPRESS_PROCESSOR_REGISTRY_HPP

#include "processor.hpp"
#include <memory>
#include <string>
#include <vector>

namespace mediapress {

/**
 * @brief Registry of all available processors.
 *
 * @details The ProcessorRegistry owns the IProcessor implementations and
 * finds the ones that handle a MIME type or an extension. It is created
 * once per run and shared read-only by the worker threads.
 */
class ProcessorRegistry {
public:
    /**
     * @brief Construct and register the built-in processors
     * (JpegProcessor, PngProcessor, VideoProcessor).
     */
    ProcessorRegistry();

    /**
     * @brief Construct a registry holding exactly @p processors.
     */
    explicit ProcessorRegistry(std::vector<std::unique_ptr<IProcessor>> processors);

    /**
     * @brief Find all processors that support a given MIME type.
     * @param mime MIME type string (e.g. "image/png").
     * @return Non-owning pointers, in registration order.
     */
    [[nodiscard]] std::vector<IProcessor*> find_by_mime(const std::string& mime) const;

    /**
     * @brief Find all processors that support a given file extension.
     *
     * Comparison is case-insensitive.
     *
     * @param ext File extension (including the dot, e.g. ".png").
     * @return Non-owning pointers, in registration order.
     */
    [[nodiscard]] std::vector<IProcessor*> find_by_extension(const std::string& ext) const;

    /**
     * @brief First processor of @p kind handling @p mime, or nullptr.
     */
    [[nodiscard]] IProcessor* find_for(MediaKind kind, const std::string& mime) const;

    /// @return All registered processors.
    [[nodiscard]] const std::vector<std::unique_ptr<IProcessor>>& all() const { return processors_; }

private:
    std::vector<std::unique_ptr<IProcessor>> processors_;
};

} // namespace mediapress

#endif // MEDIAPRESS_PROCESSOR_REGISTRY_HPP
