/**
 * @file errors.hpp
 * @brief Exception types for failures that abort a whole run.
 */

#ifndef MEDIAPRESS_ERRORS_HPP
#define MEDIAPRESS_ERRORS_HPP

#include <stdexcept>

namespace mediapress {

    /**
     * @brief Invalid command line or input tree, detected before any file is written
     * to the output tree (bad directories, name collisions).
     */
    class ValidationError : public std::runtime_error {
    public:
        using std::runtime_error::runtime_error;
    };

    /**
     * @brief The output tree does not match the input tree after compression,
     * or the temp tree was not left empty.
     */
    class VerificationError : public std::runtime_error {
    public:
        using std::runtime_error::runtime_error;
    };

    /**
     * @brief A file's step was cut short by a stop request; nothing was
     * placed in the output tree for it.
     */
    class InterruptedError : public std::runtime_error {
    public:
        using std::runtime_error::runtime_error;
    };

} // namespace mediapress

#endif // MEDIAPRESS_ERRORS_HPP
