/**
 * @file errors.hpp
 * @brief Exception types raised by the volatility toolkit
 *
 * All errors are thrown synchronously at the point where a precondition
 * is violated. Each type derives from the standard exception that best
 * matches its meaning, so callers may catch either the specific type or
 * the standard base.
 */

#pragma once

#include <stdexcept>
#include <string>

namespace volaframe
{

    /**
     * @class InvalidInput
     * @brief Hyperparameter out of range, empty or non-finite returns,
     *        or a non-positive forecast horizon
     */
    class InvalidInput : public std::invalid_argument
    {
    public:
        explicit InvalidInput(const std::string &what_arg)
            : std::invalid_argument(what_arg) {}
    };

    /**
     * @class NotFitted
     * @brief A forecast or fitted state was requested before a successful fit
     */
    class NotFitted : public std::logic_error
    {
    public:
        explicit NotFitted(const std::string &what_arg)
            : std::logic_error(what_arg) {}
    };

    /**
     * @class ShapeMismatch
     * @brief Two arrays that must be elementwise aligned differ in shape
     */
    class ShapeMismatch : public std::invalid_argument
    {
    public:
        explicit ShapeMismatch(const std::string &what_arg)
            : std::invalid_argument(what_arg) {}
    };

} // namespace volaframe
