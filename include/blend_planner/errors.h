#pragma once
/*
===============================================================================
ERRORS — Exception types raised before a model is built
===============================================================================

Input problems (missing prices, missing or mistyped parameters, duplicate oil
ids, ...) are reported as ValidationError, a std::invalid_argument, so callers
that already catch the standard hierarchy keep working. Everything else uses
the standard exceptions directly:

• std::out_of_range  — unknown index, key or handle
• std::runtime_error — a registry slot that was never filled
• std::logic_error   — reading values of a non-optimal solution, mutating a
                       sealed model

===============================================================================
*/

#include <stdexcept>
#include <string>

namespace blend {

    class ValidationError : public std::invalid_argument {
    public:
        explicit ValidationError(const std::string& what)
            : std::invalid_argument(what)
        {
        }
    };

} // namespace blend
