#pragma once

/// @file InvalidatedHandleException.hpp
/// @brief Declares the InvalidatedHandleException class.

#include <Tandem/Exceptions/Exception.hpp>

#include <string>

namespace Tandem::Exceptions
{
    /// @class InvalidatedHandleException
    /// @brief Thrown when an entry or raw-entry handle is used after it stopped being valid.
    ///
    /// @details
    /// A handle is valid from its creation until the owning map is mutated by any other
    /// operation, or until one of the handle's consuming operations (`IntoMut`, `Remove`,
    /// `Insert` on a vacant handle, ...) has run.
    class InvalidatedHandleException : public Exception
    {
    public:
        /// @param operation Name of the handle operation that detected the stale handle.
        explicit InvalidatedHandleException(const char* operation)
            : Exception(std::string(operation) + ": handle was consumed or its map was mutated since it was created")
        {
        }
    };
}// namespace Tandem::Exceptions
