#pragma once

/// @file EntryStateException.hpp
/// @brief Declares the EntryStateException class.

#include <Tandem/Exceptions/Exception.hpp>

namespace Tandem::Exceptions
{
    /// @class EntryStateException
    /// @brief Thrown when an occupied-only view is requested from a vacant entry, or vice versa.
    class EntryStateException : public Exception
    {
    public:
        explicit EntryStateException(const char* message) : Exception(message) {}
    };
}// namespace Tandem::Exceptions
