#pragma once

#include <stdexcept>
#include <string>

namespace Tandem::Exceptions
{
    /// @class Exception
    /// @brief Base class for all exceptions thrown by Tandem.
    ///
    /// @details
    /// Standard library conditions keep their standard types (`std::out_of_range` for a
    /// missing key, `std::length_error` for capacity overflow, `std::bad_alloc`); `Exception`
    /// covers misuse that is specific to Tandem's handle types.
    class Exception : public std::runtime_error
    {
    public:
        /// @brief Constructor with a C-style string message.
        explicit Exception(const char* message) : std::runtime_error(message) {}

        /// @brief Constructor with a std::string message.
        explicit Exception(const std::string& message) : std::runtime_error(message) {}

        virtual ~Exception() noexcept = default;

        /// @brief Returns the exception message.
        const char* GetMessage() const noexcept { return this->what(); }
    };
}// namespace Tandem::Exceptions
