#pragma once

/// @file errors.hpp
/// @brief Exceptions raised for caller input errors.
///
/// Every computation in the library is deterministic, so each of these
/// signals a bad argument rather than a transient fault.

#include <stdexcept>
#include <string>

namespace natal
{
    /// @brief No orbital elements exist for the requested body identifier.
    class UnknownBody : public std::invalid_argument
    {
    public:
        explicit UnknownBody(const std::string& id)
            : std::invalid_argument("No orbital elements for: " + id)
        {
        }
    };

    /// @brief The requested operation is undefined for its argument
    /// (e.g. the geocentric longitude of Earth).
    class InvalidOperation : public std::logic_error
    {
    public:
        using std::logic_error::logic_error;
    };

    /// @brief A birth-data field lies outside its valid range.
    class InvalidBirthData : public std::invalid_argument
    {
    public:
        using std::invalid_argument::invalid_argument;
    };

} // namespace natal
