#pragma once

/// @file aspect_loader.hpp
/// @brief Loads aspect definitions from CSV files.

#include "chart/aspects.hpp"
#include "core/types.hpp"

#include <filesystem>
#include <optional>
#include <string_view>
#include <vector>

namespace natal::catalog
{
    /// @brief Static utility class for loading aspect definition tables.
    class AspectLoader
    {
    public:
        AspectLoader() = delete;

        /// @brief Load aspect definitions from a CSV file.
        ///
        /// Expected CSV columns (header row required):
        ///   id, name, symbol, degrees, orb, nature
        ///
        /// nature is one of harmonious, challenging, neutral. Lines that do
        /// not parse are skipped with a warning; row order is preserved
        /// because it decides the order of equally tight aspects.
        ///
        /// @param path Path to the CSV file.
        /// @return Definitions on success, std::nullopt if the file cannot be
        ///         read or holds no valid rows.
        [[nodiscard]] static std::optional<std::vector<chart::AspectDefinition>>
            load_csv(const std::filesystem::path& path);

    private:
        /// @brief Trim leading and trailing whitespace from a string_view.
        [[nodiscard]] static std::string_view trim(std::string_view sv);

        /// @brief Parse a single f64 value from a trimmed string_view.
        /// @return The parsed value, or std::nullopt on failure.
        [[nodiscard]] static std::optional<f64> parse_f64(std::string_view sv);
    };

} // namespace natal::catalog
