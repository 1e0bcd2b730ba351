/// @file aspect_loader.cpp
/// @brief Implementation of the CSV aspect table loader.

#include "catalog/aspect_loader.hpp"

#include "core/logger.hpp"
#include "core/types.hpp"

#include <charconv>
#include <fstream>
#include <sstream>
#include <string>

namespace natal::catalog
{

// -----------------------------------------------------------------
// Load aspect CSV: id,name,symbol,degrees,orb,nature
// -----------------------------------------------------------------

std::optional<std::vector<chart::AspectDefinition>>
AspectLoader::load_csv(const std::filesystem::path& path)
{
    std::ifstream file(path);
    if (!file.is_open())
    {
        NATAL_CORE_ERROR("AspectLoader: Failed to open file: {}", path.string());
        return std::nullopt;
    }

    std::vector<chart::AspectDefinition> definitions;
    std::string line;

    // Skip header line
    if (!std::getline(file, line))
    {
        NATAL_CORE_ERROR("AspectLoader: File is empty: {}", path.string());
        return std::nullopt;
    }

    u32 line_number = 1;
    u32 skipped = 0;

    while (std::getline(file, line))
    {
        ++line_number;

        if (trim(line).empty() || trim(line).front() == '#')
        {
            continue;
        }

        std::istringstream stream(line);
        std::string id_str;
        std::string name_str;
        std::string symbol_str;
        std::string degrees_str;
        std::string orb_str;
        std::string nature_str;

        if (!std::getline(stream, id_str, ',') ||
            !std::getline(stream, name_str, ',') ||
            !std::getline(stream, symbol_str, ',') ||
            !std::getline(stream, degrees_str, ',') ||
            !std::getline(stream, orb_str, ',') ||
            !std::getline(stream, nature_str))
        {
            NATAL_CORE_WARN("AspectLoader: Malformed line {}: {}", line_number, line);
            ++skipped;
            continue;
        }

        const auto degrees = parse_f64(trim(degrees_str));
        const auto orb     = parse_f64(trim(orb_str));
        const auto nature  = chart::parse_nature(trim(nature_str));
        const auto id      = trim(id_str);

        if (id.empty() || !degrees || !orb || !nature)
        {
            NATAL_CORE_WARN("AspectLoader: Failed to parse values on line {}: {}",
                            line_number, line);
            ++skipped;
            continue;
        }

        if (*degrees < 0.0 || *degrees > 180.0 || *orb < 0.0)
        {
            NATAL_CORE_WARN("AspectLoader: Out-of-range angle on line {}: {}", line_number, line);
            ++skipped;
            continue;
        }

        definitions.push_back(chart::AspectDefinition{
            .id      = std::string(id),
            .name    = std::string(trim(name_str)),
            .symbol  = std::string(trim(symbol_str)),
            .degrees = *degrees,
            .orb     = *orb,
            .nature  = *nature,
        });
    }

    if (definitions.empty())
    {
        NATAL_CORE_ERROR("AspectLoader: No valid aspects found in: {}", path.string());
        return std::nullopt;
    }

    if (skipped > 0)
    {
        NATAL_CORE_WARN("AspectLoader: Skipped {} malformed lines", skipped);
    }

    NATAL_CORE_INFO("AspectLoader: Loaded {} aspects from {}", definitions.size(), path.string());

    return definitions;
}

// -----------------------------------------------------------------
// Utility: trim whitespace
// -----------------------------------------------------------------

std::string_view AspectLoader::trim(std::string_view sv)
{
    while (!sv.empty() && (sv.front() == ' ' || sv.front() == '\t' || sv.front() == '\r'))
    {
        sv.remove_prefix(1);
    }
    while (!sv.empty() && (sv.back() == ' ' || sv.back() == '\t' || sv.back() == '\r'))
    {
        sv.remove_suffix(1);
    }
    return sv;
}

// -----------------------------------------------------------------
// Utility: parse f64 from string_view
// -----------------------------------------------------------------

std::optional<f64> AspectLoader::parse_f64(std::string_view sv)
{
    if (sv.empty())
    {
        return std::nullopt;
    }

    f64 value = 0.0;
    const auto [ptr, ec] = std::from_chars(sv.data(), sv.data() + sv.size(), value);

    if (ec != std::errc{} || ptr != sv.data() + sv.size())
    {
        return std::nullopt;
    }

    return value;
}

} // namespace natal::catalog
