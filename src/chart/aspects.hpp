#pragma once

/// @file aspects.hpp
/// @brief Aspect definitions and the pairwise aspect calculator.

#include "chart/chart_point.hpp"
#include "core/types.hpp"

#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace natal::chart
{
    struct PlanetPosition;

    enum class AspectNature : u8
    {
        Harmonious,
        Challenging,
        Neutral,
    };

    [[nodiscard]] std::string_view nature_name(AspectNature nature);
    [[nodiscard]] std::optional<AspectNature> parse_nature(std::string_view name);

    /// @brief A named angular relationship matched within an orb.
    struct AspectDefinition
    {
        std::string id;       ///< "conjunction"
        std::string name;     ///< "Conjunction"
        std::string symbol;   ///< "☌"
        f64 degrees;          ///< Exact separation
        f64 orb;              ///< Allowed deviation from exact
        AspectNature nature;
    };

    /// @brief An aspect found between two chart planets.
    struct ChartAspect
    {
        ChartPoint planet1;
        ChartPoint planet2;
        std::string aspect_name;
        std::string aspect_symbol;
        f64 exact_degrees;    ///< The definition's exact separation
        f64 actual_degrees;   ///< Measured separation, [0, 180]
        f64 orb;              ///< |actual − exact|, rounded to 2 decimals
        AspectNature nature;

        bool operator==(const ChartAspect&) const = default;
    };

    /// @brief Immutable, ordered set of aspect definitions.
    ///
    /// Built once (from a table file or the built-in set) and handed to the
    /// chart calculator, which only ever reads it.
    class AspectTable
    {
    public:
        explicit AspectTable(std::vector<AspectDefinition> definitions);

        /// @brief Conjunction, semi-sextile, sextile, square, trine,
        /// quincunx and opposition.
        [[nodiscard]] static AspectTable builtin();

        [[nodiscard]] const std::vector<AspectDefinition>& definitions() const { return m_definitions; }
        [[nodiscard]] std::size_t size() const { return m_definitions.size(); }
        [[nodiscard]] bool empty() const { return m_definitions.empty(); }

        /// @brief Definition with the given id, or nullptr.
        [[nodiscard]] const AspectDefinition* find(std::string_view id) const;

    private:
        std::vector<AspectDefinition> m_definitions;
    };

    /// @brief Find every aspect between every unordered pair of @p positions.
    ///
    /// Pairs are visited in input order and definitions in table order; a pair
    /// may match several definitions. The result is stable-sorted by orb,
    /// tightest first, so ties keep discovery order.
    [[nodiscard]] std::vector<ChartAspect> calculate_aspects(std::span<const PlanetPosition> positions,
                                                             const AspectTable& table);

} // namespace natal::chart
