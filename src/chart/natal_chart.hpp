#pragma once

/// @file natal_chart.hpp
/// @brief Birth data, chart value types and the chart calculator.

#include "chart/aspects.hpp"
#include "chart/chart_point.hpp"
#include "chart/houses.hpp"
#include "chart/zodiac.hpp"
#include "core/types.hpp"

#include <array>
#include <filesystem>
#include <optional>
#include <vector>

#ifndef NATAL_DATA_DIR
#define NATAL_DATA_DIR "data"
#endif

namespace natal::chart
{
    /// @brief Birth moment and place as entered by the user.
    ///
    /// Only year and month are required. Missing fields resolve to
    /// day 1, 12:00, latitude 0, longitude 0, timezone 0.
    struct BirthData
    {
        i32 year;                          ///< Astronomical year (negative = BCE)
        i32 month;                         ///< [1, 12]
        std::optional<i32> day;
        std::optional<i32> hour;           ///< Local clock hour [0, 23]
        std::optional<i32> minute;
        std::optional<f64> latitude;       ///< Degrees, north positive
        std::optional<f64> longitude;      ///< Degrees, east positive
        std::optional<f64> timezone;       ///< Hours east of UTC (e.g. −5 for EST)

        bool operator==(const BirthData&) const = default;
    };

    /// @brief BirthData with every default applied.
    struct ResolvedBirthData
    {
        i32 year;
        i32 month;
        i32 day;
        i32 hour;
        i32 minute;
        f64 latitude;
        f64 longitude;
        f64 timezone;
    };

    /// @brief Apply the default for each missing field.
    [[nodiscard]] ResolvedBirthData resolve(const BirthData& birth);

    /// @brief Reject out-of-range fields.
    /// @throws natal::InvalidBirthData naming the first offending field.
    void validate(const ResolvedBirthData& birth);

    /// @brief A planet (or angle pseudo-point) placed in sign and house.
    struct PlanetPosition
    {
        ChartPoint planet;
        Sign sign;
        f64 degrees;        ///< Within sign, 2 decimals
        f64 total_degrees;  ///< Ecliptic longitude, 2 decimals, [0, 360)
        i32 house;          ///< [1, 12]
        bool retrograde;

        bool operator==(const PlanetPosition&) const = default;
    };

    /// @brief A complete, immutable natal chart.
    struct NatalChart
    {
        std::array<PlanetPosition, 10> planets;   ///< Indexed in kPlanets order
        SignPosition ascendant;
        SignPosition midheaven;
        std::vector<ChartAspect> aspects;         ///< Tightest orb first
        HouseCusps house_cusps;
        f64 julian_day;                           ///< UT moment the chart was cast for

        /// @brief Position of one of the ten planets.
        [[nodiscard]] const PlanetPosition& planet(ChartPoint point) const;

        /// @brief Position of any chart point. Ascendant sits in house 1,
        /// midheaven in house 10; neither is ever retrograde.
        [[nodiscard]] PlanetPosition position_of(ChartPoint point) const;

        [[nodiscard]] const PlanetPosition& sun() const { return planet(ChartPoint::Sun); }
        [[nodiscard]] const PlanetPosition& moon() const { return planet(ChartPoint::Moon); }

        bool operator==(const NatalChart&) const = default;
    };

    /// @brief Settings for building a ChartCalculator.
    struct ChartConfig
    {
        std::filesystem::path aspect_table_path{NATAL_DATA_DIR "/aspects.csv"};
        bool use_builtin_aspects_on_failure{true};
    };

    /// @brief Computes charts from birth data against a fixed aspect table.
    ///
    /// The calculator holds no mutable state; one instance can serve any
    /// number of threads.
    class ChartCalculator
    {
    public:
        /// @brief Uses the given table as-is.
        explicit ChartCalculator(AspectTable aspects);

        /// @brief Loads the aspect table named by @p config.
        /// @throws std::runtime_error if loading fails and fallback is disabled.
        explicit ChartCalculator(const ChartConfig& config);

        /// @brief Compute the chart for a birth moment. Pure: equal inputs
        /// give equal charts.
        /// @throws natal::InvalidBirthData for out-of-range fields.
        [[nodiscard]] NatalChart calculate(const BirthData& birth) const;

        [[nodiscard]] const AspectTable& aspect_table() const { return m_aspects; }

    private:
        [[nodiscard]] static AspectTable load_table(const ChartConfig& config);

        AspectTable m_aspects;
    };

} // namespace natal::chart
