#pragma once

/// @file time_system.hpp
/// @brief Astronomical time utilities: Julian Day, Julian centuries, sidereal time.

#include "core/types.hpp"

namespace natal::astro
{
    /// @brief Static utility class for astronomical time computations.
    ///
    /// Provides Julian Day conversion (Meeus algorithm, Astronomical Algorithms Ch. 7)
    /// and Greenwich/Local Mean Sidereal Time (IAU 1982).
    /// Unlike the coordinate code, all angular results here are in degrees.
    class TimeSystem
    {
    public:
        TimeSystem() = delete;

        /// @brief Convert a civil date and UT time of day to a Julian Day.
        ///
        /// Valid across the Julian/Gregorian boundary and for negative
        /// (astronomical, BCE) years. Hour may be fractional or fall outside
        /// [0, 24) after a timezone shift; the day count absorbs the overflow.
        ///
        /// @param year   Astronomical year (0 = 1 BCE).
        /// @param month  Month in [1, 12].
        /// @param day    Day of month.
        /// @param hour   Hour of day (UT).
        /// @param minute Minute of hour.
        /// @return Julian Day as a double-precision number.
        [[nodiscard]] static f64 to_julian_day(i32 year, i32 month, f64 day,
                                               f64 hour = 0.0, f64 minute = 0.0);

        /// @brief Compute Julian centuries elapsed since J2000.0.
        /// @return T = (JD - 2451545.0) / 36525.0
        [[nodiscard]] static f64 julian_centuries(f64 jd);

        /// @brief Greenwich Mean Sidereal Time in degrees, normalized to [0, 360).
        /// Uses the IAU 1982 polynomial driven by days elapsed since J2000.0.
        [[nodiscard]] static f64 gmst_degrees(f64 jd);

        /// @brief Local Mean Sidereal Time in degrees, normalized to [0, 360).
        /// @param longitude_deg Observer longitude in degrees (east positive).
        [[nodiscard]] static f64 lst_degrees(f64 jd, f64 longitude_deg);
    };

} // namespace natal::astro
