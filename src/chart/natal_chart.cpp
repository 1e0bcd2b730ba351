/// @file natal_chart.cpp
/// @brief Chart assembly: time → longitudes → signs and houses → aspects.

#include "chart/natal_chart.hpp"

#include "astro/angles.hpp"
#include "astro/chart_angles.hpp"
#include "astro/planet_ephemeris.hpp"
#include "astro/sun_moon.hpp"
#include "astro/time_system.hpp"
#include "catalog/aspect_loader.hpp"
#include "core/errors.hpp"
#include "core/logger.hpp"

#include <spdlog/fmt/fmt.h>

#include <stdexcept>
#include <utility>

namespace natal::chart
{

namespace
{

/// Body used for the ephemeris lookup of each orbital chart planet.
std::optional<astro::Body> body_for(ChartPoint point)
{
    switch (point)
    {
        case ChartPoint::Mercury: return astro::Body::Mercury;
        case ChartPoint::Venus:   return astro::Body::Venus;
        case ChartPoint::Mars:    return astro::Body::Mars;
        case ChartPoint::Jupiter: return astro::Body::Jupiter;
        case ChartPoint::Saturn:  return astro::Body::Saturn;
        case ChartPoint::Uranus:  return astro::Body::Uranus;
        case ChartPoint::Neptune: return astro::Body::Neptune;
        case ChartPoint::Pluto:   return astro::Body::Pluto;
        default:                  return std::nullopt;
    }
}

/// Round a longitude to display precision without letting 359.996 become 360.
SignPosition rounded_sign_position(f64 longitude)
{
    f64 total = astro::round2(astro::normalize_degrees(longitude));
    if (total >= 360.0)
    {
        total -= 360.0;
    }
    SignPosition pos = degrees_to_sign(total);
    pos.degrees = astro::round2(pos.degrees);
    return pos;
}

PlanetPosition build_position(ChartPoint point, f64 longitude, const HouseCusps& cusps, bool retrograde)
{
    const SignPosition pos = rounded_sign_position(longitude);
    return PlanetPosition{
        .planet        = point,
        .sign          = pos.sign,
        .degrees       = pos.degrees,
        .total_degrees = pos.total_degrees,
        .house         = house_for_longitude(astro::normalize_degrees(longitude), cusps),
        .retrograde    = retrograde,
    };
}

template <typename T>
void require_range(T value, T lo, T hi, const char* field)
{
    if (value < lo || value > hi)
    {
        throw InvalidBirthData(fmt::format("{} out of range [{}, {}]: {}", field, lo, hi, value));
    }
}

} // anonymous namespace

// -----------------------------------------------------------------
// BirthData
// -----------------------------------------------------------------

ResolvedBirthData resolve(const BirthData& birth)
{
    return ResolvedBirthData{
        .year      = birth.year,
        .month     = birth.month,
        .day       = birth.day.value_or(1),
        .hour      = birth.hour.value_or(12),
        .minute    = birth.minute.value_or(0),
        .latitude  = birth.latitude.value_or(0.0),
        .longitude = birth.longitude.value_or(0.0),
        .timezone  = birth.timezone.value_or(0.0),
    };
}

void validate(const ResolvedBirthData& birth)
{
    require_range(birth.month, 1, 12, "month");
    require_range(birth.day, 1, 31, "day");
    require_range(birth.hour, 0, 23, "hour");
    require_range(birth.minute, 0, 59, "minute");
    require_range(birth.latitude, -90.0, 90.0, "latitude");
    require_range(birth.longitude, -180.0, 180.0, "longitude");
    require_range(birth.timezone, -14.0, 14.0, "timezone");
}

// -----------------------------------------------------------------
// NatalChart
// -----------------------------------------------------------------

const PlanetPosition& NatalChart::planet(ChartPoint point) const
{
    if (!is_planet(point))
    {
        throw InvalidOperation(fmt::format("{} is not a planet", point_name(point)));
    }
    return planets[static_cast<std::size_t>(point)];
}

PlanetPosition NatalChart::position_of(ChartPoint point) const
{
    switch (point)
    {
        case ChartPoint::Ascendant:
            return PlanetPosition{
                .planet        = ChartPoint::Ascendant,
                .sign          = ascendant.sign,
                .degrees       = ascendant.degrees,
                .total_degrees = ascendant.total_degrees,
                .house         = 1,
                .retrograde    = false,
            };
        case ChartPoint::Midheaven:
            return PlanetPosition{
                .planet        = ChartPoint::Midheaven,
                .sign          = midheaven.sign,
                .degrees       = midheaven.degrees,
                .total_degrees = midheaven.total_degrees,
                .house         = 10,
                .retrograde    = false,
            };
        default:
            return planets[static_cast<std::size_t>(point)];
    }
}

// -----------------------------------------------------------------
// ChartCalculator
// -----------------------------------------------------------------

ChartCalculator::ChartCalculator(AspectTable aspects)
    : m_aspects(std::move(aspects))
{
}

ChartCalculator::ChartCalculator(const ChartConfig& config)
    : m_aspects(load_table(config))
{
}

AspectTable ChartCalculator::load_table(const ChartConfig& config)
{
    auto loaded = catalog::AspectLoader::load_csv(config.aspect_table_path);
    if (loaded.has_value())
    {
        return AspectTable(std::move(loaded.value()));
    }

    if (!config.use_builtin_aspects_on_failure)
    {
        throw std::runtime_error("Failed to load aspect table: " + config.aspect_table_path.string());
    }

    NATAL_CORE_WARN("ChartCalculator: Falling back to the built-in aspect table");
    return AspectTable::builtin();
}

NatalChart ChartCalculator::calculate(const BirthData& input) const
{
    const ResolvedBirthData birth = resolve(input);
    validate(birth);

    // Local clock time → UT
    const f64 ut_hour = static_cast<f64>(birth.hour) - birth.timezone;
    const f64 jd = astro::TimeSystem::to_julian_day(birth.year, birth.month, birth.day,
                                                    ut_hour, birth.minute);

    const f64 obliquity = astro::obliquity_degrees(jd);
    const f64 lst       = astro::TimeSystem::lst_degrees(jd, birth.longitude);
    const f64 asc       = astro::ascendant_degrees(lst, birth.latitude, obliquity);
    const f64 mc        = astro::midheaven_degrees(lst, obliquity);

    const HouseCusps cusps = equal_house_cusps(asc);

    NatalChart chart{};
    for (const ChartPoint point : kPlanets)
    {
        f64 longitude = 0.0;
        bool retrograde = false;

        if (point == ChartPoint::Sun)
        {
            longitude = astro::sun_longitude(jd);
        }
        else if (point == ChartPoint::Moon)
        {
            longitude = astro::moon_longitude(jd);
        }
        else
        {
            const astro::Body body = *body_for(point);
            longitude  = astro::PlanetEphemeris::geocentric_longitude(body, jd);
            retrograde = astro::PlanetEphemeris::is_retrograde(body, jd);
        }

        chart.planets[static_cast<std::size_t>(point)] = build_position(point, longitude, cusps, retrograde);
    }

    chart.ascendant   = rounded_sign_position(asc);
    chart.midheaven   = rounded_sign_position(mc);
    chart.aspects     = calculate_aspects(chart.planets, m_aspects);
    chart.house_cusps = cusps;
    chart.julian_day  = jd;

    NATAL_CORE_INFO("ChartCalculator: JD {:.5f} sun {} moon {} asc {} ({} aspects)",
                    jd, sign_name(chart.sun().sign), sign_name(chart.moon().sign),
                    sign_name(chart.ascendant.sign), chart.aspects.size());

    return chart;
}

} // namespace natal::chart
