/// @file zodiac.cpp
/// @brief Sign lookup tables.

#include "chart/zodiac.hpp"

#include "astro/angles.hpp"

#include <cctype>
#include <cmath>

namespace natal::chart
{

namespace
{

struct SignRecord
{
    std::string_view name;
    Element element;
    Modality modality;
    std::string_view ruler;
};

constexpr std::array<SignRecord, 12> kSignTable{{
    {"aries",       Element::Fire,  Modality::Cardinal, "mars"},
    {"taurus",      Element::Earth, Modality::Fixed,    "venus"},
    {"gemini",      Element::Air,   Modality::Mutable,  "mercury"},
    {"cancer",      Element::Water, Modality::Cardinal, "moon"},
    {"leo",         Element::Fire,  Modality::Fixed,    "sun"},
    {"virgo",       Element::Earth, Modality::Mutable,  "mercury"},
    {"libra",       Element::Air,   Modality::Cardinal, "venus"},
    {"scorpio",     Element::Water, Modality::Fixed,    "pluto"},
    {"sagittarius", Element::Fire,  Modality::Mutable,  "jupiter"},
    {"capricorn",   Element::Earth, Modality::Cardinal, "saturn"},
    {"aquarius",    Element::Air,   Modality::Fixed,    "uranus"},
    {"pisces",      Element::Water, Modality::Mutable,  "neptune"},
}};

struct SunSignBoundary
{
    Sign sign;
    i32 start_month;
    i32 start_day;
};

// Tropical sun-sign start dates, in calendar order
constexpr std::array<SunSignBoundary, 13> kSunSignDates{{
    {Sign::Capricorn,   1,  1},
    {Sign::Aquarius,    1, 20},
    {Sign::Pisces,      2, 19},
    {Sign::Aries,       3, 21},
    {Sign::Taurus,      4, 20},
    {Sign::Gemini,      5, 21},
    {Sign::Cancer,      6, 21},
    {Sign::Leo,         7, 23},
    {Sign::Virgo,       8, 23},
    {Sign::Libra,       9, 23},
    {Sign::Scorpio,    10, 23},
    {Sign::Sagittarius, 11, 22},
    {Sign::Capricorn,  12, 22},
}};

const SignRecord& record(Sign sign)
{
    return kSignTable[static_cast<std::size_t>(sign)];
}

} // anonymous namespace

SignPosition degrees_to_sign(f64 total_degrees)
{
    const f64 deg = astro::normalize_degrees(total_degrees);
    const auto index = static_cast<std::size_t>(std::floor(deg / 30.0));
    return SignPosition{
        .sign          = kSignOrder[index],
        .degrees       = deg - 30.0 * static_cast<f64>(index),
        .total_degrees = deg,
    };
}

std::string_view sign_name(Sign sign)
{
    return record(sign).name;
}

std::string sign_display_name(Sign sign)
{
    std::string name{sign_name(sign)};
    name[0] = static_cast<char>(std::toupper(static_cast<unsigned char>(name[0])));
    return name;
}

std::optional<Sign> parse_sign(std::string_view name)
{
    for (std::size_t i = 0; i < kSignTable.size(); ++i)
    {
        if (kSignTable[i].name == name)
        {
            return kSignOrder[i];
        }
    }
    return std::nullopt;
}

Element element_of(Sign sign)
{
    return record(sign).element;
}

Modality modality_of(Sign sign)
{
    return record(sign).modality;
}

std::string_view element_name(Element element)
{
    switch (element)
    {
        case Element::Fire:  return "fire";
        case Element::Earth: return "earth";
        case Element::Air:   return "air";
        case Element::Water: return "water";
    }
    return "fire";
}

std::string_view modality_name(Modality modality)
{
    switch (modality)
    {
        case Modality::Cardinal: return "cardinal";
        case Modality::Fixed:    return "fixed";
        case Modality::Mutable:  return "mutable";
    }
    return "cardinal";
}

std::string_view ruling_planet(Sign sign)
{
    return record(sign).ruler;
}

Sign sun_sign_for_date(i32 month, i32 day)
{
    // Walk the boundaries backwards to find the active sign
    for (auto it = kSunSignDates.rbegin(); it != kSunSignDates.rend(); ++it)
    {
        if (month > it->start_month || (month == it->start_month && day >= it->start_day))
        {
            return it->sign;
        }
    }
    return Sign::Capricorn;
}

bool is_aspect(f64 degrees1, f64 degrees2, f64 aspect_degrees, f64 orb)
{
    return std::abs(astro::angular_separation(degrees1, degrees2) - aspect_degrees) <= orb;
}

} // namespace natal::chart
