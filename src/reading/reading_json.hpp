#pragma once

/// @file reading_json.hpp
/// @brief nlohmann::json serialization of reading results.

#include "chart/chart_json.hpp"
#include "reading/astrology_reading.hpp"

#include <nlohmann/json.hpp>

namespace natal::reading
{
    using json = nlohmann::json;

    void to_json(json& j, const FeedbackEntry& f);
    void to_json(json& j, const ReadingSynthesis& s);

} // namespace natal::reading
