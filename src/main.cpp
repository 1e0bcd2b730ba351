// src/main.cpp - natal_chart command line entry point
//
//   natal_chart YEAR MONTH [DAY [HOUR [MINUTE [LAT [LON [TZ]]]]]]
//               [--json] [--reading] [--aspects PATH]
//
// Computes the chart, prints it as a console panel (or JSON), and with
// --reading walks the full reveal protocol, recording one feedback entry
// per step, before printing the synthesis.

#include "chart/chart_json.hpp"
#include "chart/natal_chart.hpp"
#include "core/errors.hpp"
#include "core/logger.hpp"
#include "reading/astrology_reading.hpp"
#include "reading/reading_json.hpp"
#include "report/chart_renderer.hpp"

#include <charconv>
#include <iostream>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

using namespace natal;

namespace
{

struct CliOptions
{
    chart::BirthData birth{};
    chart::ChartConfig config{};
    bool json{false};
    bool reading{false};
};

template <typename T>
std::optional<T> parse_number(std::string_view sv)
{
    T value{};
    const auto [ptr, ec] = std::from_chars(sv.data(), sv.data() + sv.size(), value);
    if (ec != std::errc{} || ptr != sv.data() + sv.size())
    {
        return std::nullopt;
    }
    return value;
}

template <typename T>
T require_number(std::string_view sv, const char* what)
{
    const auto value = parse_number<T>(sv);
    if (!value)
    {
        throw std::invalid_argument(std::string("Invalid ") + what + ": " + std::string(sv));
    }
    return *value;
}

void print_usage()
{
    std::cerr << "usage: natal_chart YEAR MONTH [DAY [HOUR [MINUTE [LAT [LON [TZ]]]]]]\n"
              << "                   [--json] [--reading] [--aspects PATH]\n";
}

std::optional<CliOptions> parse_args(int argc, char** argv)
{
    CliOptions options;
    std::vector<std::string_view> positional;

    for (int i = 1; i < argc; ++i)
    {
        const std::string_view arg{argv[i]};
        if (arg == "--json")
        {
            options.json = true;
        }
        else if (arg == "--reading")
        {
            options.reading = true;
        }
        else if (arg == "--aspects" && i + 1 < argc)
        {
            options.config.aspect_table_path = argv[++i];
            options.config.use_builtin_aspects_on_failure = false;
        }
        else if (arg == "--help" || arg == "-h")
        {
            return std::nullopt;
        }
        else
        {
            positional.push_back(arg);
        }
    }

    if (positional.size() < 2 || positional.size() > 8)
    {
        return std::nullopt;
    }

    auto& b = options.birth;
    b.year  = require_number<i32>(positional[0], "year");
    b.month = require_number<i32>(positional[1], "month");
    if (positional.size() > 2) b.day       = require_number<i32>(positional[2], "day");
    if (positional.size() > 3) b.hour      = require_number<i32>(positional[3], "hour");
    if (positional.size() > 4) b.minute    = require_number<i32>(positional[4], "minute");
    if (positional.size() > 5) b.latitude  = require_number<f64>(positional[5], "latitude");
    if (positional.size() > 6) b.longitude = require_number<f64>(positional[6], "longitude");
    if (positional.size() > 7) b.timezone  = require_number<f64>(positional[7], "timezone");

    return options;
}

int run(const CliOptions& options)
{
    const reading::AstrologyEngine engine{chart::ChartCalculator{options.config}};
    const report::ChartRenderer renderer;

    reading::AstrologyReadingState state = engine.start_reading(options.birth);

    if (!options.reading)
    {
        if (options.json)
        {
            std::cout << chart::json(*state.chart).dump(2) << '\n';
        }
        else
        {
            renderer.renderChart(std::cout, *state.chart);
        }
        return 0;
    }

    const int total = static_cast<int>(reading::AstrologyEngine::reveal_order().size());
    int step = 0;
    while (const auto reveal = engine.get_next_reveal(state))
    {
        ++step;
        if (!options.json)
        {
            renderer.renderReveal(std::cout, *reveal, step, total);
        }
        state = engine.record_feedback(state, reveal->point, reading::FeedbackEntry{
            .element   = reveal->point,
            .user_text = "revealed from the command line",
            .timestamp = reading::Clock::now(),
        });
    }

    const reading::ReadingSynthesis synthesis = engine.get_synthesis(state);
    if (options.json)
    {
        std::cout << reading::json{
            {"birthData", state.birth_data},
            {"chart", *state.chart},
            {"synthesis", synthesis},
            {"feedback", state.feedback},
        }.dump(2) << '\n';
    }
    else
    {
        renderer.renderSynthesis(std::cout, synthesis);
    }

    NATAL_INFO("Reading complete after {} reveals", step);
    return 0;
}

} // anonymous namespace

int main(int argc, char** argv)
{
    core::Logger::init();

    int status = 0;
    try
    {
        const auto options = parse_args(argc, argv);
        if (!options)
        {
            print_usage();
            status = 2;
        }
        else
        {
            status = run(*options);
        }
    }
    catch (const InvalidBirthData& e)
    {
        NATAL_ERROR("Invalid birth data: {}", e.what());
        status = 2;
    }
    catch (const std::exception& e)
    {
        NATAL_CRITICAL("{}", e.what());
        status = 1;
    }

    core::Logger::shutdown();
    return status;
}
