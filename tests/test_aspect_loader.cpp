/// @file test_aspect_loader.cpp
/// @brief Unit tests for natal::catalog::AspectLoader.
///
/// Verifies CSV parsing, skipping of malformed rows, error handling,
/// and that the shipped table matches the built-in definitions.

#define DOCTEST_CONFIG_IMPLEMENT
#include <doctest/doctest.h>

#include "catalog/aspect_loader.hpp"
#include "chart/aspects.hpp"
#include "chart/natal_chart.hpp"
#include "core/logger.hpp"
#include "core/types.hpp"

#include <filesystem>
#include <fstream>
#include <stdexcept>
#include <string>

using namespace natal;
using namespace natal::catalog;

// =================================================================
// Custom main: initialize logger before tests
// =================================================================

int main(int argc, char** argv)
{
    natal::core::Logger::init();
    const int result = doctest::Context(argc, argv).run();
    natal::core::Logger::shutdown();
    return result;
}

// =================================================================
// Helper: create a temporary CSV file for testing
// =================================================================

class TempCsvFile
{
public:
    explicit TempCsvFile(const std::string& filename, const std::string& content)
        : m_path(std::filesystem::temp_directory_path() / filename)
    {
        std::ofstream file(m_path);
        file << content;
    }

    ~TempCsvFile()
    {
        std::filesystem::remove(m_path);
    }

    [[nodiscard]] const std::filesystem::path& path() const { return m_path; }

    TempCsvFile(const TempCsvFile&) = delete;
    TempCsvFile& operator=(const TempCsvFile&) = delete;

private:
    std::filesystem::path m_path;
};

// =================================================================
// Well-formed tables
// =================================================================

TEST_CASE("Load a small aspect table")
{
    const TempCsvFile csv("natal_test_small.csv",
        "id,name,symbol,degrees,orb,nature\n"
        "conjunction,Conjunction,☌,0,8,neutral\n"
        "trine, Trine ,△,120,7.5,harmonious\n");

    const auto result = AspectLoader::load_csv(csv.path());
    REQUIRE(result.has_value());
    REQUIRE(result->size() == 2);

    const chart::AspectDefinition& trine = (*result)[1];
    CHECK(trine.id == "trine");
    CHECK(trine.name == "Trine");
    CHECK(trine.symbol == "△");
    CHECK(trine.degrees == doctest::Approx(120.0));
    CHECK(trine.orb == doctest::Approx(7.5));
    CHECK(trine.nature == chart::AspectNature::Harmonious);
}

TEST_CASE("Row order is preserved")
{
    const TempCsvFile csv("natal_test_order.csv",
        "id,name,symbol,degrees,orb,nature\n"
        "opposition,Opposition,o,180,8,challenging\n"
        "conjunction,Conjunction,c,0,8,neutral\n"
        "square,Square,q,90,8,challenging\n");

    const auto result = AspectLoader::load_csv(csv.path());
    REQUIRE(result.has_value());
    REQUIRE(result->size() == 3);
    CHECK((*result)[0].id == "opposition");
    CHECK((*result)[1].id == "conjunction");
    CHECK((*result)[2].id == "square");
}

TEST_CASE("Blank lines, comments and CRLF endings are tolerated")
{
    const TempCsvFile csv("natal_test_crlf.csv",
        "id,name,symbol,degrees,orb,nature\r\n"
        "\r\n"
        "# minor aspects\r\n"
        "quincunx,Quincunx,⚻,150,3,challenging\r\n");

    const auto result = AspectLoader::load_csv(csv.path());
    REQUIRE(result.has_value());
    REQUIRE(result->size() == 1);
    CHECK((*result)[0].nature == chart::AspectNature::Challenging);
    CHECK((*result)[0].orb == doctest::Approx(3.0));
}

// =================================================================
// Malformed rows
// =================================================================

TEST_CASE("Malformed rows are skipped")
{
    const TempCsvFile csv("natal_test_malformed.csv",
        "id,name,symbol,degrees,orb,nature\n"
        "sextile,Sextile,⚹,60,6,harmonious\n"
        "broken,Broken\n"
        "square,Square,□,ninety,8,challenging\n"
        "odd,Odd,?,45,2,spicy\n"
        ",Nameless,?,45,2,neutral\n"
        "wide,Wide,?,200,2,neutral\n"
        "negative,Negative,?,45,-1,neutral\n"
        "trine,Trine,△,120,8,harmonious\n");

    const auto result = AspectLoader::load_csv(csv.path());
    REQUIRE(result.has_value());
    REQUIRE(result->size() == 2);
    CHECK((*result)[0].id == "sextile");
    CHECK((*result)[1].id == "trine");
}

// =================================================================
// Failures
// =================================================================

TEST_CASE("Missing file returns nullopt")
{
    const auto result = AspectLoader::load_csv("/nonexistent/path/aspects.csv");
    CHECK_FALSE(result.has_value());
}

TEST_CASE("Empty file returns nullopt")
{
    const TempCsvFile csv("natal_test_empty.csv", "");
    CHECK_FALSE(AspectLoader::load_csv(csv.path()).has_value());
}

TEST_CASE("Header-only file returns nullopt")
{
    const TempCsvFile csv("natal_test_header.csv", "id,name,symbol,degrees,orb,nature\n");
    CHECK_FALSE(AspectLoader::load_csv(csv.path()).has_value());
}

// =================================================================
// Shipped table and calculator configuration
// =================================================================

TEST_CASE("Shipped aspects.csv matches the built-in table")
{
    const auto result = AspectLoader::load_csv(NATAL_DATA_DIR "/aspects.csv");
    REQUIRE(result.has_value());

    const chart::AspectTable builtin = chart::AspectTable::builtin();
    REQUIRE(result->size() == builtin.size());

    for (std::size_t i = 0; i < builtin.size(); ++i)
    {
        const chart::AspectDefinition& loaded = (*result)[i];
        const chart::AspectDefinition& expected = builtin.definitions()[i];
        CHECK(loaded.id == expected.id);
        CHECK(loaded.name == expected.name);
        CHECK(loaded.symbol == expected.symbol);
        CHECK(loaded.degrees == expected.degrees);
        CHECK(loaded.orb == expected.orb);
        CHECK(loaded.nature == expected.nature);
    }
}

TEST_CASE("ChartCalculator loads its table from the configured path")
{
    const TempCsvFile csv("natal_test_config.csv",
        "id,name,symbol,degrees,orb,nature\n"
        "conjunction,Conjunction,☌,0,10,neutral\n");

    const chart::ChartCalculator calc(chart::ChartConfig{
        .aspect_table_path              = csv.path(),
        .use_builtin_aspects_on_failure = false,
    });
    REQUIRE(calc.aspect_table().size() == 1);
    CHECK(calc.aspect_table().definitions()[0].orb == doctest::Approx(10.0));
}

TEST_CASE("ChartCalculator falls back to the built-in table when allowed")
{
    const chart::ChartCalculator calc(chart::ChartConfig{
        .aspect_table_path              = "/nonexistent/aspects.csv",
        .use_builtin_aspects_on_failure = true,
    });
    CHECK(calc.aspect_table().size() == chart::AspectTable::builtin().size());
}

TEST_CASE("ChartCalculator refuses a missing table without fallback")
{
    const chart::ChartConfig config{
        .aspect_table_path              = "/nonexistent/aspects.csv",
        .use_builtin_aspects_on_failure = false,
    };
    CHECK_THROWS_AS(chart::ChartCalculator{config}, std::runtime_error);
}
