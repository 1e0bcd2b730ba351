#pragma once
// report/chart_renderer.hpp - Console chart report
//
// Prints a natal chart, individual reveals and the reading synthesis as
// boxed text panels.  Plain ASCII so it works on any POSIX terminal.

#include "chart/natal_chart.hpp"
#include "reading/astrology_reading.hpp"
#include <ostream>
#include <string>

namespace natal::report {

// -----------------------------------------------------------------------
// ChartRenderer
// -----------------------------------------------------------------------
class ChartRenderer {
public:
    /// Width of the rendered panel (characters)
    int panel_w{72};

    /// Maximum number of aspects listed in the chart panel
    int max_aspects{12};

    /// Print planets, angles, house cusps and the tightest aspects.
    void renderChart(std::ostream& out, const chart::NatalChart& chart,
                     const std::string& title = "") const;

    /// Print one reveal step ("3/11  Ascendant  Libra 12.40 deg  house 1").
    void renderReveal(std::ostream& out, const reading::Reveal& reveal,
                      int step, int total) const;

    /// Print the synthesis summary panel.
    void renderSynthesis(std::ostream& out,
                         const reading::ReadingSynthesis& synthesis) const;

    /// "12.40 deg Libra" style label for a sign position.
    static std::string formatPosition(chart::Sign sign, double degrees);

private:
    void hline(std::ostream& out, char c = '-') const;
    void row(std::ostream& out, const std::string& lbl,
             const std::string& val) const;
};

} // namespace natal::report
