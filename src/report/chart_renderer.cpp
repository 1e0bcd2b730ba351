// report/chart_renderer.cpp
#include "report/chart_renderer.hpp"
#include <algorithm>
#include <iomanip>
#include <sstream>

namespace natal::report {

namespace {

std::string fmtd(double v, int prec = 2) {
    std::ostringstream ss;
    ss << std::fixed << std::setprecision(prec) << v;
    return ss.str();
}

std::string pointLabel(chart::ChartPoint p) {
    std::string s{chart::point_name(p)};
    if (!s.empty()) s[0] = static_cast<char>(s[0] - 'a' + 'A');
    return s;
}

} // namespace

void ChartRenderer::hline(std::ostream& out, char c) const {
    out << '+';
    for (int i = 0; i < panel_w - 2; ++i) out << c;
    out << '+' << '\n';
}

void ChartRenderer::row(std::ostream& out, const std::string& lbl,
                        const std::string& val) const {
    out << "| " << std::left << std::setw(16) << lbl
        << " : " << std::left << std::setw(panel_w - 22) << val
        << "|\n";
}

std::string ChartRenderer::formatPosition(chart::Sign sign, double degrees) {
    return fmtd(degrees) + " deg " + chart::sign_display_name(sign);
}

// -----------------------------------------------------------------------
// renderChart
// -----------------------------------------------------------------------
void ChartRenderer::renderChart(std::ostream& out,
                                const chart::NatalChart& chart,
                                const std::string& title) const {
    hline(out, '=');
    out << "| " << std::left << std::setw(panel_w - 4)
        << (title.empty() ? std::string("NATAL CHART") : title) << " |\n";
    hline(out, '-');

    for (const auto& p : chart.planets) {
        std::string val = formatPosition(p.sign, p.degrees)
                        + "  house " + std::to_string(p.house);
        if (p.retrograde) val += "  R";
        row(out, pointLabel(p.planet), val);
    }
    hline(out, '-');
    row(out, "Ascendant", formatPosition(chart.ascendant.sign, chart.ascendant.degrees));
    row(out, "Midheaven", formatPosition(chart.midheaven.sign, chart.midheaven.degrees));
    row(out, "Julian Day", fmtd(chart.julian_day, 5));
    hline(out, '-');

    for (std::size_t i = 0; i < chart.house_cusps.size(); ++i) {
        const auto cusp = chart::degrees_to_sign(chart.house_cusps[i]);
        row(out, "House " + std::to_string(i + 1),
            formatPosition(cusp.sign, cusp.degrees));
    }
    hline(out, '-');

    const auto n = std::min(chart.aspects.size(),
                            static_cast<std::size_t>(max_aspects));
    if (n == 0) {
        row(out, "Aspects", "none within orb");
    }
    for (std::size_t i = 0; i < n; ++i) {
        const auto& a = chart.aspects[i];
        row(out, pointLabel(a.planet1) + "/" + pointLabel(a.planet2),
            a.aspect_name + "  orb " + fmtd(a.orb) + "  ("
            + std::string(chart::nature_name(a.nature)) + ")");
    }
    hline(out, '=');
}

// -----------------------------------------------------------------------
// renderReveal
// -----------------------------------------------------------------------
void ChartRenderer::renderReveal(std::ostream& out,
                                 const reading::Reveal& reveal,
                                 int step, int total) const {
    const auto& p = reveal.position;
    out << std::right << std::setw(2) << step << '/' << total << "  "
        << std::left << std::setw(10) << pointLabel(reveal.point)
        << formatPosition(p.sign, p.degrees)
        << "  house " << p.house
        << (p.retrograde ? "  (retrograde)" : "") << '\n';
}

// -----------------------------------------------------------------------
// renderSynthesis
// -----------------------------------------------------------------------
void ChartRenderer::renderSynthesis(std::ostream& out,
                                    const reading::ReadingSynthesis& s) const {
    hline(out, '=');
    out << "| " << std::left << std::setw(panel_w - 4) << "READING SYNTHESIS" << " |\n";
    hline(out, '-');
    row(out, "Sun", chart::sign_display_name(s.sun_sign));
    row(out, "Moon", chart::sign_display_name(s.moon_sign));
    row(out, "Rising", chart::sign_display_name(s.ascendant_sign));
    row(out, "Elements",
        "fire " + std::to_string(s.element_counts[0])
        + " | earth " + std::to_string(s.element_counts[1])
        + " | air " + std::to_string(s.element_counts[2])
        + " | water " + std::to_string(s.element_counts[3]));
    row(out, "Modalities",
        "cardinal " + std::to_string(s.modality_counts[0])
        + " | fixed " + std::to_string(s.modality_counts[1])
        + " | mutable " + std::to_string(s.modality_counts[2]));
    row(out, "Dominant",
        std::string(chart::element_name(s.dominant_element)) + ", "
        + std::string(chart::modality_name(s.dominant_modality)));
    row(out, "Revealed", std::to_string(s.revealed.size()) + " of 11"
        + (s.complete ? " (complete)" : ""));
    row(out, "Feedback", std::to_string(s.feedback_count) + " entries");
    hline(out, '=');
}

} // namespace natal::report
