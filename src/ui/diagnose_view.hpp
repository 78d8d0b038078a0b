#pragma once

#include "core/diagnostics.hpp"

#include <ftxui/dom/elements.hpp>
#include <string>

class DiagnoseView {
public:
    explicit DiagnoseView(DiagnoseReport report);

    ftxui::Element render() const;

    /// Renders into a fixed-width screen and returns its text.
    std::string to_string(int width = 80) const;

    const DiagnoseReport& report() const { return report_; }

private:
    DiagnoseReport report_;

    static std::string format_ports(const std::vector<int>& ports);
};
