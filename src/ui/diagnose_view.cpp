#include "ui/diagnose_view.hpp"

#include <ftxui/dom/elements.hpp>
#include <ftxui/screen/screen.hpp>
#include <sstream>

using namespace ftxui;

DiagnoseView::DiagnoseView(DiagnoseReport report) : report_(std::move(report)) {}

std::string DiagnoseView::format_ports(const std::vector<int>& ports) {
    std::ostringstream oss;
    for (size_t i = 0; i < ports.size(); ++i) {
        if (i > 0) oss << ", ";
        oss << ports[i];
    }
    return oss.str();
}

static Element check_row(const EndpointCheck& check) {
    auto mark = check.reachable ? text(" OK  ") | color(Color::Green)
                                : text(" ERR ") | color(Color::Red);
    std::string status = check.status > 0 ? std::to_string(check.status) : "-";
    return hbox({
        mark | bold,
        text(check.name) | size(WIDTH, EQUAL, 28),
        text(status) | size(WIDTH, EQUAL, 5),
        text(check.url) | flex,
    });
}

Element DiagnoseView::render() const {
    Elements local_rows;
    for (const auto& check : report_.local_checks) {
        local_rows.push_back(check_row(check));
    }
    if (local_rows.empty()) local_rows.push_back(text(" not checked") | dim);

    Element ports;
    if (report_.live_ports.empty()) {
        ports = text(" no live debug ports among " + std::to_string(report_.ports_scanned) +
                     " scanned (normal when no profile is running)") | dim;
    } else {
        ports = paragraph(" " + format_ports(report_.live_ports)) | color(Color::Green);
    }

    Element summary;
    switch (report_.exit_code()) {
        case 0:
            summary = text(" All APIs reachable") | color(Color::Green);
            break;
        case 1:
            summary = text(" Local API works, cloud API unreachable: profiles can start but not be created")
                      | color(Color::Yellow);
            break;
        default:
            summary = text(" Local API unreachable: start the Octo client and enable its local API")
                      | color(Color::Red);
            break;
    }

    Elements body = {
        text(" Local API") | bold,
        vbox(std::move(local_rows)),
        separator(),
        text(" Cloud API") | bold,
        report_.cloud_check.name.empty() ? text(" not checked") | dim
                                         : check_row(report_.cloud_check),
        separator(),
        text(" Debug ports") | bold,
        ports,
        separator(),
        summary | bold,
    };
    if (report_.cancelled) body.push_back(text(" (interrupted)") | dim);

    return window(text(" octoscan diagnose "), vbox(std::move(body)));
}

std::string DiagnoseView::to_string(int width) const {
    Element doc = render();
    auto screen = Screen::Create(Dimension::Fixed(width), Dimension::Fit(doc));
    Render(screen, doc);
    return screen.ToString();
}
