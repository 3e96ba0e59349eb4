#include "widgets.hpp"

// import btrmig
#include "btrmig/string_utils.hpp"

#include <algorithm>  // for transform
#include <iterator>   // for back_inserter
#include <string>     // for string
#include <utility>    // for move

#include <ftxui/component/component.hpp>           // for Renderer, Button
#include <ftxui/component/component_options.hpp>   // for ButtonOption
#include <ftxui/component/screen_interactive.hpp>  // for ScreenInteractive
#include <ftxui/dom/elements.hpp>                  // for operator|, Element
#include <ftxui/dom/node.hpp>                      // for Render
#include <ftxui/screen/screen.hpp>                 // for Screen

using namespace ftxui;

namespace tui::detail {

Element centered_widget(Component& container, std::string_view title, const Element& widget) noexcept {
    return vbox({
        //  -------- Title --------------
        text(std::string{title}) | bold,
        filler(),
        //  -------- Center Menu --------------
        hbox({
            filler(),
            border(vbox({
                widget,
                separator(),
                container->Render() | hcenter | size(HEIGHT, LESS_THAN, 3) | size(WIDTH, GREATER_THAN, 25),
            })),
            filler(),
        }) | center,
        filler(),
    });
}

Element centered_widget_nocontrols(std::string_view title, const Element& widget) noexcept {
    return vbox({
        text(std::string{title}) | bold,
        border(vbox({widget})),
    });
}

Component controls_widget(const std::array<std::string_view, 2>&& titles, const std::array<std::function<void()>, 2>&& callbacks) noexcept {
    /* clang-format off */
    auto button_ok       = Button(std::string{titles[0]}, callbacks[0], ButtonOption::WithoutBorder());
    auto button_quit     = Button(std::string{titles[1]}, callbacks[1], ButtonOption::WithoutBorder());
    /* clang-format on */

    auto container = Container::Horizontal({
        button_ok,
        Renderer([] { return filler() | size(WIDTH, GREATER_THAN, 3); }),
        button_quit,
    });

    return container;
}

Element multiline_text(const std::vector<std::string>& lines) noexcept {
    Elements multiline;

    std::transform(lines.cbegin(), lines.cend(), std::back_inserter(multiline),
        [=](const std::string& line) -> Element { return text(line); });
    return vbox(std::move(multiline)) | frame;
}

bool yesno_widget(std::string_view content, Decorator boxsize) noexcept {
    auto screen = ScreenInteractive::Fullscreen();

    bool success{};
    auto ok_callback = [&] {
        success = true;
        screen.ExitLoopClosure()();
    };
    auto controls_container = controls_widget({"Yes", "No"}, {ok_callback, screen.ExitLoopClosure()});

    auto controls = Renderer(controls_container, [&] {
        return controls_container->Render() | hcenter | size(HEIGHT, LESS_THAN, 3) | size(WIDTH, GREATER_THAN, 25);
    });

    auto container = Container::Horizontal({
        controls,
    });

    auto renderer = Renderer(container, [&] {
        return centered_widget(container, kWidgetTitle, multiline_text(btrmig::utils::make_multiline(content)) | hcenter | boxsize);
    });

    screen.Loop(renderer);
    return success;
}

// Prints once, the terminal keeps the report after exit
void summary_widget(std::string_view header, const std::vector<std::string>& lines) noexcept {
    auto element = centered_widget_nocontrols(kWidgetTitle, vbox({
                                                                  text(std::string{header}) | bold,
                                                                  separator(),
                                                                  multiline_text(lines),
                                                              }));

    auto screen = Screen::Create(
        Dimension::Full(),        // Width
        Dimension::Fit(element)   // Height
    );
    Render(screen, element);
    screen.Print();
}

}  // namespace tui::detail
