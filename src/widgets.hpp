#ifndef WIDGETS_HPP
#define WIDGETS_HPP

#include <array>        // for array
#include <functional>   // for function
#include <string>       // for string
#include <string_view>  // for string_view
#include <vector>       // for vector

#include <ftxui/component/component_base.hpp>  // for Component
#include <ftxui/dom/elements.hpp>              // for size, GREATER_THAN

namespace tui {
namespace detail {
    inline constexpr std::string_view kWidgetTitle{"Btrfs Subvolume Migration"};

    auto centered_widget(ftxui::Component& container, std::string_view title, const ftxui::Element& widget) noexcept -> ftxui::Element;
    auto centered_widget_nocontrols(std::string_view title, const ftxui::Element& widget) noexcept -> ftxui::Element;
    auto controls_widget(const std::array<std::string_view, 2>&& titles, const std::array<std::function<void()>, 2>&& callbacks) noexcept -> ftxui::Component;
    auto multiline_text(const std::vector<std::string>& lines) noexcept -> ftxui::Element;
    bool yesno_widget(std::string_view content, ftxui::Decorator boxsize = size(ftxui::HEIGHT, ftxui::GREATER_THAN, 5)) noexcept;
    void summary_widget(std::string_view header, const std::vector<std::string>& lines) noexcept;
}  // namespace detail
}  // namespace tui

#endif  // WIDGETS_HPP
