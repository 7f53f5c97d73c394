#pragma once

#include <SDL.h>

#include <algorithm>
#include <initializer_list>
#include <optional>

#include "layout/box_constraints.hpp"

namespace sheet {

inline SDL_Color rgba(Uint8 r, Uint8 g, Uint8 b, Uint8 a = 255) {
    return SDL_Color{r, g, b, a};
}

// First engaged candidate, or `fallback` when none is.
template <typename T>
T first_of(std::initializer_list<std::optional<T>> candidates, const T& fallback) {
    for (const auto& candidate : candidates) {
        if (candidate) {
            return *candidate;
        }
    }
    return fallback;
}

constexpr float kMinInteractiveDimension = 48.0f;
constexpr float kDefaultMaxSheetWidth = 640.0f;

// Per-sheet overrides. Unset fields fall through to the theme.
struct SheetStyle {
    std::optional<SDL_Color> background;
    std::optional<SDL_Color> backdrop;
    std::optional<SDL_Color> drag_handle;
    std::optional<SDL_Color> drag_handle_active;
    std::optional<Size> drag_handle_size;
    std::optional<float> max_width;
    std::optional<bool> show_drag_handle;
};

// Application-wide values. Unset fields fall through to the defaults.
struct SheetTheme {
    std::optional<SDL_Color> background;
    std::optional<SDL_Color> backdrop;
    std::optional<SDL_Color> drag_handle;
    std::optional<SDL_Color> drag_handle_active;
    std::optional<Size> drag_handle_size;
    std::optional<float> max_width;
    std::optional<bool> show_drag_handle;
};

struct ResolvedSheetStyle {
    SDL_Color background = rgba(247, 242, 250);
    SDL_Color backdrop = rgba(0, 0, 0);
    SDL_Color drag_handle = rgba(73, 69, 79, 102);
    SDL_Color drag_handle_active = rgba(73, 69, 79, 184);
    Size drag_handle_size{32.0f, 4.0f};
    float max_width = kDefaultMaxSheetWidth;
    // Explicit per-sheet choice; unset defers to the theme.
    std::optional<bool> show_drag_handle{};
    bool theme_shows_drag_handle = false;

    // Tappable box around the visible handle bar.
    Size drag_handle_box() const {
        return Size{std::max(drag_handle_size.w, kMinInteractiveDimension),
                    std::max(drag_handle_size.h, kMinInteractiveDimension)};
    }

    // The theme only contributes a handle to sheets that can be dragged.
    bool drag_handle_visible(bool enable_drag) const {
        return show_drag_handle.value_or(enable_drag && theme_shows_drag_handle);
    }
};

inline ResolvedSheetStyle resolve_sheet_style(const SheetStyle& style, const SheetTheme& theme = {}) {
    const ResolvedSheetStyle defaults{};
    ResolvedSheetStyle out;
    out.background = first_of({style.background, theme.background}, defaults.background);
    out.backdrop = first_of({style.backdrop, theme.backdrop}, defaults.backdrop);
    out.drag_handle = first_of({style.drag_handle, theme.drag_handle}, defaults.drag_handle);
    out.drag_handle_active = first_of({style.drag_handle_active, theme.drag_handle_active}, defaults.drag_handle_active);
    out.drag_handle_size = first_of({style.drag_handle_size, theme.drag_handle_size}, defaults.drag_handle_size);
    out.max_width = first_of({style.max_width, theme.max_width}, defaults.max_width);
    out.show_drag_handle = style.show_drag_handle;
    out.theme_shows_drag_handle = theme.show_drag_handle.value_or(defaults.theme_shows_drag_handle);
    return out;
}

}
