#include <SDL.h>

#include <algorithm>
#include <cstdlib>
#include <exception>
#include <memory>
#include <string>

#include "animation/animation_driver.hpp"
#include "animation/frame_scheduler.hpp"
#include "compositor/overlay_compositor.hpp"
#include "config/sheet_config.hpp"
#include "layout/layout_node.hpp"
#include "sheet/persistent_sheet.hpp"
#include "sheet/sheet_theme.hpp"
#include "utils/log.hpp"

namespace {

constexpr int kWindowWidth = 1024;
constexpr int kWindowHeight = 768;
constexpr float kContentHeight = 420.0f;
constexpr float kNavigationBarHeight = 64.0f;
constexpr float kRowHeight = 56.0f;

std::string config_path() {
        if (const char* v = std::getenv("SHEET_CONFIG")) {
                if (*v) {
                        return v;
                }
        }
        return "sheet_config.json";
}

// Base layer: fills the window and keeps the placeholder at its bottom edge
// so its own content ends where the collapsed sheet begins.
class BaseLayer : public sheet::LayoutNode {
public:
        BaseLayer() : LayoutNode("base") {}

        void set_placeholder(sheet::LayoutNode* placeholder) { placeholder_ = placeholder; }

        void paint(SDL_Renderer* renderer) const override {
                const SDL_FRect area = bounds();
                const float reserved = placeholder_ ? placeholder_->size().h : 0.0f;
                sheet::fill_rect(renderer, SDL_FRect{area.x, area.y, area.w, std::max(0.0f, area.h - reserved)},
                                 sheet::rgba(236, 239, 241));
                for (float y = area.y + 24.0f; y + 40.0f < area.y + area.h - reserved; y += 64.0f) {
                        sheet::fill_rect(renderer, SDL_FRect{area.x + 24.0f, y, area.w - 48.0f, 40.0f},
                                         sheet::rgba(207, 216, 220));
                }
        }

protected:
        sheet::Size perform_layout(const sheet::BoxConstraints& constraints) override {
                const sheet::Size size = constraints.biggest();
                if (placeholder_) {
                        const sheet::Size held = placeholder_->layout(
                                sheet::BoxConstraints{size.w, size.w, 0.0f, size.h});
                        placeholder_->set_position(0.0f, size.h - held.h);
                }
                return size;
        }

private:
        sheet::LayoutNode* placeholder_ = nullptr;
};

void run(SDL_Window* window, SDL_Renderer* renderer) {
        const sheet::SheetConfig config = sheet::load_sheet_config(config_path());

        sheet::FrameScheduler scheduler;
        sheet::AnimationDriver driver(config.animation.enter_duration, config.animation.exit_duration, &scheduler, "sheet");
        driver.set_fling_settings(sheet::fling_settings(config));

        sheet::CallbackNode content(
                "content",
                [](const sheet::BoxConstraints& c) {
                        return sheet::Size{c.has_bounded_width() ? c.max_w : 0.0f, kContentHeight};
                },
                [](SDL_Renderer* r, const SDL_FRect& rect) {
                        for (float y = rect.y + 8.0f; y + kRowHeight <= rect.y + kContentHeight; y += kRowHeight + 8.0f) {
                                sheet::fill_rect(r, SDL_FRect{rect.x + 16.0f, y, rect.w - 32.0f, kRowHeight},
                                                 sheet::rgba(232, 222, 248));
                        }
                });
        sheet::BoxNode navigation_bar("navigation_bar", std::nullopt, kNavigationBarHeight, sheet::rgba(243, 237, 247));
        BaseLayer base;

        const sheet::ResolvedSheetStyle style = sheet::resolve_sheet_style(sheet::SheetStyle{}, sheet::sheet_theme(config));
        sheet::PersistentSheet bottom_sheet(&driver, &content, sheet::persistent_sheet_options(config), style);
        bottom_sheet.set_navigation_bar(&navigation_bar);
        bottom_sheet.set_on_closing([]() { sheet::log::info("[Main] sheet closing."); });

        sheet::OverlayCompositor compositor(
                [&bottom_sheet](int index, sheet::BottomSheetDimensions& dimensions) -> sheet::LayoutNode* {
                        if (index != 0) {
                                return nullptr;
                        }
                        bottom_sheet.set_dimensions_sink(&dimensions);
                        return &bottom_sheet;
                },
                [&base](sheet::LayoutNode& placeholder) -> sheet::LayoutNode* {
                        base.set_placeholder(&placeholder);
                        return &base;
                });
        compositor.build();
        bottom_sheet.set_on_needs_layout([&compositor]() { compositor.mark_needs_layout(); });

        int window_w = 0;
        int window_h = 0;
        SDL_GetWindowSize(window, &window_w, &window_h);
        bottom_sheet.set_touch_surface_size(window_w, window_h);

        constexpr double TARGET_FPS = 60.0;
        constexpr double TARGET_FRAME_SECONDS = 1.0 / TARGET_FPS;
        constexpr double MAX_FRAME_SECONDS = 0.1;
        const double perf_frequency = static_cast<double>(SDL_GetPerformanceFrequency());
        const double target_counts = TARGET_FRAME_SECONDS * perf_frequency;

        Uint64 previous = SDL_GetPerformanceCounter();
        bool quit = false;
        SDL_Event e;

        sheet::log::info("[Main] Loop started. Space toggles the sheet, Escape quits.");

        while (!quit) {
                const Uint64 frame_begin = SDL_GetPerformanceCounter();
                const double dt = std::min(MAX_FRAME_SECONDS,
                                           static_cast<double>(frame_begin - previous) / perf_frequency);
                previous = frame_begin;

                while (SDL_PollEvent(&e)) {
                        if (e.type == SDL_QUIT) {
                                quit = true;
                                continue;
                        }
                        if (e.type == SDL_WINDOWEVENT && e.window.event == SDL_WINDOWEVENT_SIZE_CHANGED) {
                                SDL_GetWindowSize(window, &window_w, &window_h);
                                bottom_sheet.set_touch_surface_size(window_w, window_h);
                                compositor.mark_needs_layout();
                        }
                        if (e.type == SDL_KEYDOWN && !e.key.repeat) {
                                if (e.key.keysym.sym == SDLK_ESCAPE) {
                                        quit = true;
                                        continue;
                                }
                                if (e.key.keysym.sym == SDLK_SPACE) {
                                        driver.toggle();
                                        continue;
                                }
                        }
                        compositor.handle_event(e);
                }

                if (scheduler.advance(dt)) {
                        compositor.mark_needs_layout();
                }

                int output_w = 0;
                int output_h = 0;
                SDL_GetRendererOutputSize(renderer, &output_w, &output_h);
                compositor.layout_if_needed(sheet::Size{static_cast<float>(output_w), static_cast<float>(output_h)});

                SDL_SetRenderDrawColor(renderer, 255, 255, 255, 255);
                SDL_RenderClear(renderer);
                compositor.paint(renderer);
                SDL_RenderPresent(renderer);

                const Uint64 frame_end = SDL_GetPerformanceCounter();
                const double work_counts = static_cast<double>(frame_end - frame_begin);
                if (work_counts < target_counts) {
                        const double remaining_ms = ((target_counts - work_counts) * 1000.0) / perf_frequency;
                        if (remaining_ms >= 1.0) {
                                SDL_Delay(static_cast<Uint32>(remaining_ms));
                        }
                }
        }
}

}

int main(int, char*[]) {
        sheet::log::info("[Main] Starting sheet demo...");

        if (SDL_Init(SDL_INIT_VIDEO) < 0) {
                sheet::log::error(std::string("SDL_Init failed: ") + SDL_GetError());
                return 1;
        }

        SDL_Window* window = SDL_CreateWindow("Persistent Sheet", SDL_WINDOWPOS_CENTERED, SDL_WINDOWPOS_CENTERED,
                                              kWindowWidth, kWindowHeight, SDL_WINDOW_RESIZABLE);
        if (!window) {
                sheet::log::error(std::string("SDL_CreateWindow failed: ") + SDL_GetError());
                SDL_Quit();
                return 1;
        }

        SDL_Renderer* renderer =
                SDL_CreateRenderer(window, -1, SDL_RENDERER_ACCELERATED | SDL_RENDERER_PRESENTVSYNC);
        if (!renderer) {
                sheet::log::error(std::string("SDL_CreateRenderer failed: ") + SDL_GetError());
                SDL_DestroyWindow(window);
                SDL_Quit();
                return 1;
        }

        SDL_RendererInfo info;
        SDL_GetRendererInfo(renderer, &info);
        sheet::log::info(std::string("[Main] Renderer: ") + (info.name ? info.name : "Unknown"));

        int exit_code = 0;
        try {
                run(window, renderer);
        } catch (const std::exception& ex) {
                sheet::log::error(std::string("[Main] ") + ex.what());
                exit_code = 1;
        }

        SDL_DestroyRenderer(renderer);
        SDL_DestroyWindow(window);
        SDL_Quit();
        sheet::log::info("[Main] Demo exited with code " + std::to_string(exit_code) + ".");
        return exit_code;
}
