#pragma once

#include <SDL.h>

#include <functional>
#include <optional>
#include <string>

#include "box_constraints.hpp"

namespace sheet {

// A participant in a layout pass: measured by its parent, then positioned,
// then painted. Parents decide the order of all three.
class LayoutNode {
public:
    explicit LayoutNode(std::string name = "node");
    virtual ~LayoutNode() = default;

    Size layout(const BoxConstraints& constraints);
    void set_position(float x, float y);

    const Size& size() const { return size_; }
    SDL_FPoint position() const { return position_; }
    SDL_FRect bounds() const { return SDL_FRect{position_.x, position_.y, size_.w, size_.h}; }
    const BoxConstraints& constraints() const { return constraints_; }
    bool has_layout() const { return has_layout_; }

    virtual void paint(SDL_Renderer* renderer) const;
    virtual bool handle_event(const SDL_Event& e);

    const std::string& name() const { return name_; }

protected:
    virtual Size perform_layout(const BoxConstraints& constraints) = 0;

private:
    std::string name_;
    Size size_{};
    SDL_FPoint position_{0.0f, 0.0f};
    BoxConstraints constraints_{};
    bool has_layout_ = false;
};

// Flat filled box with a preferred size. An unset preferred width fills the
// available width.
class BoxNode : public LayoutNode {
public:
    BoxNode(std::string name, std::optional<float> preferred_width, float preferred_height, SDL_Color fill);

    void set_preferred_height(float h) { preferred_height_ = h; }
    float preferred_height() const { return preferred_height_; }
    void set_fill(SDL_Color fill) { fill_ = fill; }
    SDL_Color fill() const { return fill_; }
    // Alpha multiplier in [0,1] applied when painting.
    void set_opacity(float opacity);
    float opacity() const { return opacity_; }

    void paint(SDL_Renderer* renderer) const override;

protected:
    Size perform_layout(const BoxConstraints& constraints) override;

private:
    std::optional<float> preferred_width_;
    float preferred_height_;
    SDL_Color fill_;
    float opacity_ = 1.0f;
};

// Node whose measuring and painting are supplied as callbacks.
class CallbackNode : public LayoutNode {
public:
    using MeasureFunction = std::function<Size(const BoxConstraints&)>;
    using PaintFunction = std::function<void(SDL_Renderer*, const SDL_FRect&)>;
    using EventFunction = std::function<bool(const SDL_Event&)>;

    CallbackNode(std::string name, MeasureFunction measure, PaintFunction paint = {});

    void set_event_function(EventFunction fn) { event_function_ = std::move(fn); }

    void paint(SDL_Renderer* renderer) const override;
    bool handle_event(const SDL_Event& e) override;

protected:
    Size perform_layout(const BoxConstraints& constraints) override;

private:
    MeasureFunction measure_;
    PaintFunction paint_;
    EventFunction event_function_{};
};

void fill_rect(SDL_Renderer* renderer, const SDL_FRect& rect, SDL_Color color, float opacity = 1.0f);

}
