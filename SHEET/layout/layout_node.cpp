#include "layout_node.hpp"

#include <algorithm>
#include <cmath>
#include <utility>

namespace sheet {

LayoutNode::LayoutNode(std::string name) : name_(std::move(name)) {}

Size LayoutNode::layout(const BoxConstraints& constraints) {
    constraints_ = constraints;
    Size measured = constraints.constrain(perform_layout(constraints));
    if (!std::isfinite(measured.w) || measured.w < 0.0f) measured.w = 0.0f;
    if (!std::isfinite(measured.h) || measured.h < 0.0f) measured.h = 0.0f;
    size_ = measured;
    has_layout_ = true;
    return size_;
}

void LayoutNode::set_position(float x, float y) {
    position_ = SDL_FPoint{x, y};
}

void LayoutNode::paint(SDL_Renderer*) const {}

bool LayoutNode::handle_event(const SDL_Event&) { return false; }

BoxNode::BoxNode(std::string name, std::optional<float> preferred_width, float preferred_height, SDL_Color fill)
    : LayoutNode(std::move(name)),
      preferred_width_(preferred_width),
      preferred_height_(preferred_height),
      fill_(fill) {}

void BoxNode::set_opacity(float opacity) {
    opacity_ = std::clamp(opacity, 0.0f, 1.0f);
}

Size BoxNode::perform_layout(const BoxConstraints& constraints) {
    const float width = preferred_width_ ? *preferred_width_
                                         : (constraints.has_bounded_width() ? constraints.max_w : constraints.min_w);
    return Size{width, preferred_height_};
}

void BoxNode::paint(SDL_Renderer* renderer) const {
    fill_rect(renderer, bounds(), fill_, opacity_);
}

CallbackNode::CallbackNode(std::string name, MeasureFunction measure, PaintFunction paint)
    : LayoutNode(std::move(name)),
      measure_(std::move(measure)),
      paint_(std::move(paint)) {}

Size CallbackNode::perform_layout(const BoxConstraints& constraints) {
    return measure_ ? measure_(constraints) : constraints.smallest();
}

void CallbackNode::paint(SDL_Renderer* renderer) const {
    if (paint_) {
        paint_(renderer, bounds());
    }
}

bool CallbackNode::handle_event(const SDL_Event& e) {
    return event_function_ ? event_function_(e) : false;
}

void fill_rect(SDL_Renderer* renderer, const SDL_FRect& rect, SDL_Color color, float opacity) {
    if (!renderer || rect.w <= 0.0f || rect.h <= 0.0f) {
        return;
    }
    const float alpha = static_cast<float>(color.a) * std::clamp(opacity, 0.0f, 1.0f);
    if (alpha <= 0.0f) {
        return;
    }
    SDL_SetRenderDrawBlendMode(renderer, SDL_BLENDMODE_BLEND);
    SDL_SetRenderDrawColor(renderer, color.r, color.g, color.b, static_cast<Uint8>(std::lround(alpha)));
    SDL_RenderFillRectF(renderer, &rect);
}

}
