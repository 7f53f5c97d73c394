#include "overlay_compositor.hpp"

#include <algorithm>
#include <stdexcept>
#include <string>

#include "utils/log.hpp"

namespace sheet {

namespace {

constexpr int kMaxOverlays = 256;

}

PlaceholderNode::PlaceholderNode(const BottomSheetDimensions& dimensions)
    : LayoutNode("placeholder"), dimensions_(dimensions) {}

Size PlaceholderNode::perform_layout(const BoxConstraints& constraints) {
    const auto& min_height = dimensions_.min_height().get();
    if (!min_height) {
        return constraints.smallest();
    }
    const float h = std::clamp(*min_height, constraints.min_h, std::max(constraints.min_h, constraints.max_h));
    return BoxConstraints{constraints.min_w, constraints.max_w, h, h}.biggest();
}

OverlayCompositor::OverlayCompositor(OverlayFactory overlay_factory, BaseFactory base_factory)
    : overlay_factory_(std::move(overlay_factory)),
      base_factory_(std::move(base_factory)),
      placeholder_(std::make_unique<PlaceholderNode>(dimensions_)) {
    if (!overlay_factory_ || !base_factory_) {
        const std::string message = "OverlayCompositor requires an overlay factory and a base factory.";
        log::error("[OverlayCompositor] " + message);
        throw std::invalid_argument(message);
    }
    dimensions_listener_ = dimensions_.add_listener([this]() {
        // Changes made by overlays during our own pass are consumed by the
        // base later in that same pass.
        if (!in_layout_) {
            needs_layout_ = true;
        }
    });
}

OverlayCompositor::~OverlayCompositor() {
    dimensions_.remove_listener(dimensions_listener_);
}

void OverlayCompositor::build() {
    layout_order_.clear();
    paint_order_.clear();

    int index = 0;
    while (LayoutNode* overlay = overlay_factory_(index, dimensions_)) {
        layout_order_.push_back(overlay);
        if (++index >= kMaxOverlays) {
            log::warn("[OverlayCompositor] overlay factory produced " + std::to_string(kMaxOverlays) +
                      " layers without terminating; stopping.");
            break;
        }
    }
    overlay_count_ = layout_order_.size();

    LayoutNode* base = base_factory_(*placeholder_);
    if (base) {
        layout_order_.push_back(base);
    } else {
        log::warn("[OverlayCompositor] base factory returned no layer.");
    }

    paint_order_.assign(layout_order_.rbegin(), layout_order_.rend());
    ++build_count_;
}

void OverlayCompositor::layout(const Size& available) {
    build();
    in_layout_ = true;
    const BoxConstraints constraints = BoxConstraints::tight(available);
    for (LayoutNode* layer : layout_order_) {
        layer->layout(constraints);
        layer->set_position(0.0f, 0.0f);
    }
    in_layout_ = false;
    last_size_ = available;
    has_layout_ = true;
    needs_layout_ = false;
}

bool OverlayCompositor::layout_if_needed(const Size& available) {
    if (!needs_layout_ && has_layout_ && available == last_size_) {
        return false;
    }
    layout(available);
    return true;
}

void OverlayCompositor::paint(SDL_Renderer* renderer) const {
    for (const LayoutNode* layer : paint_order_) {
        layer->paint(renderer);
    }
}

bool OverlayCompositor::handle_event(const SDL_Event& e) {
    for (auto it = paint_order_.rbegin(); it != paint_order_.rend(); ++it) {
        if ((*it)->handle_event(e)) {
            return true;
        }
    }
    return false;
}

}
