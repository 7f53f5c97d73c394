#pragma once

#include <SDL.h>

#include <functional>
#include <memory>
#include <vector>

#include "layout/layout_node.hpp"
#include "layout/sheet_dimensions.hpp"

namespace sheet {

// Transparent node as tall as the sheet's collapsed extent. The base layer
// embeds it to keep its own content clear of the sheet.
class PlaceholderNode : public LayoutNode {
public:
    explicit PlaceholderNode(const BottomSheetDimensions& dimensions);

protected:
    Size perform_layout(const BoxConstraints& constraints) override;

private:
    const BottomSheetDimensions& dimensions_;
};

// Stacks overlay layers above one base layer. Layout runs overlays first (by
// ascending index) and the base last, so the base can read what the overlays
// measured. Painting runs the other way round: base first, then the overlays
// from the highest index down, leaving overlay 0 on top.
class OverlayCompositor {
public:
    // Called with 0, 1, 2, ... until it returns nullptr. Layers are not owned.
    using OverlayFactory = std::function<LayoutNode*(int index, BottomSheetDimensions& dimensions)>;
    using BaseFactory = std::function<LayoutNode*(LayoutNode& placeholder)>;

    // Throws std::invalid_argument when either factory is empty.
    OverlayCompositor(OverlayFactory overlay_factory, BaseFactory base_factory);
    ~OverlayCompositor();

    OverlayCompositor(const OverlayCompositor&) = delete;
    OverlayCompositor& operator=(const OverlayCompositor&) = delete;

    // Regenerates both order lists from the factories. Every layout pass
    // starts with a build, so layers the factories add or drop between passes
    // take part in the next pass. Calling it directly refreshes the lists
    // without laying anything out.
    void build();
    int build_count() const { return build_count_; }

    void layout(const Size& available);
    bool layout_if_needed(const Size& available);
    void paint(SDL_Renderer* renderer) const;
    // Offers the event to the topmost layer first.
    bool handle_event(const SDL_Event& e);

    void mark_needs_layout() { needs_layout_ = true; }
    bool needs_layout() const { return needs_layout_; }

    const std::vector<LayoutNode*>& layout_order() const { return layout_order_; }
    const std::vector<LayoutNode*>& paint_order() const { return paint_order_; }
    size_t overlay_count() const { return overlay_count_; }

    BottomSheetDimensions& dimensions() { return dimensions_; }
    const BottomSheetDimensions& dimensions() const { return dimensions_; }
    PlaceholderNode& placeholder() { return *placeholder_; }

private:
    OverlayFactory overlay_factory_;
    BaseFactory base_factory_;
    BottomSheetDimensions dimensions_{};
    std::unique_ptr<PlaceholderNode> placeholder_;
    BottomSheetDimensions::ListenerId dimensions_listener_ = 0;

    std::vector<LayoutNode*> layout_order_{};
    std::vector<LayoutNode*> paint_order_{};
    size_t overlay_count_ = 0;
    Size last_size_{};
    int build_count_ = 0;
    bool has_layout_ = false;
    bool needs_layout_ = true;
    bool in_layout_ = false;
};

}
