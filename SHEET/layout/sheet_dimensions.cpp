#include "sheet_dimensions.hpp"

#include <algorithm>
#include <sstream>

namespace sheet {

std::string describe(const SheetDimensions& d) {
    std::ostringstream ss;
    ss << "handle=" << d.drag_handle_height
       << " min_content=" << d.min_content_height
       << " content=" << d.measured_content_height
       << " nav=" << d.navigation_bar_height
       << " extent=" << d.drag_extent
       << " min_extent=" << d.min_extent;
    return ss.str();
}

BottomSheetDimensions::BottomSheetDimensions() {
    auto on_change = [this](const std::optional<float>&) { cell_changed(); };
    drag_handle_height_.set_on_change(on_change);
    min_height_.set_on_change(on_change);
    max_height_.set_on_change(on_change);
    content_height_.set_on_change(on_change);
}

void BottomSheetDimensions::publish(const SheetDimensions& pass, float max_height) {
    ++batch_depth_;
    drag_handle_height_.set(pass.drag_handle_height);
    min_height_.set(pass.min_extent);
    max_height_.set(max_height);
    content_height_.set(pass.measured_content_height);
    --batch_depth_;
    if (batch_depth_ == 0 && batch_dirty_) {
        batch_dirty_ = false;
        notify();
    }
}

void BottomSheetDimensions::clear() {
    ++batch_depth_;
    drag_handle_height_.reset();
    min_height_.reset();
    max_height_.reset();
    content_height_.reset();
    --batch_depth_;
    if (batch_depth_ == 0 && batch_dirty_) {
        batch_dirty_ = false;
        notify();
    }
}

void BottomSheetDimensions::cell_changed() {
    if (batch_depth_ > 0) {
        batch_dirty_ = true;
        return;
    }
    notify();
}

BottomSheetDimensions::ListenerId BottomSheetDimensions::add_listener(Listener listener) {
    const ListenerId id = next_id_++;
    listeners_.emplace_back(id, std::move(listener));
    return id;
}

void BottomSheetDimensions::remove_listener(ListenerId id) {
    listeners_.erase(std::remove_if(listeners_.begin(), listeners_.end(),
                                    [id](const auto& entry) { return entry.first == id; }),
                     listeners_.end());
}

void BottomSheetDimensions::notify() {
    const auto snapshot = listeners_;
    for (const auto& entry : snapshot) {
        if (entry.second) {
            entry.second();
        }
    }
}

}
