#pragma once

#include <functional>
#include <string>
#include <utility>
#include <vector>

#include "utils/reference.hpp"

namespace sheet {

// Values derived by one sheet layout pass. Not kept between passes.
struct SheetDimensions {
    float drag_handle_height = 0.0f;
    float min_content_height = 0.0f;
    float measured_content_height = 0.0f;
    float navigation_bar_height = 0.0f;
    float drag_extent = 0.0f;
    // Height the sheet covers when collapsed.
    float min_extent = 0.0f;
};

std::string describe(const SheetDimensions& d);

// Cells the sheet writes during its layout so other participants of the same
// pass can size themselves after it. Listeners run whenever a cell changes.
class BottomSheetDimensions {
public:
    using Listener = std::function<void()>;
    using ListenerId = int;

    BottomSheetDimensions();

    BottomSheetDimensions(const BottomSheetDimensions&) = delete;
    BottomSheetDimensions& operator=(const BottomSheetDimensions&) = delete;

    Reference<float>& drag_handle_height() { return drag_handle_height_; }
    Reference<float>& min_height() { return min_height_; }
    Reference<float>& max_height() { return max_height_; }
    Reference<float>& content_height() { return content_height_; }

    const ReadOnlyReference<float>& drag_handle_height() const { return drag_handle_height_; }
    const ReadOnlyReference<float>& min_height() const { return min_height_; }
    const ReadOnlyReference<float>& max_height() const { return max_height_; }
    const ReadOnlyReference<float>& content_height() const { return content_height_; }

    // Writes every cell from one pass; listeners run once if anything changed.
    void publish(const SheetDimensions& pass, float max_height);
    void clear();

    ListenerId add_listener(Listener listener);
    void remove_listener(ListenerId id);

private:
    void cell_changed();
    void notify();

    Reference<float> drag_handle_height_{};
    Reference<float> min_height_{};
    Reference<float> max_height_{};
    Reference<float> content_height_{};

    int batch_depth_ = 0;
    bool batch_dirty_ = false;
    ListenerId next_id_ = 1;
    std::vector<std::pair<ListenerId, Listener>> listeners_{};
};

}
