#include "frame_scheduler.hpp"

#include <algorithm>

namespace sheet {

void FrameScheduler::add_ticker(FrameTicker* ticker) {
    if (!ticker) {
        return;
    }
    if (std::find(tickers_.begin(), tickers_.end(), ticker) != tickers_.end()) {
        return;
    }
    tickers_.push_back(ticker);
}

void FrameScheduler::remove_ticker(const FrameTicker* ticker) {
    auto it = std::find(tickers_.begin(), tickers_.end(), ticker);
    if (it == tickers_.end()) {
        return;
    }
    if (ticking_) {
        // advance() skips null slots and compacts afterwards.
        *it = nullptr;
        return;
    }
    tickers_.erase(it);
}

bool FrameScheduler::advance(double dt) {
    ++frame_count_;
    ticking_ = true;
    for (size_t i = 0; i < tickers_.size(); ++i) {
        FrameTicker* ticker = tickers_[i];
        if (ticker && ticker->is_ticking()) {
            ticker->tick(dt);
        }
    }
    ticking_ = false;
    tickers_.erase(std::remove(tickers_.begin(), tickers_.end(), nullptr), tickers_.end());

    const bool due = layout_requested_;
    layout_requested_ = false;
    return due;
}

bool FrameScheduler::has_active_tickers() const {
    return std::any_of(tickers_.begin(), tickers_.end(), [](const FrameTicker* t) { return t && t->is_ticking(); });
}

}
