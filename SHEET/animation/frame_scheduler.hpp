#pragma once

#include <vector>

namespace sheet {

class FrameTicker {
public:
    virtual ~FrameTicker() = default;

    // Advances by `dt` seconds. Returns true while the ticker wants more frames.
    virtual bool tick(double dt) = 0;
    virtual bool is_ticking() const = 0;
};

// Frame-synchronous driver for animations and layout passes. Everything runs
// on the thread that calls advance(); nothing here locks.
class FrameScheduler {
public:
    void add_ticker(FrameTicker* ticker);
    void remove_ticker(const FrameTicker* ticker);

    void request_layout() { layout_requested_ = true; }
    bool layout_requested() const { return layout_requested_; }

    // Ticks every active ticker, then reports whether a layout pass is due.
    // The request flag is consumed by the call.
    bool advance(double dt);

    bool has_active_tickers() const;
    unsigned long long frame_count() const { return frame_count_; }

private:
    std::vector<FrameTicker*> tickers_{};
    bool layout_requested_ = false;
    bool ticking_ = false;
    unsigned long long frame_count_ = 0;
};

}
