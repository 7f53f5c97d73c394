#pragma once

#include <algorithm>
#include <limits>

namespace sheet {

struct Size {
    float w = 0.0f;
    float h = 0.0f;
};

inline bool operator==(const Size& a, const Size& b) { return a.w == b.w && a.h == b.h; }
inline bool operator!=(const Size& a, const Size& b) { return !(a == b); }

struct BoxConstraints {
    static constexpr float kUnbounded = std::numeric_limits<float>::infinity();

    float min_w = 0.0f;
    float max_w = kUnbounded;
    float min_h = 0.0f;
    float max_h = kUnbounded;

    static BoxConstraints loose(const Size& s) { return BoxConstraints{0.0f, s.w, 0.0f, s.h}; }
    static BoxConstraints tight(const Size& s) { return BoxConstraints{s.w, s.w, s.h, s.h}; }

    // Clamps every bound of this box into `outer`.
    BoxConstraints enforce(const BoxConstraints& outer) const {
        return BoxConstraints{
            std::clamp(min_w, outer.min_w, outer.max_w),
            std::clamp(max_w, outer.min_w, outer.max_w),
            std::clamp(min_h, outer.min_h, outer.max_h),
            std::clamp(max_h, outer.min_h, outer.max_h),
        };
    }

    BoxConstraints deflate_top(float amount) const {
        const float deflated_min = std::max(0.0f, min_h - amount);
        return BoxConstraints{min_w, max_w, deflated_min, std::max(deflated_min, max_h - amount)};
    }

    BoxConstraints with_height(float min_height, float max_height) const {
        return BoxConstraints{min_w, max_w, min_height, max_height};
    }

    BoxConstraints loosen_height() const { return BoxConstraints{min_w, max_w, 0.0f, max_h}; }

    Size constrain(const Size& s) const {
        return Size{std::clamp(s.w, min_w, std::max(min_w, max_w)), std::clamp(s.h, min_h, std::max(min_h, max_h))};
    }

    Size smallest() const { return constrain(Size{0.0f, 0.0f}); }
    Size biggest() const { return constrain(Size{kUnbounded, kUnbounded}); }

    bool has_bounded_height() const { return max_h < kUnbounded; }
    bool has_bounded_width() const { return max_w < kUnbounded; }
};

inline bool operator==(const BoxConstraints& a, const BoxConstraints& b) {
    return a.min_w == b.min_w && a.max_w == b.max_w && a.min_h == b.min_h && a.max_h == b.max_h;
}
inline bool operator!=(const BoxConstraints& a, const BoxConstraints& b) { return !(a == b); }

}
