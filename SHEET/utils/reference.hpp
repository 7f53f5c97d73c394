#pragma once

#include <functional>
#include <optional>
#include <utility>

namespace sheet {

// Read side of a Reference. Consumers hold this so only the producer can write.
template <typename T>
class ReadOnlyReference {
public:
    virtual ~ReadOnlyReference() = default;

    const std::optional<T>& get() const { return value_; }
    bool has_value() const { return value_.has_value(); }
    T value_or(T fallback) const { return value_.has_value() ? *value_ : fallback; }

protected:
    ReadOnlyReference() = default;
    explicit ReadOnlyReference(std::optional<T> initial) : value_(std::move(initial)) {}

    std::optional<T> value_{};
};

// Single-slot mutable cell written by one layout participant and read by
// another later in the same pass. A read before the producer ran returns the
// previous pass's value, or nothing.
template <typename T>
class Reference : public ReadOnlyReference<T> {
public:
    using ChangeListener = std::function<void(const std::optional<T>&)>;

    Reference() = default;
    explicit Reference(T initial) : ReadOnlyReference<T>(std::optional<T>(std::move(initial))) {}

    // Returns true when the stored value changed. The listener only runs then.
    bool set(std::optional<T> value) {
        if (this->value_ == value) {
            return false;
        }
        this->value_ = std::move(value);
        if (on_change_) {
            on_change_(this->value_);
        }
        return true;
    }

    bool reset() { return set(std::nullopt); }

    void set_on_change(ChangeListener listener) { on_change_ = std::move(listener); }
    void clear_on_change() { on_change_ = nullptr; }

private:
    ChangeListener on_change_{};
};

}
