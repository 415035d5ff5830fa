#pragma once

#include <functional>
#include <memory>

namespace touch_button {

// A (receiver, member function) registration. The receiver is held weakly:
// registering never extends its lifetime, and once it is destroyed the
// registration silently stops firing.
template <typename Sender>
class TargetAction {
public:
    TargetAction() = default;

    template <typename T>
    TargetAction(const std::shared_ptr<T>& target, void (T::*action)(Sender&)) {
        if (!target || !action) return;
        std::weak_ptr<T> weak = target;
        target_ = weak;
        invoke_ = [weak, action](Sender& sender) {
            auto locked = weak.lock();
            if (!locked) return false;
            ((*locked).*action)(sender);
            return true;
        };
    }

    bool empty() const { return !invoke_; }
    bool expired() const { return !invoke_ || target_.expired(); }
    explicit operator bool() const { return !expired(); }

    void reset() {
        target_.reset();
        invoke_ = nullptr;
    }

    // Returns false if nothing was called.
    bool operator()(Sender& sender) const {
        if (!invoke_) return false;
        // Copy so the registration may be replaced from inside the action.
        auto invoke = invoke_;
        return invoke(sender);
    }

private:
    std::weak_ptr<void> target_;
    std::function<bool(Sender&)> invoke_;
};

} // namespace touch_button
