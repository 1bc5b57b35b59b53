#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <optional>
#include <vector>

namespace TR::UI {

using AnimationId = std::uint64_t;

struct PropertyTween {
    float* value = nullptr;
    float to = 0.0f;
    // Captured from *value when the animation is created if not given.
    std::optional<float> from{};
};

// Host animation context shared by the rows of one window. Runs on the UI
// thread; completions fire from advance(), never from animate().
class SettleAnimator {
public:
    using Completion = std::function<void()>;

    SettleAnimator() = default;
    SettleAnimator(SettleAnimator const&) = delete;
    SettleAnimator& operator=(SettleAnimator const&) = delete;

    auto animate(std::chrono::milliseconds duration,
                 std::vector<PropertyTween> tweens,
                 Completion completion = {}) -> AnimationId;

    // Steps every running animation. Animations created by a completion start
    // on the following call.
    auto advance(std::chrono::milliseconds dt) -> void;

    // Advances until no animation is left, including ones chained from
    // completions. Returns false if max_rounds was not enough.
    auto finish_all(std::size_t max_rounds = 256) -> bool;

    // Drops the animation without writing final values or running its completion.
    auto cancel(AnimationId id) -> bool;

    [[nodiscard]] auto idle() const -> bool { return active_.empty() && pending_.empty(); }
    [[nodiscard]] auto running() const -> std::size_t { return active_.size() + pending_.size(); }
    [[nodiscard]] auto contains(AnimationId id) const -> bool;

    [[nodiscard]] static auto Ease(float t) -> float;

private:
    struct Animation {
        AnimationId id = 0;
        std::chrono::milliseconds duration{0};
        std::chrono::milliseconds elapsed{0};
        std::vector<PropertyTween> tweens;
        Completion completion;
    };

    auto apply(Animation const& animation, float progress) -> void;

    std::vector<Animation> active_;
    std::vector<Animation> pending_;
    std::vector<Animation> completing_;
    AnimationId next_id_ = 1;
};

} // namespace TR::UI
