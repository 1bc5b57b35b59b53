#include <taskrow/ui/SettleAnimator.hpp>

#include "utils/TaggedLogger.hpp"

#include <algorithm>
#include <string>

namespace TR::UI {

auto SettleAnimator::Ease(float t) -> float {
    t = std::clamp(t, 0.0f, 1.0f);
    return t * t * (3.0f - 2.0f * t);
}

auto SettleAnimator::animate(std::chrono::milliseconds duration,
                             std::vector<PropertyTween> tweens,
                             Completion completion) -> AnimationId {
    Animation animation{};
    animation.id = next_id_++;
    animation.duration = std::max(duration, std::chrono::milliseconds{0});
    for (auto& tween : tweens) {
        if (tween.value == nullptr) {
            continue;
        }
        if (!tween.from) {
            tween.from = *tween.value;
        }
        *tween.value = *tween.from;
        animation.tweens.push_back(tween);
    }
    animation.completion = std::move(completion);
    tr_log("Animation " + std::to_string(animation.id) + " queued for " + std::to_string(animation.duration.count()) + "ms", "Animator");
    pending_.push_back(std::move(animation));
    return pending_.back().id;
}

auto SettleAnimator::apply(Animation const& animation, float progress) -> void {
    auto eased = Ease(progress);
    for (auto const& tween : animation.tweens) {
        auto from = tween.from.value_or(tween.to);
        *tween.value = from + (tween.to - from) * eased;
    }
}

auto SettleAnimator::advance(std::chrono::milliseconds dt) -> void {
    for (auto& animation : pending_) {
        active_.push_back(std::move(animation));
    }
    pending_.clear();

    for (auto& animation : active_) {
        animation.elapsed += dt;
        float progress = 1.0f;
        if (animation.duration.count() > 0) {
            progress = static_cast<float>(animation.elapsed.count())
                       / static_cast<float>(animation.duration.count());
        }
        apply(animation, std::min(progress, 1.0f));
    }

    auto finished = std::stable_partition(active_.begin(), active_.end(), [](Animation const& animation) {
        return animation.elapsed < animation.duration;
    });
    completing_.assign(std::make_move_iterator(finished), std::make_move_iterator(active_.end()));
    active_.erase(finished, active_.end());

    // A completion may destroy the row that owns later entries; cancel()
    // clears those entries in place, so walk by index.
    for (std::size_t i = 0; i < completing_.size(); ++i) {
        auto completion = std::move(completing_[i].completion);
        completing_[i].completion = nullptr;
        tr_log("Animation " + std::to_string(completing_[i].id) + " finished", "Animator");
        if (completion) {
            completion();
        }
    }
    completing_.clear();
}

auto SettleAnimator::finish_all(std::size_t max_rounds) -> bool {
    for (std::size_t round = 0; round < max_rounds && !idle(); ++round) {
        std::chrono::milliseconds longest{0};
        for (auto const& animation : active_) {
            longest = std::max(longest, animation.duration - animation.elapsed);
        }
        for (auto const& animation : pending_) {
            longest = std::max(longest, animation.duration);
        }
        advance(longest);
    }
    return idle();
}

auto SettleAnimator::cancel(AnimationId id) -> bool {
    auto matches = [id](Animation const& animation) { return animation.id == id; };
    if (auto it = std::find_if(active_.begin(), active_.end(), matches); it != active_.end()) {
        active_.erase(it);
        return true;
    }
    if (auto it = std::find_if(pending_.begin(), pending_.end(), matches); it != pending_.end()) {
        pending_.erase(it);
        return true;
    }
    if (auto it = std::find_if(completing_.begin(), completing_.end(), matches); it != completing_.end()) {
        bool had_completion = static_cast<bool>(it->completion);
        it->completion = nullptr;
        return had_completion;
    }
    return false;
}

auto SettleAnimator::contains(AnimationId id) const -> bool {
    auto matches = [id](Animation const& animation) { return animation.id == id; };
    auto completion_pending = [id](Animation const& animation) {
        return animation.id == id && static_cast<bool>(animation.completion);
    };
    return std::any_of(active_.begin(), active_.end(), matches)
        || std::any_of(pending_.begin(), pending_.end(), matches)
        || std::any_of(completing_.begin(), completing_.end(), completion_pending);
}

} // namespace TR::UI
