#include <taskrow/ui/SwipeFeedback.hpp>

#include <algorithm>
#include <cmath>

namespace TR::UI {

auto ReleaseIntentToString(ReleaseIntent intent) -> std::string_view {
    switch (intent) {
    case ReleaseIntent::None:
        return "none";
    case ReleaseIntent::Complete:
        return "complete";
    case ReleaseIntent::Delete:
        return "delete";
    }
    return "none";
}

auto RestingDoneIconX(SwipeGeometry const& geometry) -> float {
    return geometry.icon_offset();
}

auto RestingDeleteIconX(SwipeGeometry const& geometry, float row_width) -> float {
    return row_width - geometry.icon_width - geometry.icon_offset();
}

auto ThresholdFraction(float translation, SwipeGeometry const& geometry) -> float {
    auto threshold = geometry.swipe_threshold();
    if (threshold <= 0.0f) {
        return 1.0f;
    }
    return std::min(1.0f, std::fabs(translation) / threshold);
}

auto IntentForTranslation(float translation, SwipeGeometry const& geometry) -> ReleaseIntent {
    if (std::fabs(translation) < geometry.swipe_threshold()) {
        return ReleaseIntent::None;
    }
    return translation > 0.0f ? ReleaseIntent::Complete : ReleaseIntent::Delete;
}

auto ComputeSwipeFeedback(float translation,
                          SwipeGeometry const& geometry,
                          float row_width) -> SwipeFeedback {
    SwipeFeedback feedback{};
    feedback.translation = translation;

    auto const threshold = geometry.swipe_threshold();
    auto const resting_done = RestingDoneIconX(geometry);
    auto const resting_delete = RestingDeleteIconX(geometry, row_width);

    // Past the threshold the icons trail the content edge.
    if (std::fabs(translation) > threshold) {
        feedback.done_icon_x = resting_done + translation - threshold;
        feedback.delete_icon_x = resting_delete + translation + threshold;
    } else {
        feedback.done_icon_x = resting_done;
        feedback.delete_icon_x = resting_delete;
    }

    feedback.fraction = ThresholdFraction(translation, geometry);
    feedback.intent = IntentForTranslation(translation, geometry);
    return feedback;
}

} // namespace TR::UI
