#pragma once

#include <cstdint>
#include <string_view>

namespace TR::UI {

enum class ReleaseIntent : std::uint8_t {
    None,
    Complete,
    Delete,
};

[[nodiscard]] auto ReleaseIntentToString(ReleaseIntent intent) -> std::string_view;

struct SwipeGeometry {
    float icon_width = 40.0f;

    [[nodiscard]] constexpr auto icon_offset() const -> float { return icon_width / 2.0f; }
    [[nodiscard]] constexpr auto swipe_threshold() const -> float { return icon_width * 2.0f; }
};

// Visual feedback for one pointer-move sample. Recomputed from scratch for
// every sample; nothing here is latched between samples.
struct SwipeFeedback {
    float translation = 0.0f;
    float fraction = 0.0f;
    ReleaseIntent intent = ReleaseIntent::None;
    float done_icon_x = 0.0f;
    float delete_icon_x = 0.0f;
};

[[nodiscard]] auto RestingDoneIconX(SwipeGeometry const& geometry) -> float;
[[nodiscard]] auto RestingDeleteIconX(SwipeGeometry const& geometry, float row_width) -> float;

// fraction = min(1, |tx| / threshold); intent commits once |tx| reaches the
// threshold, so the boundary sample itself counts as committed.
[[nodiscard]] auto ThresholdFraction(float translation, SwipeGeometry const& geometry) -> float;
[[nodiscard]] auto IntentForTranslation(float translation, SwipeGeometry const& geometry) -> ReleaseIntent;

[[nodiscard]] auto ComputeSwipeFeedback(float translation,
                                        SwipeGeometry const& geometry,
                                        float row_width) -> SwipeFeedback;

} // namespace TR::UI
