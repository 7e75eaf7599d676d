#pragma once

#include <optional>
#include <string>

namespace rmp {

// Whole-render animation style; exactly one applies to every clip
enum class AnimationType {
    Fade,
    Zoom,
    Pan
};

inline const char* animation_type_to_string(AnimationType type) {
    switch (type) {
        case AnimationType::Fade: return "fade";
        case AnimationType::Zoom: return "zoom";
        case AnimationType::Pan:  return "pan";
    }
    return "fade";
}

// Matches the lowercase schema names only; callers normalise case and
// whitespace first (the script resolver trims and lowercases)
inline std::optional<AnimationType> animation_type_from_string(const std::string& name) {
    if (name == "fade") return AnimationType::Fade;
    if (name == "zoom") return AnimationType::Zoom;
    if (name == "pan") return AnimationType::Pan;
    return std::nullopt;
}

// Upper bounds of the parameter domain. They keep every duration and frame
// count well inside int64 microsecond arithmetic.
constexpr int MAX_FPS = 240;
constexpr double MAX_DURATION_PER_IMAGE = 3600.0;   // seconds
constexpr int MAX_TARGET_DIMENSION = 8192;

// Rendering parameters for one request.
// Every field is inside its domain once produced by the script resolver;
// the media layer re-checks with is_valid() before doing work.
struct RenderParameters {
    int fps = 24;
    double duration_per_image = 3.0;    // seconds
    double transition_duration = 0.5;   // seconds
    AnimationType animation_type = AnimationType::Fade;
    int target_width = 720;             // 9:16 portrait
    int target_height = 1280;

    bool is_valid() const {
        return fps > 0 && fps <= MAX_FPS &&
               duration_per_image > 0.0 && duration_per_image <= MAX_DURATION_PER_IMAGE &&
               transition_duration >= 0.0 && transition_duration <= MAX_DURATION_PER_IMAGE &&
               target_width > 0 && target_width <= MAX_TARGET_DIMENSION &&
               target_height > 0 && target_height <= MAX_TARGET_DIMENSION;
    }

    // YUV 4:2:0 output needs both dimensions even
    bool has_even_size() const {
        return target_width % 2 == 0 && target_height % 2 == 0;
    }

    bool operator==(const RenderParameters& other) const {
        return fps == other.fps &&
               duration_per_image == other.duration_per_image &&
               transition_duration == other.transition_duration &&
               animation_type == other.animation_type &&
               target_width == other.target_width &&
               target_height == other.target_height;
    }
    bool operator!=(const RenderParameters& other) const { return !(*this == other); }
};

} // namespace rmp
