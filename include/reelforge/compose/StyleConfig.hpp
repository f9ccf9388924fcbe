// Repository: Reelforge
// Component: Style Configuration
// Purpose: Per-job composition style: framing mode, safe-zone guides and the
//          metadata strings rendered over the video.
// Copyright (c) 2025 Reelforge

#ifndef REELFORGE_COMPOSE_STYLE_CONFIG_HPP_
#define REELFORGE_COMPOSE_STYLE_CONFIG_HPP_

#include <optional>
#include <string>

namespace reelforge::compose {

// kBlur: blurred fill background + letterboxed source.
// kCrop: source scaled to fill, excess cropped.
enum class CompositionMode {
  kBlur,
  kCrop,
};

const char* CompositionModeName(CompositionMode mode);
std::optional<CompositionMode> ParseCompositionMode(const std::string& name);

struct OverlayMetadata {
  std::string title;
  std::string channel_name;
  std::string subscriber_count_label;  // free text, e.g. "1.2M subscribers"
};

inline constexpr char kDefaultFontFile[] =
    "/usr/share/fonts/truetype/dejavu/DejaVuSansMono-Bold.ttf";

// Default safe-zone bands as a fraction of canvas height.
inline constexpr double kDefaultTopSafeZoneRatio = 0.15;
inline constexpr double kDefaultBottomSafeZoneRatio = 0.20;

// StyleConfig is constant for the duration of one job.
struct StyleConfig {
  CompositionMode mode = CompositionMode::kBlur;
  bool show_safe_zones = false;
  int top_safe_zone_px = 0;     // 0 = kDefaultTopSafeZoneRatio of canvas height
  int bottom_safe_zone_px = 0;  // 0 = kDefaultBottomSafeZoneRatio of canvas height
  OverlayMetadata metadata;

  // Monospaced font used for overlay text; title width estimates assume it.
  std::string font_file = kDefaultFontFile;
};

}  // namespace reelforge::compose

#endif  // REELFORGE_COMPOSE_STYLE_CONFIG_HPP_
