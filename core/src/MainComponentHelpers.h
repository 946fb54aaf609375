#pragma once

#include <cstdint>
#include <optional>

#include <juce_graphics/juce_graphics.h>
#include <juce_gui_basics/juce_gui_basics.h>

#include "core/BlobSession.h"
#include "core/BlobShape.h"

namespace softblob::ui {

// Palette (ARGB).
inline constexpr std::uint32_t kBackgroundArgb = 0xFFFFFFFF;
inline constexpr std::uint32_t kOutlineArgb = 0xFF000000;
inline constexpr std::uint32_t kOverlayArgb = 0xFF0000FF;
inline constexpr std::uint32_t kAnchorMarkerArgb = 0xFF000000;
inline constexpr std::uint32_t kFillStartArgb = 0xFF0000FF;
inline constexpr std::uint32_t kFillEndArgb = 0xFFFFC0CB;  // pink

// Convert a 32-bit ARGB integer into a JUCE colour.
juce::Colour colourFromArgb(std::uint32_t argb);

juce::Point<float> toPoint(const softblob::Vec2& v);

// Closed outline: move to curve 0's start, one cubicTo per curve, close.
juce::Path makeBlobPath(const softblob::BlobShape& shape);

// Maps shape space (centre origin) onto component pixels: rotate by
// `rotationRadians`, then move the origin to the centre of `bounds`.
juce::AffineTransform shapeToScreenTransform(
    const juce::Rectangle<float>& bounds, double rotationRadians);

// Inverse of shapeToScreenTransform for pointer input.
softblob::Vec2 screenToShape(juce::Point<float> position,
                             const juce::Rectangle<float>& bounds,
                             double rotationRadians);

// Space toggles the overlays, 'a' animation, 'f' fill, 'r' rotation.
std::optional<softblob::ToggleAction> toggleActionForKey(
    const juce::KeyPress& key);

}  // namespace softblob::ui
