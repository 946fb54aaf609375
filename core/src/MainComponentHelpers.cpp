#include "MainComponentHelpers.h"

#include "core/MathUtils.h"

namespace softblob::ui {

juce::Colour colourFromArgb(const std::uint32_t argb)
{
    const auto alpha = static_cast<juce::uint8>((argb >> 24U) & 0xFFU);
    const auto red = static_cast<juce::uint8>((argb >> 16U) & 0xFFU);
    const auto green = static_cast<juce::uint8>((argb >> 8U) & 0xFFU);
    const auto blue = static_cast<juce::uint8>(argb & 0xFFU);
    // juce::Colour(r, g, b, a) with an 8-bit alpha.
    return juce::Colour(red, green, blue, alpha);
}

juce::Point<float> toPoint(const softblob::Vec2& v)
{
    return {static_cast<float>(v.x), static_cast<float>(v.y)};
}

juce::Path makeBlobPath(const softblob::BlobShape& shape)
{
    juce::Path path;
    if (shape.empty()) {
        return path;
    }

    path.startNewSubPath(toPoint(shape.ResolveCurve(0).start));
    for (std::size_t i = 0; i < shape.curves().size(); ++i) {
        const auto curve = shape.ResolveCurve(i);
        path.cubicTo(toPoint(curve.first_control),
                     toPoint(curve.second_control), toPoint(curve.end));
    }
    path.closeSubPath();
    return path;
}

juce::AffineTransform shapeToScreenTransform(
    const juce::Rectangle<float>& bounds, const double rotationRadians)
{
    const auto centre = bounds.getCentre();
    return juce::AffineTransform::rotation(
               static_cast<float>(rotationRadians))
        .translated(centre.x, centre.y);
}

softblob::Vec2 screenToShape(const juce::Point<float> position,
                             const juce::Rectangle<float>& bounds,
                             const double rotationRadians)
{
    // Same translation as the reference demo (subtract half the
    // surface size), then undo the display rotation so that what is
    // hit is what is drawn under the pointer.
    const auto centre = bounds.getCentre();
    const softblob::Vec2 centred{
        static_cast<double>(position.x - centre.x),
        static_cast<double>(position.y - centre.y)};
    return softblob::math::RotatePoint(centred, -rotationRadians);
}

std::optional<softblob::ToggleAction> toggleActionForKey(
    const juce::KeyPress& key)
{
    if (key.getKeyCode() == juce::KeyPress::spaceKey) {
        return softblob::ToggleAction::kOverlays;
    }

    switch (juce::CharacterFunctions::toLowerCase(key.getTextCharacter())) {
        case 'a':
            return softblob::ToggleAction::kAnimate;
        case 'f':
            return softblob::ToggleAction::kFill;
        case 'r':
            return softblob::ToggleAction::kRotate;
        default:
            break;
    }
    return std::nullopt;
}

}  // namespace softblob::ui
