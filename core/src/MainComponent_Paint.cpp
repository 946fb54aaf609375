#include "MainComponent.h"

#include "MainComponentHelpers.h"

using softblob::ui::colourFromArgb;
using softblob::ui::toPoint;

void MainComponent::paint(juce::Graphics& g)
{
    const auto bounds = getLocalBounds().toFloat();

    g.fillAll(colourFromArgb(softblob::ui::kBackgroundArgb));

    if (session_.shape.empty()) {
        return;
    }

    // Everything below is drawn in shape space: origin at the centre of
    // the component, rotated with the session.
    juce::Graphics::ScopedSaveState state(g);
    g.addTransform(softblob::ui::shapeToScreenTransform(
        bounds, session_.rotation_radians));

    paintOutline(g);

    if (session_.toggles.show_connectors) {
        paintConnectors(g);
    }

    if (session_.toggles.show_markers) {
        paintMarkers(g);
    }
}

void MainComponent::paintOutline(juce::Graphics& g) const
{
    const juce::Path outline = softblob::ui::makeBlobPath(session_.shape);

    if (session_.toggles.filled) {
        juce::ColourGradient gradient(
            colourFromArgb(softblob::ui::kFillStartArgb),
            kFillGradientExtent, kFillGradientExtent,
            colourFromArgb(softblob::ui::kFillEndArgb),
            -kFillGradientExtent, -kFillGradientExtent, false);
        g.setGradientFill(gradient);
        g.fillPath(outline);
        return;
    }

    g.setColour(colourFromArgb(softblob::ui::kOutlineArgb));
    g.strokePath(outline,
                 juce::PathStrokeType(kOutlineThickness,
                                      juce::PathStrokeType::curved,
                                      juce::PathStrokeType::rounded));
}

void MainComponent::paintConnectors(juce::Graphics& g) const
{
    g.setColour(colourFromArgb(softblob::ui::kOverlayArgb));

    const auto& shape = session_.shape;
    for (std::size_t i = 0; i < shape.curves().size(); ++i) {
        const auto curve = shape.ResolveCurve(i);
        g.drawLine(juce::Line<float>(toPoint(curve.start),
                                     toPoint(curve.first_control)),
                   kConnectorThickness);
        g.drawLine(juce::Line<float>(toPoint(curve.end),
                                     toPoint(curve.second_control)),
                   kConnectorThickness);
    }
}

void MainComponent::paintMarkers(juce::Graphics& g) const
{
    const auto radius = static_cast<float>(session_.config.marker_radius);
    const auto fillMarker = [&g, radius](const softblob::Vec2& centre) {
        const auto p = toPoint(centre);
        g.fillEllipse(p.x - radius, p.y - radius, radius * 2.0F,
                      radius * 2.0F);
    };

    // Control points first so the anchors sit on top of them.
    g.setColour(colourFromArgb(softblob::ui::kOverlayArgb));
    for (const auto& point : session_.shape.control_points()) {
        fillMarker(point.position);
    }

    g.setColour(colourFromArgb(softblob::ui::kAnchorMarkerArgb));
    for (const auto& anchor : session_.shape.anchors()) {
        fillMarker(anchor.position);
    }
}
