#include "AppOptions.h"

#include <cmath>
#include <exception>
#include <sstream>

#include <argparse/argparse.hpp>

#include "core/MathUtils.h"

namespace softblob::ui {

namespace {

void setError(std::string* error, const std::string& message,
              const argparse::ArgumentParser& program)
{
    if (error == nullptr) {
        return;
    }
    std::ostringstream out;
    out << "[softblob] " << message << '\n' << program;
    *error = out.str();
}

}  // namespace

bool ParseAppOptions(const std::vector<std::string>& arguments,
                     AppOptions& options, std::string* error)
{
    const ShapeConfig defaults;

    argparse::ArgumentParser program("softblob", "0.1.0",
                                     argparse::default_arguments::all, true);
    program.add_description(
        "softblob: a wobbling blob drawn with cubic curves. Drag the blue "
        "control points; space toggles overlays, a animates, f fills, "
        "r rotates.");
    program.add_argument("-n", "--points")
        .help("Number of anchor points on the outline (3 to 10000).")
        .scan<'i', int>()
        .default_value(defaults.point_count);
    program.add_argument("-R", "--radius")
        .help("Base circle radius in pixels.")
        .scan<'g', double>()
        .default_value(defaults.base_radius);
    program.add_argument("--max-sweep")
        .help("Maximum control point sweep in degrees (<= 0 freezes it).")
        .scan<'g', double>()
        .default_value(math::RadiansToDegrees(defaults.max_sweep_radians));
    program.add_argument("--step")
        .help("Oscillation step scale applied per frame (>= 0).")
        .scan<'g', double>()
        .default_value(defaults.oscillation_step);
    program.add_argument("--seed")
        .help("Random seed for sweep speeds and rotation (0 = clock).")
        .scan<'i', int>()
        .default_value(0);
    program.add_argument("--animate")
        .help("Start with the control point animation running.")
        .flag();
    program.add_argument("--rotate")
        .help("Start with the whole shape rotating.")
        .flag();
    program.add_argument("--fill")
        .help("Start with a gradient fill instead of an outline.")
        .flag();
    program.add_argument("--no-overlays")
        .help("Hide point markers and connector lines at start.")
        .flag();

    try {
        program.parse_args(arguments);
    } catch (const std::exception& err) {
        setError(error, err.what(), program);
        return false;
    }

    AppOptions parsed;
    parsed.config.point_count = program.get<int>("--points");
    parsed.config.base_radius = program.get<double>("--radius");
    parsed.config.max_sweep_radians =
        math::DegreesToRadians(program.get<double>("--max-sweep"));
    parsed.config.oscillation_step = program.get<double>("--step");

    const int seed = program.get<int>("--seed");
    if (seed < 0) {
        setError(error,
                 "Invalid --seed '" + std::to_string(seed) +
                     "' (must be >= 0).",
                 program);
        return false;
    }
    parsed.config.random_seed = static_cast<std::uint32_t>(seed);

    if (!std::isfinite(parsed.config.max_sweep_radians) ||
        !std::isfinite(parsed.config.oscillation_step)) {
        setError(error, "--max-sweep and --step must be finite numbers.",
                 program);
        return false;
    }
    if (parsed.config.oscillation_step < 0.0) {
        setError(error,
                 "Invalid --step '" +
                     std::to_string(parsed.config.oscillation_step) +
                     "' (must be >= 0).",
                 program);
        return false;
    }

    std::string configError;
    if (!ValidateShapeConfig(parsed.config, &configError)) {
        setError(error, configError, program);
        return false;
    }

    parsed.toggles.animating = program.get<bool>("--animate");
    parsed.toggles.rotating = program.get<bool>("--rotate");
    parsed.toggles.filled = program.get<bool>("--fill");
    const bool overlays = !program.get<bool>("--no-overlays");
    parsed.toggles.show_markers = overlays;
    parsed.toggles.show_connectors = overlays;

    options = parsed;
    if (error != nullptr) {
        error->clear();
    }
    return true;
}

std::string DescribeAppOptions(const AppOptions& options)
{
    const auto& c = options.config;
    const auto& t = options.toggles;

    std::ostringstream out;
    out << "points=" << c.point_count << " radius=" << c.base_radius
        << " k=" << RoundnessConstant(c.point_count)
        << " max-sweep=" << math::RadiansToDegrees(c.max_sweep_radians)
        << "deg step=" << c.oscillation_step << " seed=" << c.random_seed
        << " animate=" << (t.animating ? "on" : "off")
        << " rotate=" << (t.rotating ? "on" : "off")
        << " fill=" << (t.filled ? "on" : "off")
        << " overlays=" << (t.show_markers ? "on" : "off");
    return out.str();
}

}  // namespace softblob::ui
