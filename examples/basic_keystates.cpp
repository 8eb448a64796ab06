/**
 * Basic Keystate Example
 *
 * Demonstrates timeline evaluation:
 * - Mixing bare, timed and annotated keystates
 * - Variant defaults and per-keystate easing
 * - Rendering frames on a worker pool
 */

#include <keymorph/animation.hpp>
#include <keymorph/errors.hpp>
#include <keymorph/frame_batch.hpp>
#include <keymorph/shapes.hpp>
#include <iomanip>
#include <iostream>

using namespace keymorph;

int main() {
    std::cout << "=== Basic Keystate Example ===\n\n";

    auto registry = std::make_shared<VariantRegistry>();
    register_builtin_shapes(*registry);
    std::cout << "Registered variants:";
    for (const auto& name : registry->variants()) {
        std::cout << " " << name;
    }
    std::cout << "\n\n";

    // The middle keystate overshoots its x with a back easing
    KeyState settle;
    settle.snapshot = Snapshot("circle", {{"x", 120.0}, {"radius", 30.0}, {"fill", Color::from_hex("#3366ff")}});
    settle.easing["x"] = &easing::out_back;

    std::vector<KeystateEntry> entries = {
        Snapshot("circle", {{"x", 0.0}, {"radius", 10.0}, {"fill", Color::from_hex("#ff3300")}}),
        settle,
        TimedSnapshot{1.0, Snapshot("rectangle", {{"x", 200.0}, {"width", 60.0}, {"height", 40.0},
                                                  {"fill", Color::from_hex("#33cc66")}})},
    };

    try {
        Timeline timeline = resolve_timeline(entries);
        std::cout << "Resolved " << timeline.size() << " keystates at times:";
        for (std::size_t i = 0; i < timeline.size(); ++i) {
            std::cout << " " << timeline.time(i);
        }
        std::cout << "\n\n";

        MorphingConfig config;
        config.color_space = ColorSpace::LAB;
        Animation animation(timeline, registry, {}, config, std::make_shared<MorphCache>());

        FrameBatch batch(4);
        std::vector<double> times = FrameBatch::frame_times(11);
        std::vector<Snapshot> frames = batch.render_times(animation, times);

        std::cout << std::fixed << std::setprecision(2);
        for (std::size_t i = 0; i < frames.size(); ++i) {
            const Snapshot& frame = frames[i];
            auto contours = frame.get<ContourSet>(CONTOURS_ATTRIBUTE);
            std::cout << "  t=" << times[i]
                      << "  " << std::setw(9) << frame.variant()
                      << "  x=" << std::setw(7) << frame.number_or("x", 0.0)
                      << "  fill=" << frame.get<Color>("fill").value_or(Color::none()).to_hex()
                      << "  outline=" << (contours ? contours->outer.size() : 0) << " pts\n";
        }

        std::cout << "\nMorph cache: " << animation.engine().cache()->size() << " entries, "
                  << animation.engine().cache()->hits() << " hits, "
                  << animation.engine().cache()->misses() << " misses\n";
    } catch (const KeymorphError& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }

    return 0;
}
