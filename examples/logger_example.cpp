// Logger example
// Routes keyline's own diagnostics to the console, a log file and an
// in-memory buffer, then replays what the engine reported.
//
// This example shows:
// - Installing sinks and picking a level
// - Engine warnings on malformed easing and misrouted keyframe edits
// - Debug traces from transition rebalancing and rejected keyframes
// - Inspecting captured entries with a memory sink

#include <iostream>
#include <keyline/auto_keyframe.hpp>
#include <keyline/easing.hpp>
#include <keyline/logger.hpp>
#include <keyline/transition.hpp>
#include <memory>
#include <vector>

using namespace keyline;

int main()
{
    auto captured = std::make_shared<std::vector<Logger::LogEntry>>();

    Logger::instance().set_level(LogLevel::Debug);
    Logger::instance().add_sink(sinks::console_sink());
    Logger::instance().add_sink(sinks::file_sink("keyline_example.log"));
    Logger::instance().add_sink(sinks::memory_sink(captured));

    KEYLINE_LOG_INFO("example", "logging to console, keyline_example.log and memory");

    // Malformed easing falls back to linear with a warning.
    EasingSpec broken;
    broken.kind = static_cast<EasingKind>(99);
    std::cout << "evaluate(0.25, <unknown kind>) = " << evaluate(0.25, broken) << "\n";

    // Two 16-frame transitions on a 10-frame clip are rebalanced.
    const auto fitted = fit_portions_to_clip(10, 8, 8);
    std::cout << "fit_portions_to_clip(10, 8, 8) -> incoming " << fitted.incoming << ", outgoing "
              << fitted.outgoing << "\n";

    // Negative frames are refused.
    ItemAnimation anim("clip-1");
    if (auto id = anim.add_keyframe(AnimatableProperty::X, -5, 0.0))
        std::cout << "unexpectedly added " << *id << "\n";
    else
        std::cout << "keyframe at frame -5 rejected\n";

    // A sink bound to clip-1 ignores edits aimed at another item.
    ItemAnimationSink sink(anim);
    sink.add_keyframe("clip-2", AnimatableProperty::X, 0, 1.0, EasingSpec::linear());
    std::cout << "clip-1 keyframes after misrouted add: " << anim.keyframe_count() << "\n";

    KEYLINE_LOG_INFO("example", "replaying {} captured entries", captured->size());

    std::cout << "\nCaptured entries:\n";
    size_t warnings = 0;
    for (const auto& entry : *captured)
    {
        if (entry.level >= LogLevel::Warning)
            ++warnings;
        std::cout << "  [" << Logger::level_to_string(entry.level) << "] " << entry.category << ": "
                  << entry.message << "\n";
    }
    std::cout << warnings << " of " << captured->size() << " entries were warnings or worse\n";

    Logger::instance().clear_sinks();
    return 0;
}
