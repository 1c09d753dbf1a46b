/**
 * Finalization detector tests.
 * Asserts:
 * - The quiet timer fires once, measured from the latest arming.
 * - A window of identical non-blank partials fires once, then is locked.
 * - The lock releases on a large length change or a committed transcript.
 * - Nothing fires while dispatching.
 *
 * Run from build dir: ./test_finalization_detector
 */

#include "finalization_detector.h"
#include <iostream>
#include <string>

using namespace live_scribe;

static int failed = 0;

#define ASSERT(cond) do { if (!(cond)) { std::cerr << "FAIL: " << #cond << " (line " << __LINE__ << ")\n"; failed++; } } while(0)

static int count_fires(FinalizationDetector& d, const std::string& text, int times, bool dispatching = false) {
    int fires = 0;
    for (int i = 0; i < times; i++) {
        if (d.on_partial(text, dispatching)) fires++;
    }
    return fires;
}

int main() {
    const TimePoint t0 = TimePoint() + std::chrono::hours(1);
    auto at = [t0](int64_t ms) { return t0 + Duration(ms); };

    // --- quiet timer ---
    {
        FinalizationDetector d;
        ASSERT(!d.poll(at(10000), false));            // not armed

        d.arm_quiet_timer(at(0));
        ASSERT(d.quiet_timer_armed());
        ASSERT(!d.poll(at(2999), false));

        // Rearm counts from the latest append
        d.arm_quiet_timer(at(1000));
        ASSERT(!d.poll(at(3500), false));
        auto fired = d.poll(at(4000), false);
        ASSERT(fired.has_value());
        ASSERT(fired && fired->kind == FinalizeTrigger::Kind::TimerExpired);
        ASSERT(!d.quiet_timer_armed());
        ASSERT(!d.poll(at(9000), false));             // fires once per arming
    }

    {
        FinalizationDetector d;
        d.arm_quiet_timer(at(0));
        ASSERT(!d.poll(at(3000), true));              // elapsed while dispatching: consumed
        ASSERT(!d.quiet_timer_armed());

        d.arm_quiet_timer(at(0));
        d.disarm_quiet_timer();
        ASSERT(!d.poll(at(5000), false));
    }

    {
        FinalizeConfig cfg;
        cfg.quiet_window_ms = 500;
        FinalizationDetector d(cfg);
        d.arm_quiet_timer(at(0));
        ASSERT(!d.poll(at(499), false));
        ASSERT(d.poll(at(500), false).has_value());
    }

    // --- repeated partial pattern ---
    {
        FinalizationDetector d;
        ASSERT(!d.on_partial("what is the", false));
        ASSERT(!d.on_partial("what is the", false));
        auto fired = d.on_partial("what is the", false);
        ASSERT(fired.has_value());
        ASSERT(fired && fired->kind == FinalizeTrigger::Kind::RepeatedPartialPattern);
        ASSERT(fired && fired->text == "what is the");
        ASSERT(d.window_size() == 0);
        ASSERT(d.pattern_lock() == "what is the");

        // Same streak again: locked
        ASSERT(count_fires(d, "what is the", 6) == 0);

        // Small change (<= 5 chars) keeps the lock
        ASSERT(count_fires(d, "what is the?", 1) == 0);
        ASSERT(d.pattern_lock() == "what is the");
        ASSERT(count_fires(d, "what is the", 3) == 0);

        // Large change releases it
        ASSERT(count_fires(d, "what is the weather today", 1) == 0);
        ASSERT(d.pattern_lock().empty());
        ASSERT(count_fires(d, "what is the", 3) == 1);
    }

    {
        FinalizationDetector d;
        ASSERT(count_fires(d, "roll for initiative", 3) == 1);
        d.on_committed();
        ASSERT(d.pattern_lock().empty());
        ASSERT(count_fires(d, "roll for initiative", 3) == 1);
    }

    {
        // Blank partials are not counted and do not break a streak
        FinalizationDetector d;
        ASSERT(!d.on_partial("hi there", false));
        ASSERT(!d.on_partial("   ", false));
        ASSERT(!d.on_partial("", false));
        ASSERT(!d.on_partial("hi there", false));
        ASSERT(d.on_partial("hi there", false).has_value());
    }

    {
        // A differing partial breaks the streak
        FinalizationDetector d;
        ASSERT(count_fires(d, "a", 2) == 0);
        ASSERT(count_fires(d, "b", 1) == 0);
        ASSERT(count_fires(d, "a", 2) == 0);
        ASSERT(count_fires(d, "a", 1) == 1);
    }

    {
        // Disarmed while dispatching
        FinalizationDetector d;
        ASSERT(count_fires(d, "hold on", 5, true) == 0);
        ASSERT(d.window_size() == 0);
        ASSERT(count_fires(d, "hold on", 3, false) == 1);
    }

    {
        FinalizeConfig cfg;
        cfg.pattern_window = 5;
        FinalizationDetector d(cfg);
        ASSERT(count_fires(d, "five", 4) == 0);
        ASSERT(count_fires(d, "five", 1) == 1);
    }

    {
        FinalizationDetector d;
        d.arm_quiet_timer(at(0));
        count_fires(d, "x y z", 3);
        d.reset();
        ASSERT(!d.quiet_timer_armed());
        ASSERT(d.pattern_lock().empty());
        ASSERT(d.window_size() == 0);
    }

    if (failed) {
        std::cerr << failed << " assertion(s) failed.\n";
        return 1;
    }
    std::cout << "All finalization detector tests passed.\n";
    return 0;
}
