//=============================================================================
// DebouncedPositionSaver Tests
//
// Debounce, safety flush and retry behaviour driven by a manual clock and a
// recording store writer: tick() is called by hand, batches complete only
// when the test says so.
//=============================================================================

// Standard headers before boost/ut.hpp
#include <cstddef>
#include <version>
#include <algorithm>
#include <chrono>
#include <cstdint>
#include <optional>

#include <boost/ut.hpp>
#include <slate/debounced-position-saver.h>
#include "harness/manual_clock.h"
#include "harness/recording_store_writer.h"

using namespace boost::ut;
using namespace slate;
using namespace std::chrono_literals;

namespace {

struct Fixture {
    std::shared_ptr<test::ManualClock> clock = std::make_shared<test::ManualClock>();
    std::shared_ptr<test::RecordingStoreWriter> writer = std::make_shared<test::RecordingStoreWriter>();
    DebouncedPositionSaver::Ptr saver;

    explicit Fixture(DebouncedPositionSaverConfig config = {}) {
        auto res = DebouncedPositionSaver::create(writer, clock, config);
        if (res) saver = *res;
    }

    // Advance in steps, ticking like the loop timer would
    void run(std::chrono::milliseconds total, std::chrono::milliseconds step = 10ms) {
        for (auto elapsed = 0ms; elapsed < total; elapsed += step) {
            clock->advance(step);
            saver->tick();
        }
    }
};

std::optional<Point> positionIn(const WriteBatch& batch, const std::string& blockId) {
    for (const auto& update : batch.updates) {
        if (update.blockId == blockId) {
            if (auto p = std::get_if<Point>(&update.value)) return *p;
        }
    }
    return std::nullopt;
}

} // namespace

suite debounced_position_saver_tests = [] {
    "create requires a writer and a clock"_test = [] {
        auto clock = std::make_shared<test::ManualClock>();
        auto writer = std::make_shared<test::RecordingStoreWriter>();
        expect(!DebouncedPositionSaver::create(StoreWriter::Ptr(), clock));
        expect(!DebouncedPositionSaver::create(writer, Clock::Ptr()));

        DebouncedPositionSaverConfig bad;
        bad.maxPendingTime = 0ms;
        expect(!DebouncedPositionSaver::create(writer, clock, bad));
    };

    "drag burst coalesces into one write of the last position"_test = [] {
        Fixture f;
        expect((f.saver != nullptr) >> fatal);

        f.saver->queuePositionUpdate("b1", {10, 10});
        f.run(10ms);
        f.saver->queuePositionUpdate("b1", {20, 20});
        f.run(10ms);
        f.saver->queuePositionUpdate("b1", {30, 30});
        expect(f.writer->submittedCount() == 0_ul) << "nothing written during the burst";

        f.run(60ms);

        expect((f.writer->submittedCount() == 1_ul) >> fatal);
        const auto& batch = f.writer->history()[0];
        expect(batch.category == UpdateCategory::Position);
        expect(batch.updates.size() == 1_ul);
        expect(positionIn(batch, "b1") == std::optional<Point>(Point{30, 30}));
        expect(!f.saver->hasPendingUpdates());
    };

    "each queue call re-arms the debounce"_test = [] {
        Fixture f;
        expect((f.saver != nullptr) >> fatal);

        for (int i = 0; i < 5; ++i) {
            f.saver->queuePositionUpdate("b1", {double(i), 0});
            f.run(40ms);
        }
        expect(f.writer->submittedCount() == 0_ul);
        f.run(20ms);
        expect(f.writer->submittedCount() == 1_ul);
    };

    "categories debounce independently"_test = [] {
        Fixture f;
        expect((f.saver != nullptr) >> fatal);

        f.saver->queuePositionUpdate("b1", {1, 1});
        f.saver->queueSizeUpdate("b1", {100, 50});
        f.saver->queueContentUpdate("b1", "note");

        f.run(60ms);
        expect(f.writer->submittedCount() == 1_ul) << "position after 50ms";
        f.writer->completeNext();

        f.run(50ms);
        expect(f.writer->submittedCount() == 2_ul) << "size after 100ms";
        expect(f.writer->history()[1].category == UpdateCategory::Size);
        f.writer->completeNext();

        f.run(200ms);
        expect(f.writer->submittedCount() == 3_ul) << "content after 300ms";
        expect(f.writer->history()[2].category == UpdateCategory::Content);
        f.writer->completeNext();

        expect(!f.saver->hasPendingUpdates());
    };

    "continuous drag still flushes within maxPendingTime"_test = [] {
        Fixture f;
        expect((f.saver != nullptr) >> fatal);

        auto elapsed = 0ms;
        while (f.writer->submittedCount() == 0 && elapsed <= 5000ms) {
            f.saver->queuePositionUpdate("b1", {double(elapsed.count()), 0});
            f.run(10ms);
            elapsed += 10ms;
        }

        expect((f.writer->submittedCount() == 1_ul) >> fatal);
        expect(elapsed <= 2000ms) << "flushed after " << elapsed.count() << "ms";
        expect(elapsed >= 1990ms) << "not before the safety window";
    };

    "safety flush window restarts after a flush"_test = [] {
        Fixture f;
        expect((f.saver != nullptr) >> fatal);

        auto elapsed = 0ms;
        while (f.writer->submittedCount() < 2 && elapsed <= 10000ms) {
            f.saver->queuePositionUpdate("b1", {double(elapsed.count()), 0});
            f.writer->completeNext();
            f.run(10ms);
            elapsed += 10ms;
        }
        expect(f.writer->submittedCount() == 2_ul);
        expect(elapsed <= 4020ms);
    };

    "failed flush does not clobber a newer value"_test = [] {
        Fixture f;
        expect((f.saver != nullptr) >> fatal);

        f.saver->queuePositionUpdate("b1", {5, 5});
        f.saver->queuePositionUpdate("b2", {1, 2});
        f.saver->flushPositions();
        expect(f.saver->isFlushing(UpdateCategory::Position));
        expect(f.saver->pendingCount(UpdateCategory::Position) == 0_ul);

        // Newer value arrives while the write is in flight
        f.saver->queuePositionUpdate("b1", {9, 9});
        f.writer->failNext();

        expect(!f.saver->isFlushing(UpdateCategory::Position));
        expect(f.saver->pendingPosition("b1") == std::optional<Point>(Point{9, 9}));
        expect(f.saver->pendingPosition("b2") == std::optional<Point>(Point{1, 2})) << "untouched key is retried";
    };

    "failed flush retries on the next debounce"_test = [] {
        Fixture f;
        expect((f.saver != nullptr) >> fatal);

        f.saver->queueSizeUpdate("b1", {10, 20});
        f.run(100ms);
        expect((f.writer->submittedCount() == 1_ul) >> fatal);
        f.writer->failNext();
        expect(f.saver->pendingSize("b1") == std::optional<Extent>(Extent{10, 20}));

        f.run(100ms);
        expect(f.writer->submittedCount() == 2_ul);
        f.writer->completeNext();
        expect(!f.saver->hasPendingUpdates());
    };

    "store that keeps failing is retried once per debounce"_test = [] {
        DebouncedPositionSaverConfig config;
        Fixture f(config);
        expect((f.saver != nullptr) >> fatal);

        f.saver->queuePositionUpdate("b1", {5, 5});
        for (auto elapsed = 0ms; elapsed < 4000ms; elapsed += 10ms) {
            f.clock->advance(10ms);
            f.saver->tick();
            while (f.writer->failNext()) {}
        }

        const auto limit = uint64_t(4000ms / config.positionDebounce);
        expect(f.writer->submittedCount() > 0_ul);
        expect(f.writer->submittedCount() <= limit) << "writes:" << f.writer->submittedCount();
        expect(f.saver->pendingPosition("b1") == std::optional<Point>(Point{5, 5}));
    };

    "flushAll writes every category and clears pending"_test = [] {
        Fixture f;
        expect((f.saver != nullptr) >> fatal);

        f.saver->queuePositionUpdate("b1", {1, 1});
        f.saver->queueSizeUpdate("b2", {2, 2});
        f.saver->queueContentUpdate("b3", "text");

        bool called = false;
        bool ok = false;
        f.saver->flushAll([&](Result<void> res) {
            called = true;
            ok = res.has_value();
        });

        // Categories are written one after another
        for (int i = 0; i < 3; ++i) {
            expect(f.writer->inFlightCount() == 1_ul);
            f.writer->completeNext();
        }

        expect(called);
        expect(ok);
        expect(!f.saver->hasPendingUpdates());
        expect(f.writer->submittedCount() == 3_ul);
    };

    "flushAll with nothing pending completes immediately"_test = [] {
        Fixture f;
        expect((f.saver != nullptr) >> fatal);

        bool called = false;
        f.saver->flushAll([&](Result<void> res) { called = res.has_value(); });
        expect(called);
        expect(f.writer->submittedCount() == 0_ul);
    };

    "flushAll reports the first failure"_test = [] {
        Fixture f;
        expect((f.saver != nullptr) >> fatal);

        f.saver->queuePositionUpdate("b1", {1, 1});
        f.saver->queueContentUpdate("b1", "text");

        std::optional<Result<void>> result;
        f.saver->flushAll([&](Result<void> res) { result = res; });
        f.writer->failNext("database is locked");
        f.writer->completeNext();

        expect(result.has_value() >> fatal);
        expect(!*result);
        expect(error_msg(*result).find("database is locked") != std::string::npos);
        expect(f.saver->pendingCount(UpdateCategory::Position) == 1_ul);
    };

    "flush requested in flight runs after the current one"_test = [] {
        Fixture f;
        expect((f.saver != nullptr) >> fatal);

        f.saver->queuePositionUpdate("a", {1, 1});
        f.saver->flushPositions();
        f.saver->queuePositionUpdate("b", {2, 2});

        bool done = false;
        f.saver->flushPositions([&](Result<void> res) { done = res.has_value(); });
        expect(f.writer->submittedCount() == 1_ul) << "one write at a time per category";

        f.writer->completeNext();
        expect(f.writer->submittedCount() == 2_ul);
        expect(positionIn(f.writer->history()[1], "b").has_value());
        expect(!done);

        f.writer->completeNext();
        expect(done);
    };

    "tick leaves an in-flight category alone"_test = [] {
        Fixture f;
        expect((f.saver != nullptr) >> fatal);

        f.saver->queuePositionUpdate("a", {1, 1});
        f.saver->flushPositions();
        f.saver->queuePositionUpdate("a", {2, 2});
        f.run(100ms);
        expect(f.writer->submittedCount() == 1_ul);

        f.writer->completeNext();
        f.run(10ms);
        expect(f.writer->submittedCount() == 2_ul);
    };

    "endDrag flushes the final position at once"_test = [] {
        Fixture f;
        expect((f.saver != nullptr) >> fatal);

        f.saver->queuePositionUpdate("b1", {3, 3});
        bool done = false;
        f.saver->endDrag("b1", {7, 7}, [&](Result<void> res) { done = res.has_value(); });

        expect((f.writer->submittedCount() == 1_ul) >> fatal);
        expect(positionIn(f.writer->history()[0], "b1") == std::optional<Point>(Point{7, 7}));
        f.writer->completeNext();
        expect(done);
    };

    "pending values are readable before the flush"_test = [] {
        Fixture f;
        expect((f.saver != nullptr) >> fatal);

        expect(!f.saver->pendingPosition("b1").has_value());
        f.saver->queuePositionUpdate("b1", {4, 2});
        f.saver->queueContentUpdate("b1", "draft");
        expect(f.saver->pendingPosition("b1") == std::optional<Point>(Point{4, 2}));
        expect(f.saver->pendingContent("b1") == std::optional<std::string>("draft"));
        expect(f.saver->pendingCount(UpdateCategory::Content) == 1_ul);
    };

    "lifecycle events flush everything"_test = [] {
        Fixture f;
        expect((f.saver != nullptr) >> fatal);
        auto loop = base::EventLoop::instance();
        expect(loop.has_value() >> fatal);

        expect(f.saver->attach(*loop).has_value() >> fatal);
        expect(!f.saver->attach(*loop)) << "attach twice";

        f.saver->queuePositionUpdate("b1", {1, 1});
        expect((*loop)->dispatch(base::Event::willResignActive()).has_value());
        expect(f.writer->submittedCount() == 1_ul);
        f.writer->completeNext();
        expect(!f.saver->hasPendingUpdates());

        expect(f.saver->detach().has_value());
        f.saver->queuePositionUpdate("b1", {2, 2});
        expect((*loop)->dispatch(base::Event::willTerminate()).has_value());
        expect(f.writer->submittedCount() == 1_ul) << "detached saver ignores lifecycle";
    };
};
