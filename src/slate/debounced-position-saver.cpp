#include <slate/debounced-position-saver.h>
#include <ytrace/ytrace.hpp>
#include <unordered_map>
#include <vector>

namespace slate {

namespace {

using TimePoint = Clock::TimePoint;
using Duration = Clock::Duration;
using FlushCallback = DebouncedPositionSaver::FlushCallback;

// Pending values and debounce state of one category
template<typename V>
struct Channel {
    UpdateCategory category;
    Duration interval;

    std::unordered_map<std::string, V> pending;
    // Armed while pending and waiting for quiet; disarmed means "no timer"
    std::optional<TimePoint> deadline;
    // When the oldest unflushed value arrived
    std::optional<TimePoint> pendingSince;

    bool inFlight = false;
    // A flush was requested while one was in flight
    bool flushRequested = false;
    std::vector<FlushCallback> inFlightCallbacks;
    std::vector<FlushCallback> deferredCallbacks;

    Channel(UpdateCategory c, Duration i) : category(c), interval(i) {}
};

template<typename V>
std::optional<V> lookup(const Channel<V>& ch, const std::string& blockId) {
    auto it = ch.pending.find(blockId);
    if (it == ch.pending.end()) return std::nullopt;
    return it->second;
}

void invokeAll(std::vector<FlushCallback>& callbacks, const Result<void>& res) {
    auto pending = std::move(callbacks);
    callbacks.clear();
    for (auto& cb : pending) {
        if (cb) cb(res);
    }
}

} // namespace

class DebouncedPositionSaverImpl : public DebouncedPositionSaver {
public:
    DebouncedPositionSaverImpl(StoreWriter::Ptr writer, Clock::Ptr clock, Config config)
        : _writer(std::move(writer)),
          _clock(std::move(clock)),
          _config(config),
          _positions(UpdateCategory::Position, config.positionDebounce),
          _sizes(UpdateCategory::Size, config.sizeDebounce),
          _content(UpdateCategory::Content, config.contentDebounce) {}

    ~DebouncedPositionSaverImpl() override {
        if (hasPendingUpdates()) {
            ywarn("DebouncedPositionSaver: destroyed with {} position, {} size, {} content updates unflushed",
                  _positions.pending.size(), _sizes.pending.size(), _content.pending.size());
        }
        if (_loop && _timerId >= 0) {
            if (auto res = _loop->destroyTimer(_timerId); !res) {
                ywarn("DebouncedPositionSaver: failed to destroy tick timer: {}", error_msg(res));
            }
        }
    }

    Result<void> init() noexcept {
        if (!_writer) return Err<void>("DebouncedPositionSaver: null store writer");
        if (!_clock) return Err<void>("DebouncedPositionSaver: null clock");
        if (_config.maxPendingTime.count() <= 0) {
            return Err<void>("DebouncedPositionSaver: maxPendingTime must be positive");
        }
        if (_config.tickInterval.count() <= 0) {
            return Err<void>("DebouncedPositionSaver: tickInterval must be positive");
        }
        return Ok();
    }

    // ─── Queueing ────────────────────────────────────────────────────────

    void queuePositionUpdate(const std::string& blockId, Point position) override {
        queue(_positions, blockId, position);
    }

    void queueSizeUpdate(const std::string& blockId, Extent size) override {
        queue(_sizes, blockId, size);
    }

    void queueContentUpdate(const std::string& blockId, std::string content) override {
        queue(_content, blockId, std::move(content));
    }

    void endDrag(const std::string& blockId, Point finalPosition, FlushCallback done) override {
        _positions.pending.insert_or_assign(blockId, finalPosition);
        if (!_positions.pendingSince) {
            _positions.pendingSince = _clock->now();
        }
        flush(_positions, std::move(done));
    }

    // ─── Flushing ────────────────────────────────────────────────────────

    void flushPositions(FlushCallback done) override { flush(_positions, std::move(done)); }
    void flushSizes(FlushCallback done) override { flush(_sizes, std::move(done)); }
    void flushContent(FlushCallback done) override { flush(_content, std::move(done)); }

    void flushAll(FlushCallback done) override {
        _positions.deadline.reset();
        _sizes.deadline.reset();
        _content.deadline.reset();

        std::weak_ptr<DebouncedPositionSaverImpl> weak = weakAs<DebouncedPositionSaverImpl>();
        flush(_positions, [weak, done](Result<void> positionsRes) {
            auto self = weak.lock();
            if (!self) {
                if (done) done(positionsRes);
                return;
            }
            self->flush(self->_sizes, [weak, done, positionsRes](Result<void> sizesRes) {
                auto strong = weak.lock();
                if (!strong) {
                    if (done) done(!positionsRes ? positionsRes : sizesRes);
                    return;
                }
                strong->flush(strong->_content, [done, positionsRes, sizesRes](Result<void> contentRes) {
                    if (!done) return;
                    if (!positionsRes) done(positionsRes);
                    else if (!sizesRes) done(sizesRes);
                    else done(contentRes);
                });
            });
        });
    }

    void tick() override {
        const TimePoint now = _clock->now();
        tick(_positions, now);
        tick(_sizes, now);
        tick(_content, now);
    }

    // ─── Queries ─────────────────────────────────────────────────────────

    bool hasPendingUpdates() const override {
        return !_positions.pending.empty() || !_sizes.pending.empty() || !_content.pending.empty();
    }

    bool isFlushing(UpdateCategory category) const override {
        switch (category) {
            case UpdateCategory::Position: return _positions.inFlight;
            case UpdateCategory::Size: return _sizes.inFlight;
            case UpdateCategory::Content: return _content.inFlight;
        }
        return false;
    }

    size_t pendingCount(UpdateCategory category) const override {
        switch (category) {
            case UpdateCategory::Position: return _positions.pending.size();
            case UpdateCategory::Size: return _sizes.pending.size();
            case UpdateCategory::Content: return _content.pending.size();
        }
        return 0;
    }

    std::optional<Point> pendingPosition(const std::string& blockId) const override {
        return lookup(_positions, blockId);
    }

    std::optional<Extent> pendingSize(const std::string& blockId) const override {
        return lookup(_sizes, blockId);
    }

    std::optional<std::string> pendingContent(const std::string& blockId) const override {
        return lookup(_content, blockId);
    }

    // ─── Event loop wiring ───────────────────────────────────────────────

    Result<void> attach(base::EventLoop::Ptr loop) override {
        if (!loop) return Err<void>("DebouncedPositionSaver: null event loop");
        if (_loop) return Err<void>("DebouncedPositionSaver: already attached");

        auto timerRes = loop->createTimer();
        if (!timerRes) {
            return Err<void>("DebouncedPositionSaver: failed to create tick timer", timerRes);
        }
        const base::TimerId timerId = *timerRes;

        auto self = sharedAs<EventListener>();
        if (auto res = loop->configTimer(timerId, static_cast<base::Timeout>(_config.tickInterval.count())); !res) {
            return Err<void>("DebouncedPositionSaver: failed to configure tick timer", res);
        }
        if (auto res = loop->registerTimerListener(timerId, self); !res) {
            return Err<void>("DebouncedPositionSaver: failed to register tick listener", res);
        }
        if (auto res = loop->registerListener(base::Event::Type::WillResignActive, self); !res) {
            return Err<void>("DebouncedPositionSaver: failed to register lifecycle listener", res);
        }
        if (auto res = loop->registerListener(base::Event::Type::WillTerminate, self); !res) {
            return Err<void>("DebouncedPositionSaver: failed to register lifecycle listener", res);
        }
        if (auto res = loop->startTimer(timerId); !res) {
            return Err<void>("DebouncedPositionSaver: failed to start tick timer", res);
        }

        _loop = std::move(loop);
        _timerId = timerId;
        yinfo("DebouncedPositionSaver: attached, tick={}ms debounce={}/{}/{}ms max-pending={}ms",
              _config.tickInterval.count(), _config.positionDebounce.count(),
              _config.sizeDebounce.count(), _config.contentDebounce.count(),
              _config.maxPendingTime.count());
        return Ok();
    }

    Result<void> detach() override {
        if (!_loop) return Ok();

        auto loop = std::move(_loop);
        _loop.reset();
        const base::TimerId timerId = _timerId;
        _timerId = -1;

        if (auto res = loop->deregisterListener(sharedAs<EventListener>()); !res) {
            return Err<void>("DebouncedPositionSaver: failed to deregister", res);
        }
        if (auto res = loop->destroyTimer(timerId); !res) {
            return Err<void>("DebouncedPositionSaver: failed to destroy tick timer", res);
        }
        return Ok();
    }

    Result<bool> onEvent(const base::Event& event) override {
        switch (event.type) {
            case base::Event::Type::Timer:
                if (event.timer.timerId != _timerId) return Ok(false);
                tick();
                return Ok(true);

            case base::Event::Type::WillResignActive:
            case base::Event::Type::WillTerminate:
                yinfo("DebouncedPositionSaver: lifecycle event, flushing all pending updates");
                flushAll([](Result<void> res) {
                    if (!res) {
                        yerror("DebouncedPositionSaver: lifecycle flush failed: {}", error_msg(res));
                    }
                });
                // Other listeners still need to see the lifecycle event
                return Ok(false);

            default:
                return Ok(false);
        }
    }

private:
    template<typename V>
    void queue(Channel<V>& ch, const std::string& blockId, V value) {
        ch.pending.insert_or_assign(blockId, std::move(value));

        const TimePoint now = _clock->now();
        if (!ch.pendingSince) {
            ch.pendingSince = now;
        }

        if (now - *ch.pendingSince >= _config.maxPendingTime) {
            // Safety flush: continuous activity must not postpone persistence forever
            ydebug("DebouncedPositionSaver: {} pending for {}ms, forcing flush",
                   categoryName(ch.category),
                   std::chrono::duration_cast<std::chrono::milliseconds>(now - *ch.pendingSince).count());
            ch.deadline.reset();
            flush(ch, {});
            return;
        }

        ch.deadline = now + ch.interval;
    }

    template<typename V>
    void tick(Channel<V>& ch, TimePoint now) {
        // An expired deadline waits for the in-flight flush; the next tick picks it up
        if (ch.inFlight || ch.pending.empty()) return;

        const bool expired = ch.deadline && now >= *ch.deadline;
        const bool overdue = ch.pendingSince && now - *ch.pendingSince >= _config.maxPendingTime;
        if (expired || overdue) {
            flush(ch, {});
        }
    }

    template<typename V>
    void flush(Channel<V>& ch, FlushCallback done) {
        if (ch.inFlight) {
            ch.flushRequested = true;
            if (done) ch.deferredCallbacks.push_back(std::move(done));
            return;
        }
        std::vector<FlushCallback> callbacks;
        if (done) callbacks.push_back(std::move(done));
        begin(ch, std::move(callbacks));
    }

    template<typename V>
    void begin(Channel<V>& ch, std::vector<FlushCallback> callbacks) {
        ch.deadline.reset();

        if (ch.pending.empty()) {
            ch.pendingSince.reset();
            invokeAll(callbacks, Ok());
            return;
        }

        // Capture and clear atomically with respect to the loop thread
        auto captured = std::make_shared<std::unordered_map<std::string, V>>(std::move(ch.pending));
        ch.pending.clear();
        ch.pendingSince.reset();

        WriteBatch batch;
        batch.category = ch.category;
        batch.updates.reserve(captured->size());
        for (const auto& [blockId, value] : *captured) {
            batch.updates.push_back({blockId, value});
        }

        ydebug("DebouncedPositionSaver: flushing {} {} updates", batch.updates.size(), categoryName(ch.category));

        ch.inFlight = true;
        ch.inFlightCallbacks = std::move(callbacks);

        std::weak_ptr<DebouncedPositionSaverImpl> weak = weakAs<DebouncedPositionSaverImpl>();
        Channel<V>* channel = &ch;
        _writer->submit(std::move(batch), [weak, channel, captured](Result<void> res) {
            if (auto self = weak.lock()) {
                self->complete(*channel, *captured, std::move(res));
            }
        });
    }

    template<typename V>
    void complete(Channel<V>& ch, const std::unordered_map<std::string, V>& captured, Result<void> res) {
        ch.inFlight = false;

        if (!res) {
            ywarn("DebouncedPositionSaver: failed to flush {} {} updates, re-queueing: {}",
                  captured.size(), categoryName(ch.category), error_msg(res));

            // Last value wins: a value queued during the failed write is newer
            size_t requeued = 0;
            for (const auto& [blockId, value] : captured) {
                if (ch.pending.emplace(blockId, value).second) {
                    requeued++;
                }
            }

            // Retry rides the next debounce cycle with a fresh pending window
            if (!ch.pending.empty()) {
                const TimePoint now = _clock->now();
                if (!ch.pendingSince) {
                    ch.pendingSince = now;
                }
                if (!ch.deadline) {
                    ch.deadline = now + ch.interval;
                }
            }
            ydebug("DebouncedPositionSaver: re-queued {} of {} {} updates",
                   requeued, captured.size(), categoryName(ch.category));
        } else {
            ydebug("DebouncedPositionSaver: flushed {} {} updates", captured.size(), categoryName(ch.category));
        }

        invokeAll(ch.inFlightCallbacks, res);

        if (ch.flushRequested && !ch.inFlight) {
            ch.flushRequested = false;
            auto deferred = std::move(ch.deferredCallbacks);
            ch.deferredCallbacks.clear();
            begin(ch, std::move(deferred));
        }
    }

    StoreWriter::Ptr _writer;
    Clock::Ptr _clock;
    Config _config;

    Channel<Point> _positions;
    Channel<Extent> _sizes;
    Channel<std::string> _content;

    base::EventLoop::Ptr _loop;
    base::TimerId _timerId = -1;
};

Result<DebouncedPositionSaver::Ptr> DebouncedPositionSaver::createImpl(StoreWriter::Ptr writer, Clock::Ptr clock,
                                                                       Config config) noexcept {
    auto impl = Ptr(new DebouncedPositionSaverImpl(std::move(writer), std::move(clock), config));
    if (auto res = static_cast<DebouncedPositionSaverImpl*>(impl.get())->init(); !res) {
        return Err<Ptr>("DebouncedPositionSaver init failed", res);
    }
    return Ok(std::move(impl));
}

} // namespace slate
