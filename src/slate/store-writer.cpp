#include <slate/store-writer.h>
#include <ytrace/ytrace.hpp>
#include <condition_variable>
#include <deque>
#include <mutex>
#include <thread>

namespace slate {

namespace {

class ThreadedStoreWriter : public StoreWriter {
public:
    ThreadedStoreWriter(BlockStore::Ptr store, base::EventLoop::Ptr loop, size_t capacity)
        : _store(std::move(store)), _loop(std::move(loop)), _capacity(capacity) {}

    ~ThreadedStoreWriter() override {
        if (auto res = stop(); !res) {
            yerror("StoreWriter: stop failed: {}", error_msg(res));
        }
    }

    Result<void> init() noexcept {
        if (!_store) return Err<void>("StoreWriter: null store");
        if (!_loop) return Err<void>("StoreWriter: null event loop");
        if (_capacity == 0) return Err<void>("StoreWriter: capacity must be > 0");

        _running = true;
        _thread = std::thread(&ThreadedStoreWriter::workerLoop, this);
        ydebug("StoreWriter: started, capacity={}", _capacity);
        return Ok();
    }

    void submit(WriteBatch batch, Completion done) override {
        const char* reason = nullptr;
        {
            std::lock_guard<std::mutex> lock(_mutex);
            if (_running && _queue.size() < _capacity) {
                _queue.push_back({std::move(batch), std::move(done)});
                _cv.notify_one();
                return;
            }
            reason = _running ? "store writer queue full" : "store writer stopped";
        }

        // Rejected: report through the loop like any other completion
        ywarn("StoreWriter: rejected {} batch of {} updates: {}",
              categoryName(batch.category), batch.updates.size(), reason);
        deliver(std::move(done), Err<void>(reason));
    }

    size_t pendingCount() const override {
        std::lock_guard<std::mutex> lock(_mutex);
        return _queue.size() + (_busy ? 1 : 0);
    }

    Result<void> stop() override {
        {
            std::lock_guard<std::mutex> lock(_mutex);
            if (!_running) return Ok();
            _running = false;
            _cv.notify_all();
        }
        if (_thread.joinable()) {
            _thread.join();
        }
        ydebug("StoreWriter: stopped");
        return Ok();
    }

private:
    struct Job {
        WriteBatch batch;
        Completion done;
    };

    void workerLoop() {
        for (;;) {
            Job job;
            {
                std::unique_lock<std::mutex> lock(_mutex);
                _cv.wait(lock, [this] { return !_queue.empty() || !_running; });
                if (_queue.empty()) {
                    return;  // stopped and drained
                }
                job = std::move(_queue.front());
                _queue.pop_front();
                _busy = true;
            }

            auto res = _store->write(job.batch);
            if (!res) {
                yerror("StoreWriter: {} batch of {} updates failed: {}",
                       categoryName(job.batch.category), job.batch.updates.size(), error_msg(res));
            }
            deliver(std::move(job.done), std::move(res));

            std::lock_guard<std::mutex> lock(_mutex);
            _busy = false;
        }
    }

    void deliver(Completion done, Result<void> res) {
        if (!done) return;
        auto posted = _loop->post([done = std::move(done), res = std::move(res)]() mutable {
            done(std::move(res));
        });
        if (!posted) {
            yerror("StoreWriter: failed to post completion: {}", error_msg(posted));
        }
    }

    BlockStore::Ptr _store;
    base::EventLoop::Ptr _loop;
    size_t _capacity;

    mutable std::mutex _mutex;
    std::condition_variable _cv;
    std::deque<Job> _queue;
    bool _running = false;
    bool _busy = false;
    std::thread _thread;
};

} // namespace

Result<StoreWriter::Ptr> StoreWriter::createThreaded(BlockStore::Ptr store, base::EventLoop::Ptr loop,
                                                     size_t capacity) noexcept {
    auto impl = std::make_shared<ThreadedStoreWriter>(std::move(store), std::move(loop), capacity);
    if (auto res = impl->init(); !res) {
        return Err<Ptr>("StoreWriter init failed", res);
    }
    return Ok(Ptr(std::move(impl)));
}

} // namespace slate
