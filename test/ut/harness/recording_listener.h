#pragma once

//=============================================================================
// RecordingListener - EventListener that keeps every event it sees
//=============================================================================

#include <slate/base/event-listener.h>
#include <vector>

namespace slate::test {

class RecordingListener : public base::EventListener {
public:
    static std::shared_ptr<RecordingListener> create() {
        return std::shared_ptr<RecordingListener>(new RecordingListener());
    }

    Result<bool> onEvent(const base::Event& event) override {
        _events.push_back(event);
        return Ok(_consume);
    }

    const std::vector<base::Event>& events() const { return _events; }
    void setConsume(bool consume) { _consume = consume; }

private:
    RecordingListener() = default;

    std::vector<base::Event> _events;
    bool _consume = false;
};

} // namespace slate::test
