#include "swarm/core/input_inbox.hpp"

#include <utility>

namespace Input {

bool InputInbox::post(Event event) {
    if (!accepting) {
        return false;
    }
    events.push_back(std::move(event));
    return true;
}

std::vector<Event> InputInbox::drain() {
    std::vector<Event> out;
    out.swap(events);
    return out;
}

void InputInbox::close() {
    accepting = false;
    events.clear();
}

} // namespace Input
