// docflow/cpp/include/docflow/event.h
#pragma once
#include <functional>
#include <ostream>
#include <string>
#include <vector>

namespace docflow {

enum class ParseState { Pre, Post };

const char* parse_state_name(ParseState s);

enum class EventType {
    HandlerBegin,
    HandlerEnd,
    HandlerError,
    ConditionBegin,
    ConditionTrue,
    ConditionFalse,
    ParserBegin,
    ParserEnd,
    ParserError,
};

// "IMPORTER_HANDLER_BEGIN", ...
const char* event_type_name(EventType t);

struct Event {
    EventType type{EventType::HandlerBegin};
    std::string reference;   // document being processed
    std::string subject;     // handler / condition / parser name
    ParseState parse_state{ParseState::Pre};
    std::string error;       // what() of the failure, HandlerError/ParserError only
};

using EventListener = std::function<void(const Event&)>;

// Fire-and-forget side channel. A throwing listener is logged and ignored.
class EventManager {
public:
    void add_listener(EventListener l);
    void clear_listeners() { listeners_.clear(); }
    size_t listener_count() const { return listeners_.size(); }

    void fire(const Event& e) const;

private:
    std::vector<EventListener> listeners_;
};

// One line per event, e.g.
// "[docflow] IMPORTER_HANDLER_BEGIN ref=a.pdf subject=ConstantTagger state=pre"
class EventLogger {
public:
    explicit EventLogger(std::ostream& out) : out_(&out) {}
    void operator()(const Event& e) const;

private:
    std::ostream* out_;
};

} // namespace docflow
