// docflow/cpp/src/event.cpp
#include "docflow/event.h"
#include "docflow/log.h"

#include <exception>

namespace docflow {

const char* parse_state_name(ParseState s) {
    return s == ParseState::Pre ? "pre" : "post";
}

const char* event_type_name(EventType t) {
    switch (t) {
        case EventType::HandlerBegin: return "IMPORTER_HANDLER_BEGIN";
        case EventType::HandlerEnd: return "IMPORTER_HANDLER_END";
        case EventType::HandlerError: return "IMPORTER_HANDLER_ERROR";
        case EventType::ConditionBegin: return "IMPORTER_HANDLER_CONDITION_BEGIN";
        case EventType::ConditionTrue: return "IMPORTER_HANDLER_CONDITION_TRUE";
        case EventType::ConditionFalse: return "IMPORTER_HANDLER_CONDITION_FALSE";
        case EventType::ParserBegin: return "IMPORTER_PARSER_BEGIN";
        case EventType::ParserEnd: return "IMPORTER_PARSER_END";
        case EventType::ParserError: return "IMPORTER_PARSER_ERROR";
    }
    return "IMPORTER_UNKNOWN";
}

void EventManager::add_listener(EventListener l) {
    if (l) listeners_.push_back(std::move(l));
}

void EventManager::fire(const Event& e) const {
    for (const auto& l : listeners_) {
        try {
            l(e);
        } catch (const std::exception& ex) {
            log_warn(std::string("event listener failed on ") + event_type_name(e.type) +
                     " ref=" + e.reference + ": " + ex.what());
        } catch (...) {
            log_warn(std::string("event listener failed on ") + event_type_name(e.type) +
                     " ref=" + e.reference + ": unknown exception");
        }
    }
}

void EventLogger::operator()(const Event& e) const {
    *out_ << "[docflow] " << event_type_name(e.type)
          << " ref=" << e.reference
          << " subject=" << e.subject
          << " state=" << parse_state_name(e.parse_state);
    if (!e.error.empty()) *out_ << " error=" << e.error;
    *out_ << "\n";
}

} // namespace docflow
