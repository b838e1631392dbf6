// docflow/cpp/include/docflow/flow.h
#pragma once
#include <memory>
#include <string>
#include <variant>
#include <vector>

#include "docflow/condition.h"
#include "docflow/content_stream.h"
#include "docflow/doc.h"
#include "docflow/event.h"
#include "docflow/handler.h"
#include "docflow/response.h"

namespace docflow {

struct Step;
using Steps = std::vector<Step>;

// Runs `handler` when there are no restrictions or any of them matches.
struct HandlerStep {
    HandlerRef handler;
    std::vector<std::shared_ptr<RestrictionPredicate>> restrictions;
};

// if (condition != negate) then_steps else else_steps
struct ConditionalStep {
    std::shared_ptr<Condition> condition;
    bool negate{false};
    Steps then_steps;
    Steps else_steps;
};

struct Step {
    std::variant<HandlerStep, ConditionalStep> node;
};

Step handler_step(HandlerRef handler,
                  std::vector<std::shared_ptr<RestrictionPredicate>> restrictions = {});
Step if_step(std::shared_ptr<Condition> condition, Steps then_steps, Steps else_steps = {});
Step if_not_step(std::shared_ptr<Condition> condition, Steps then_steps, Steps else_steps = {});
Step reject_step(std::string description = "Rejected by flow.");

struct IncludeResolver {
    bool has_includes{false};
    bool at_least_one_include_match{false};

    bool passes() const { return !has_includes || at_least_one_include_match; }
};

// One per document per phase.
class HandlerContext {
public:
    HandlerContext(Doc& doc, ParseState state, StreamFactory& streams, const EventManager& events)
        : doc_(doc), state_(state), streams_(streams), events_(events) {}

    Doc& doc() { return doc_; }
    ParseState parse_state() const { return state_; }
    StreamFactory& streams() { return streams_; }
    const EventManager& events() const { return events_; }

    bool is_rejected() const { return rejected_; }
    void set_rejected_by(std::shared_ptr<Filter> filter, std::string description);
    const std::shared_ptr<Filter>& rejected_by() const { return rejected_by_; }
    const std::string& rejection_description() const { return rejection_description_; }

    IncludeResolver& include_resolver() { return includes_; }
    const IncludeResolver& include_resolver() const { return includes_; }

    std::vector<std::unique_ptr<Doc>>& child_docs() { return children_; }

private:
    Doc& doc_;
    ParseState state_;
    StreamFactory& streams_;
    const EventManager& events_;

    bool rejected_{false};
    std::shared_ptr<Filter> rejected_by_;
    std::string rejection_description_;

    IncludeResolver includes_;
    std::vector<std::unique_ptr<Doc>> children_;
};

// Walks a phase's steps. Stops at the first rejection; a failing handler or
// condition throws HandlerException after firing HANDLER_ERROR.
class HandlerExecutor {
public:
    static void execute(const Steps& steps, HandlerContext& ctx);

    // execute() + include-filter resolution
    static ImporterStatus execute_phase(const Steps& steps, HandlerContext& ctx);

private:
    static void run_handler(const HandlerStep& step, HandlerContext& ctx);
    static bool test_condition(const ConditionalStep& step, HandlerContext& ctx);
};

constexpr const char* NO_INCLUDE_MATCH_DESCRIPTION =
    "None of the filters with onMatch being INCLUDE got matched.";

// Ancestry of a freshly split/embedded child: parent chain + parent
// reference, plus the matching metadata fields.
void stamp_child(const Doc& parent, Doc& child, size_t embedded_index);

} // namespace docflow
