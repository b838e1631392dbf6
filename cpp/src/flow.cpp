// docflow/cpp/src/flow.cpp
#include "docflow/flow.h"
#include "docflow/filters.h"
#include "docflow/log.h"

#include <exception>

namespace docflow {

namespace {

void fire(const HandlerContext& ctx, EventType type, const std::string& subject,
          Doc& doc, const std::string& error = std::string()) {
    Event e;
    e.type = type;
    e.reference = doc.reference();
    e.subject = subject;
    e.parse_state = ctx.parse_state();
    e.error = error;
    ctx.events().fire(e);
}

bool restrictions_allow(const HandlerStep& step, const Metadata& meta) {
    if (step.restrictions.empty()) return true;
    for (const auto& r : step.restrictions) {
        if (r && r->matches(meta)) return true;
    }
    return false;
}

[[noreturn]] void rethrow_as_handler_error(HandlerContext& ctx, const std::string& kind,
                                           const std::string& subject, const std::string& what,
                                           ErrorCode code) {
    Doc& doc = ctx.doc();
    fire(ctx, EventType::HandlerError, subject, doc, what);
    throw HandlerException("Importer failure for " + kind + ": " + subject +
                               " (reference: " + doc.reference() + "): " + what,
                           subject, doc.reference(), code);
}

ErrorCode code_of(const std::exception& e) {
    if (const auto* de = dynamic_cast<const DocflowException*>(&e)) {
        if (de->code() == ErrorCode::IoError) return ErrorCode::IoError;
    }
    return ErrorCode::HandlerError;
}

void tag_document(HandlerContext& ctx, Tagger& tagger) {
    Doc& doc = ctx.doc();
    HandlerDoc hdoc(doc, ctx.streams());
    tagger.tag(hdoc, doc.content(), ctx.parse_state());
}

void accept_document(HandlerContext& ctx, const std::shared_ptr<Filter>& filter) {
    Doc& doc = ctx.doc();
    HandlerDoc hdoc(doc, ctx.streams());
    const bool accepted = filter->accept(hdoc, doc.content(), ctx.parse_state());

    if (filter->on_match() == OnMatch::Include) {
        ctx.include_resolver().has_includes = true;
        if (accepted) ctx.include_resolver().at_least_one_include_match = true;
        return;
    }
    if (!accepted) {
        ctx.set_rejected_by(filter, "Rejected by filter: " + filter->name());
        log_debug("document import rejected: " + doc.reference() + " filter=" + filter->name());
    }
}

void transform_document(HandlerContext& ctx, Transformer& transformer) {
    Doc& doc = ctx.doc();
    HandlerDoc hdoc(doc, ctx.streams());
    auto out = ctx.streams().new_writer();
    transformer.transform(hdoc, doc.content(), *out, ctx.parse_state());

    if (out->empty()) {
        log_debug("transformer \"" + transformer.name() + "\" returned no content for: " +
                  doc.reference());
        return;
    }
    doc.set_content(out->to_stream());
}

void split_document(HandlerContext& ctx, Splitter& splitter) {
    Doc& doc = ctx.doc();
    HandlerDoc hdoc(doc, ctx.streams());
    auto out = ctx.streams().new_writer();
    std::vector<std::unique_ptr<Doc>> children =
        splitter.split(hdoc, doc.content(), *out, ctx.parse_state());

    // writing was performed => the parent keeps the rewritten content
    if (!out->empty()) doc.set_content(out->to_stream());

    size_t index = 0;
    for (auto& child : children) {
        if (!child) {
            log_warn("splitter \"" + splitter.name() + "\" returned a null child for: " +
                     doc.reference());
            continue;
        }
        stamp_child(doc, *child, index++);
        ctx.child_docs().push_back(std::move(child));
    }
}

} // namespace

Step handler_step(HandlerRef handler, std::vector<std::shared_ptr<RestrictionPredicate>> restrictions) {
    if (!handler_ptr(handler)) throw DocflowException(ErrorCode::ConfigError, "handler must not be null");
    Step s;
    s.node = HandlerStep{std::move(handler), std::move(restrictions)};
    return s;
}

Step if_step(std::shared_ptr<Condition> condition, Steps then_steps, Steps else_steps) {
    if (!condition) throw DocflowException(ErrorCode::ConfigError, "condition must not be null");
    Step s;
    s.node = ConditionalStep{std::move(condition), false, std::move(then_steps), std::move(else_steps)};
    return s;
}

Step if_not_step(std::shared_ptr<Condition> condition, Steps then_steps, Steps else_steps) {
    Step s = if_step(std::move(condition), std::move(then_steps), std::move(else_steps));
    std::get<ConditionalStep>(s.node).negate = true;
    return s;
}

Step reject_step(std::string description) {
    return handler_step(std::make_shared<RejectFilter>(std::move(description)));
}

void HandlerContext::set_rejected_by(std::shared_ptr<Filter> filter, std::string description) {
    rejected_ = true;
    rejected_by_ = std::move(filter);
    rejection_description_ = std::move(description);
}

void stamp_child(const Doc& parent, Doc& child, size_t embedded_index) {
    std::vector<std::string> chain = parent.info().embedded_parent_references;
    chain.push_back(parent.reference());
    child.info().embedded_parent_references = chain;

    Metadata& meta = child.metadata();
    meta.set(fields::EMBEDDED_PARENT_REFERENCE, parent.reference());
    meta.set(fields::EMBEDDED_ANCESTOR_REFERENCES, chain);
    meta.set(fields::EMBEDDED_INDEX, std::to_string(embedded_index));
    if (!meta.has(fields::REFERENCE)) meta.set(fields::REFERENCE, child.reference());
}

void HandlerExecutor::run_handler(const HandlerStep& step, HandlerContext& ctx) {
    Doc& doc = ctx.doc();
    if (!restrictions_allow(step, doc.metadata())) {
        log_debug(handler_name(step.handler) + " does not apply to: " + doc.reference());
        return;
    }

    const std::string name = handler_name(step.handler);
    fire(ctx, EventType::HandlerBegin, name, doc);
    try {
        // every handler starts reading at byte 0
        doc.content().rewind();

        if (const auto* t = std::get_if<std::shared_ptr<Tagger>>(&step.handler)) {
            tag_document(ctx, **t);
        } else if (const auto* tr = std::get_if<std::shared_ptr<Transformer>>(&step.handler)) {
            transform_document(ctx, **tr);
        } else if (const auto* f = std::get_if<std::shared_ptr<Filter>>(&step.handler)) {
            accept_document(ctx, *f);
        } else if (const auto* sp = std::get_if<std::shared_ptr<Splitter>>(&step.handler)) {
            split_document(ctx, **sp);
        }
    } catch (const std::exception& e) {
        rethrow_as_handler_error(ctx, "handler", name, e.what(), code_of(e));
    } catch (...) {
        rethrow_as_handler_error(ctx, "handler", name, "unknown exception", ErrorCode::HandlerError);
    }
    fire(ctx, EventType::HandlerEnd, name, doc);
}

bool HandlerExecutor::test_condition(const ConditionalStep& step, HandlerContext& ctx) {
    Doc& doc = ctx.doc();
    const std::string name = step.condition->name();
    fire(ctx, EventType::ConditionBegin, name, doc);
    bool result = false;
    try {
        doc.content().rewind();
        HandlerDoc hdoc(doc, ctx.streams());
        result = step.condition->test(hdoc, doc.content(), ctx.parse_state());
    } catch (const std::exception& e) {
        rethrow_as_handler_error(ctx, "handler condition", name, e.what(), code_of(e));
    } catch (...) {
        rethrow_as_handler_error(ctx, "handler condition", name, "unknown exception",
                                 ErrorCode::HandlerError);
    }
    fire(ctx, result ? EventType::ConditionTrue : EventType::ConditionFalse, name, doc);
    return result != step.negate;
}

void HandlerExecutor::execute(const Steps& steps, HandlerContext& ctx) {
    for (const Step& s : steps) {
        if (ctx.is_rejected()) return;

        if (const auto* hs = std::get_if<HandlerStep>(&s.node)) {
            run_handler(*hs, ctx);
        } else if (const auto* cs = std::get_if<ConditionalStep>(&s.node)) {
            if (test_condition(*cs, ctx)) execute(cs->then_steps, ctx);
            else execute(cs->else_steps, ctx);
        }
    }
}

ImporterStatus HandlerExecutor::execute_phase(const Steps& steps, HandlerContext& ctx) {
    execute(steps, ctx);
    if (ctx.is_rejected()) {
        return ImporterStatus::rejected(ctx.rejected_by(), ctx.rejection_description());
    }
    if (!ctx.include_resolver().passes()) {
        return ImporterStatus::rejected(nullptr, NO_INCLUDE_MATCH_DESCRIPTION);
    }
    return ImporterStatus::success();
}

} // namespace docflow
