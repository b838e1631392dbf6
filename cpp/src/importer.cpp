// docflow/cpp/src/importer.cpp
#include "docflow/importer.h"
#include "docflow/content_type.h"
#include "docflow/errors.h"
#include "docflow/flow.h"
#include "docflow/log.h"

#include "text_common.h"

#include <fstream>
#include <iomanip>
#include <random>
#include <sstream>

namespace fs = std::filesystem;

namespace docflow {

namespace {

std::string random_id() {
    static thread_local std::mt19937_64 rng{std::random_device{}()};
    std::ostringstream oss;
    oss << std::hex << std::setfill('0') << std::setw(16) << rng() << std::setw(16) << rng();
    return oss.str();
}

// extension of the reference path, without '#'/'?' suffixes
std::string reference_extension(const std::string& reference) {
    std::string path = reference;
    const size_t cut = path.find_first_of("#?");
    if (cut != std::string::npos) path.resize(cut);
    std::string ext = fs::path(path).extension().string();
    if (!ext.empty() && ext[0] == '.') ext.erase(0, 1);
    return ext;
}

std::string extension_for_type(const std::string& content_type) {
    const std::string family = content_family(content_type);
    if (family == "pdf") return "pdf";
    if (family == "text") return "txt";
    if (family == "html") return "html";
    if (family == "xml") return "xml";
    if (family == "json") return "json";
    if (base_content_type(content_type) == "application/zip") return "zip";
    return "";
}

} // namespace

ImporterRequest ImporterRequest::from_bytes(std::string reference, std::string content) {
    ImporterRequest r;
    r.reference = std::move(reference);
    r.bytes = std::move(content);
    return r;
}

ImporterRequest ImporterRequest::from_file(std::filesystem::path p, std::string reference) {
    ImporterRequest r;
    r.file = std::move(p);
    r.reference = std::move(reference);
    return r;
}

ImporterRequest ImporterRequest::from_stream(std::istream& in, std::string reference) {
    ImporterRequest r;
    r.stream = &in;
    r.reference = std::move(reference);
    return r;
}

Importer::Importer(ImporterConfig config, EventManager events)
    : cfg_(std::move(config)), events_(std::move(events)), streams_(cfg_.streams) {}

void Importer::fire(EventType type, const Doc& doc, const std::string& subject, ParseState state,
                    const std::string& error) const {
    Event e;
    e.type = type;
    e.reference = doc.reference();
    e.subject = subject;
    e.parse_state = state;
    e.error = error;
    events_.fire(e);
}

std::unique_ptr<Doc> Importer::to_document(const ImporterRequest& req) {
    std::string ref(trim_view(req.reference));
    std::unique_ptr<ContentStream> content;

    if (req.stream) {
        content = streams_.open(*req.stream);
    } else if (!req.file.empty()) {
        std::error_code ec;
        if (!fs::is_regular_file(req.file, ec)) {
            throw ImporterException("File does not exist or is not a file: " +
                                    fs::absolute(req.file, ec).string());
        }
        content = streams_.open_file(req.file);
        if (ref.empty()) ref = fs::absolute(req.file, ec).string();
    } else if (req.bytes) {
        content = streams_.from_bytes(*req.bytes);
    } else {
        content = streams_.empty_stream();
    }

    DocInfo info(ref);
    info.content_type = req.content_type;
    info.content_encoding = req.content_encoding;

    Metadata meta(cfg_.case_sensitive_fields);
    meta.load_from(req.metadata);
    return std::make_unique<Doc>(std::move(info), std::move(content), std::move(meta));
}

std::unique_ptr<ImporterResponse> Importer::import_document(const ImporterRequest& req) {
    std::unique_ptr<Doc> doc;
    try {
        doc = to_document(req);
    } catch (const DocflowException& e) {
        const std::string ref = req.reference.empty() ? req.file.string() : req.reference;
        log_warn("importer request failed: " + ref + ": " + e.what());
        return std::make_unique<ImporterResponse>(
            ref, ImporterStatus::error(e.code(), e.what(), "Importer request failed: " + ref));
    }
    return import_document(std::move(doc));
}

std::unique_ptr<ImporterResponse> Importer::import_document(std::unique_ptr<Doc> doc) {
    if (!doc) {
        return std::make_unique<ImporterResponse>(
            "", ImporterStatus::error(ErrorCode::InvalidArgs, "null document",
                                      "Importer request failed: no document"));
    }
    const bool is_root = doc->info().is_root();
    auto response = import_tree(std::move(doc));
    if (is_root && !cfg_.response_processors.empty()) process_response(*response);
    return response;
}

void Importer::prepare_document(Doc& doc) {
    DocInfo& info = doc.info();

    if (trim_view(info.content_type).empty()) {
        std::string ct;
        if (cfg_.detector) {
            try {
                ct = cfg_.detector->detect(doc.content(), doc.reference());
            } catch (const std::exception& e) {
                log_warn("could not detect content type of " + doc.reference() +
                         ", defaulting to \"" + OCTET_STREAM + "\": " + e.what());
            } catch (...) {
                log_warn("could not detect content type of " + doc.reference() +
                         ", defaulting to \"" + OCTET_STREAM + "\": unknown exception");
            }
        }
        info.content_type = ct.empty() ? std::string(OCTET_STREAM) : ct;
    }

    Metadata& meta = doc.metadata();
    meta.set(fields::REFERENCE, doc.reference());
    meta.set(fields::CONTENT_TYPE, info.content_type);
    const std::string family = content_family(info.content_type);
    if (!family.empty()) meta.set(fields::CONTENT_FAMILY, family);
    if (!is_blank(info.content_encoding)) meta.set(fields::CONTENT_ENCODING, info.content_encoding);
    if (!meta.has(fields::IMPORTED_DATE)) meta.set(fields::IMPORTED_DATE, utc_now_iso());
}

std::unique_ptr<ImporterResponse> Importer::import_tree(std::unique_ptr<Doc> doc) {
    const std::string ref = doc->reference();
    std::vector<std::unique_ptr<Doc>> children;
    ImporterStatus status;

    try {
        prepare_document(*doc);
        status = process_document(*doc, children);
    } catch (const DocflowException& e) {
        log_warn("could not import document: " + ref + ": " + e.what());
        status = ImporterStatus::error(e.code(), e.what(),
                                       std::string("Could not import document: ") + e.what());
    } catch (const std::exception& e) {
        log_warn("could not import document: " + ref + ": " + e.what());
        status = ImporterStatus::error(ErrorCode::HandlerError, e.what(),
                                       std::string("Could not import document: ") + e.what());
    } catch (...) {
        log_warn("could not import document: " + ref + ": unknown exception");
        status = ImporterStatus::error(ErrorCode::HandlerError, "unknown exception",
                                       "Could not import document: unknown exception");
    }

    if (!status.is_success()) {
        // a rejected or failed parent does not hand out its children
        if (!children.empty()) {
            log_debug("discarding " + std::to_string(children.size()) + " child document(s) of " +
                      ref + " (" + status_name(status.status()) + ")");
        }
        for (auto& c : children) c->dispose();
        doc->dispose();
        return std::make_unique<ImporterResponse>(ref, std::move(status));
    }

    auto response = std::make_unique<ImporterResponse>(std::move(doc));
    for (auto& child : children) {
        const int depth = (int)child->info().embedded_parent_references.size();
        if (cfg_.max_embedded_depth >= 0 && depth > cfg_.max_embedded_depth) {
            log_warn("max_embedded_depth=" + std::to_string(cfg_.max_embedded_depth) +
                     " reached, dropping: " + child->reference());
            child->dispose();
            continue;
        }
        response->add_nested_response(import_tree(std::move(child)));
    }
    return response;
}

ImporterStatus Importer::process_document(Doc& doc, std::vector<std::unique_ptr<Doc>>& children) {
    {
        HandlerContext ctx(doc, ParseState::Pre, streams_, events_);
        ImporterStatus st = HandlerExecutor::execute_phase(cfg_.pre_parse_steps, ctx);
        for (auto& c : ctx.child_docs()) children.push_back(std::move(c));
        if (!st.is_success()) return st;
    }

    parse_document(doc, children);

    HandlerContext ctx(doc, ParseState::Post, streams_, events_);
    ImporterStatus st = HandlerExecutor::execute_phase(cfg_.post_parse_steps, ctx);
    for (auto& c : ctx.child_docs()) children.push_back(std::move(c));
    return st;
}

void Importer::parse_document(Doc& doc, std::vector<std::unique_ptr<Doc>>& children) {
    if (!cfg_.parser_factory) return;

    std::shared_ptr<Parser> parser =
        cfg_.parser_factory->get_parser(doc.reference(), doc.info().content_type);

    if (doc.content().empty()) {
        log_debug("no content for: " + doc.reference());
        return;
    }
    if (!parser) {
        log_debug("no parser for: " + doc.reference() + " (" + doc.info().content_type + ")");
        return;
    }

    const std::string name = parser->name();
    fire(EventType::ParserBegin, doc, name, ParseState::Pre);

    auto out = streams_.new_writer();
    std::vector<std::unique_ptr<Doc>> embedded;
    try {
        doc.content().rewind();
        HandlerDoc hdoc(doc, streams_);
        embedded = parser->parse(hdoc, doc.content(), *out);
    } catch (const std::exception& e) {
        fire(EventType::ParserError, doc, name, ParseState::Pre, e.what());
        if (!cfg_.parse_errors_save_dir.empty()) save_parse_error(doc, name, e.what());

        const auto* de = dynamic_cast<const DocflowException*>(&e);
        if (de && de->code() == ErrorCode::IoError) throw;
        throw ParseException("Could not parse " + doc.reference() + " with " + name + ": " + e.what());
    } catch (...) {
        fire(EventType::ParserError, doc, name, ParseState::Pre, "unknown exception");
        if (!cfg_.parse_errors_save_dir.empty()) save_parse_error(doc, name, "unknown exception");
        throw ParseException("Could not parse " + doc.reference() + " with " + name +
                             ": unknown exception");
    }

    if (is_blank(doc.info().content_encoding)) {
        doc.info().content_encoding = doc.metadata().get(fields::CONTENT_ENCODING);
    }

    fire(EventType::ParserEnd, doc, name, ParseState::Post);

    if (out->empty()) {
        log_debug("parser \"" + name + "\" did not produce content for: " + doc.reference());
        doc.set_content(streams_.empty_stream());
    } else {
        doc.set_content(out->to_stream());
    }

    size_t index = 0;
    for (auto& child : embedded) {
        if (!child) continue;
        stamp_child(doc, *child, index++);
        children.push_back(std::move(child));
    }
}

void Importer::save_parse_error(Doc& doc, const std::string& parser, const std::string& what) {
    const fs::path& dir = cfg_.parse_errors_save_dir;
    std::error_code ec;
    fs::create_directories(dir, ec);
    if (ec) {
        log_error("cannot create parse errors dir: " + dir.string() + " err=" + ec.message());
        return;
    }

    const std::string id = random_id();

    {
        std::ofstream out(dir / (id + "-error.txt"), std::ios::binary);
        if (!out) {
            log_error("cannot save parse exception for: " + doc.reference());
        } else {
            out << "reference: " << doc.reference() << "\n"
                << "parser: " << parser << "\n"
                << "error: " << what << "\n";
        }
    }

    {
        std::ofstream out(dir / (id + "-meta.txt"), std::ios::binary);
        if (!out) {
            log_error("cannot save parse error metadata for: " + doc.reference());
        } else {
            for (const auto& e : doc.metadata().entries()) {
                for (const auto& v : e.second) out << e.first << "=" << v << "\n";
            }
        }
    }

    std::string ext = reference_extension(doc.reference());
    if (ext.empty()) ext = extension_for_type(doc.info().content_type);
    if (ext.empty()) ext = "unknown";

    try {
        std::ofstream out(dir / (id + "-content." + ext), std::ios::binary);
        if (!out) {
            log_error("cannot save parse error content for: " + doc.reference());
            return;
        }
        ContentStream& content = doc.content();
        content.rewind();
        std::string buf(64 * 1024, '\0');
        size_t n = 0;
        while ((n = content.read(&buf[0], buf.size())) > 0) {
            out.write(buf.data(), (std::streamsize)n);
        }
        content.rewind();
    } catch (const StreamException& e) {
        log_error("cannot save parse error content for: " + doc.reference() + ": " + e.what());
    }
}

void Importer::process_response(ImporterResponse& response) {
    for (const auto& proc : cfg_.response_processors) {
        if (!proc) continue;
        try {
            proc->process(response);
        } catch (const std::exception& e) {
            log_error("response processor failed for " + response.reference() + ": " + e.what());
        } catch (...) {
            log_error("response processor failed for " + response.reference() +
                      ": unknown exception");
        }
    }
}

} // namespace docflow
