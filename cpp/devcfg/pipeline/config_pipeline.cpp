/*
===============================================================================
Configuration Retrieval Pipeline
File: config_pipeline.cpp
===============================================================================
*/

#include "config_pipeline.hpp"

#include "devcfg/core/errors.hpp"
#include "devcfg/core/logging.hpp"
#include "devcfg/fetch/endpoint.hpp"
#include "devcfg/fetch/http_fetcher.hpp"
#include "devcfg/normalize/atomic_file.hpp"
#include "devcfg/normalize/canonical_form.hpp"
#include "devcfg/pipeline/instance_lock.hpp"
#include "devcfg/sanitize/transport_sanitizer.hpp"

#include <utility>

namespace devcfg::pipeline {

namespace {

std::string acquire(const PipelineSettings& s, PipelineReport& rep) {
    if (s.offline()) {
        rep.source = s.input_path;
        log_info("fetch: reading " + s.input_path);
        std::string body = normalize::read_file(s.input_path);
        rep.bytes_received = body.size();
        return body;
    }

    const auto ep = fetch::parse_endpoint(s.fetch.url);
    rep.source = ep.to_string();

    auto fr = fetch::fetch_manifest(ep, s.fetch);
    rep.http_status = fr.status;
    rep.bytes_received = fr.bytes_received;
    rep.header_repaired = fr.header_repaired;

    const std::string raw_path = s.output.effective_raw_path();
    normalize::write_file_atomic(raw_path, fr.body);
    rep.raw_path = raw_path;
    log_debug("fetch: raw artifact " + raw_path);

    return std::move(fr.body);
}

} // namespace

PipelineReport run_pipeline(const PipelineSettings& s) {
    s.validate_or_throw();

    std::optional<InstanceLock> lock;
    if (s.output.lock) lock.emplace(s.output.lock_path());

    PipelineReport rep;
    rep.canonical_path = s.output.canonical_path;

    // 1) Fetch
    const std::string body = acquire(s, rep);

    // 2) Sanitize
    const auto sr = sanitize::sanitize_body(body, s.sanitize);
    rep.lines_stripped = sr.lines_stripped;
    if (sr.changed()) {
        log_warn("sanitize: stripped " + std::to_string(sr.lines_stripped) +
                 " leading line(s) of transport garbage (policy " + to_string(sr.policy) + ")");
    }

    // 3) Validate
    rep.validation = validate::validate_manifest(sr.document, s.validate);
    log_info("validate: " + std::string(validate::to_string(rep.validation.outcome)) +
             (rep.validation.root_name.empty() ? std::string()
                                               : ", root <" + rep.validation.root_name + ">, " +
                                                     std::to_string(rep.validation.element_count) +
                                                     " elements"));
    validate::require_acceptable(rep.validation, s.validate);

    // 4) Normalize
    const std::string canonical = normalize::canonicalize(sr.document, s.normalize);
    rep.canonical_bytes = canonical.size();
    rep.canonical_hash = fingerprint(canonical);

    if (auto prev = normalize::read_file_if_exists(s.output.canonical_path)) {
        rep.previous_hash = fingerprint(*prev);
        rep.changed = (*prev != canonical);
    }

    normalize::write_file_atomic(s.output.canonical_path, canonical);
    log_info("normalize: wrote " + s.output.canonical_path + " (" + std::to_string(canonical.size()) +
             " bytes, fnv1a64 " + hash_to_hex(rep.canonical_hash) + ", " +
             (rep.changed ? "changed" : "unchanged") + ")");

    if (!rep.raw_path.empty() && !s.output.keep_raw) {
        if (normalize::remove_file(rep.raw_path)) rep.raw_path.clear();
    }

    return rep;
}

} // namespace devcfg::pipeline
