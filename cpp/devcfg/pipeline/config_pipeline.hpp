/*
===============================================================================
Configuration Retrieval Pipeline
File: config_pipeline.hpp
===============================================================================

Fetch -> Sanitize -> Validate -> Normalize, strictly in that order.

  - Fetch       HTTP GET (or local file read when settings.input_path is set);
                the raw body is written to the raw artifact path only after
                the fetch succeeded.
  - Sanitize    drop header remnants in front of the document.
  - Validate    hard parse + markup lint; rejection keeps the raw artifact
                for inspection and leaves the canonical artifact alone.
  - Normalize   canonical indentation, atomic replacement of the canonical
                artifact, raw artifact removed unless keep_raw.

Every stage failure is an exception from devcfg/core/errors.hpp; nothing is
retried here.
===============================================================================
*/

#pragma once

#include "devcfg/core/hashing.hpp"
#include "devcfg/core/settings.hpp"
#include "devcfg/validate/manifest_validator.hpp"

#include <cstddef>
#include <optional>
#include <string>

namespace devcfg::pipeline {

struct PipelineReport final {
    std::string source;                 // endpoint URL or input file

    unsigned http_status = 0;           // 0 in offline mode
    std::size_t bytes_received = 0;
    bool header_repaired = false;
    int lines_stripped = 0;

    validate::ValidationReport validation;

    std::string canonical_path;
    std::size_t canonical_bytes = 0;
    Hash64 canonical_hash{};
    std::optional<Hash64> previous_hash;
    bool changed = true;

    std::string raw_path;               // empty when no raw artifact remains
};

PipelineReport run_pipeline(const PipelineSettings& settings);

} // namespace devcfg::pipeline
