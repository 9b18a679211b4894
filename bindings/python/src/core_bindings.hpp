#pragma once
// Core bindings: Stage enum, tip table, context formatting helpers

#include <nanobind/nanobind.h>
#include <nanobind/stl/string.h>

#include <pmx/context_format.hpp>
#include <pmx/presentation.hpp>
#include <pmx/types.hpp>

#include <string>

namespace nb = nanobind;
using namespace nb::literals;

namespace pmx_python {

inline void bind_core(nb::module_& m) {
    // =========================================================================
    // Stage enum
    // =========================================================================

    nb::enum_<pmx::Stage>(m, "Stage", "Pipeline stage that produced a failure")
        .value("http", pmx::Stage::http, "Network/transport layer")
        .value("data_source", pmx::Stage::data_source, "Remote API domain layer")
        .value("parse", pmx::Stage::parse, "Raw text to typed structures")
        .value("normalization", pmx::Stage::normalization, "Canonical schema standardization")
        .value("analysis", pmx::Stage::analysis, "Analytical engine")
        .value("output", pmx::Stage::output, "Formatting and output")
        .def("__str__", [](pmx::Stage s) { return std::string(pmx::stage_name(s)); })
        .def("__repr__",
             [](pmx::Stage s) { return std::string("Stage.") + std::string(pmx::stage_name(s)); });

    m.def(
        "stage_label", [](pmx::Stage s) { return std::string(pmx::stage_label(s)); }, "stage"_a,
        "Human-readable stage label used as the message prefix");

    m.def(
        "tip_for", [](pmx::Stage s) { return std::string(pmx::tip_for(s)); }, "stage"_a,
        "Remediation tip shown for failures of a stage");

    // =========================================================================
    // Context formatting
    // =========================================================================

    m.attr("DEFAULT_SNIPPET_LENGTH") = pmx::kDefaultSnippetLength;
    m.attr("MAX_BODY_DISPLAY_LENGTH") = pmx::kMaxBodyDisplayLength;

    m.def(
        "truncate_for_display",
        [](const std::string& text, std::size_t max_len) {
            return pmx::truncate_for_display(text, max_len);
        },
        "text"_a, "max_len"_a, "Bound a string for display, marking the cut");

    m.def(
        "json_error_snippet",
        [](const std::string& text, std::size_t max_len) {
            return pmx::json_error_snippet(text, max_len);
        },
        "text"_a, "max_len"_a = pmx::kDefaultSnippetLength,
        "Most useful region of a raw JSON payload, at most max_len bytes");

    m.def(
        "json_error_snippet_at",
        [](const std::string& text, std::size_t error_offset, std::size_t max_len) {
            return pmx::json_error_snippet(text, error_offset, max_len);
        },
        "text"_a, "error_offset"_a, "max_len"_a = pmx::kDefaultSnippetLength,
        "JSON snippet centred on a parser-reported byte offset");
}

} // namespace pmx_python
