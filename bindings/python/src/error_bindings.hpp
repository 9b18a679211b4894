#pragma once
// Error bindings: AppError, stage failure factories, Report, PmxError

#include <nanobind/nanobind.h>
#include <nanobind/stl/optional.h>
#include <nanobind/stl/string.h>
#include <nanobind/stl/vector.h>

#include <pmx/app_error.hpp>
#include <pmx/config.hpp>
#include <pmx/presentation.hpp>

#include "py_types.hpp"

#include <chrono>
#include <optional>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

namespace nb = nanobind;
using namespace nb::literals;

namespace pmx_python {

inline void bind_errors(nb::module_& m) {
    using std::chrono::seconds;

    // =========================================================================
    // Custom Exceptions
    // =========================================================================

    auto pmx_error = nb::exception<std::runtime_error>(m, "PmxError", PyExc_RuntimeError);
    pmx_error_type = pmx_error.ptr();

    // =========================================================================
    // AppError - opaque top-level failure
    // =========================================================================

    nb::class_<pmx::AppError>(m, "AppError", "Top-level failure tagged by its stage")
        .def_prop_ro("stage", [](const pmx::AppError& e) { return e.stage(); })
        .def_prop_ro("kind", [](const pmx::AppError& e) { return std::string(e.kind()); })
        .def("message", &pmx::AppError::message, "Rendered '<stage label>: <message>'")
        .def("stage_message", [](const pmx::AppError& e) { return pmx::stage_message(e); })
        .def("raise_", [](const pmx::AppError& e) { raise_pmx_error(e); },
             "Raise PmxError with this failure's message")
        .def("__eq__", [](const pmx::AppError& a, const pmx::AppError& b) { return a == b; })
        .def("__str__", &pmx::AppError::message)
        .def("__repr__", [](const pmx::AppError& e) {
            std::ostringstream oss;
            oss << "AppError(stage=" << pmx::stage_name(e.stage()) << ", kind=" << e.kind()
                << ")";
            return oss.str();
        });

    // =========================================================================
    // Stage failure factories (each returns a promoted AppError)
    // =========================================================================

    // Transport
    m.def(
        "http_request_failed",
        [](uint16_t status, std::string url, std::string body) {
            return pmx::promote(pmx::http::RequestFailed{
                .status = status, .url = std::move(url), .body = std::move(body)});
        },
        "status"_a, "url"_a, "body"_a = "");
    m.def(
        "http_connection_failed",
        [](std::string url, std::string reason) {
            return pmx::promote(
                pmx::http::ConnectionFailed{.url = std::move(url), .reason = std::move(reason)});
        },
        "url"_a, "reason"_a);
    m.def(
        "http_timeout",
        [](std::string url, long long duration_s) {
            return pmx::promote(
                pmx::http::Timeout{.url = std::move(url), .duration = seconds(duration_s)});
        },
        "url"_a, "duration_s"_a);
    m.def(
        "http_invalid_url",
        [](std::string url, std::string reason) {
            return pmx::promote(
                pmx::http::InvalidUrl{.url = std::move(url), .reason = std::move(reason)});
        },
        "url"_a, "reason"_a);
    m.def(
        "http_response_read_error",
        [](std::string url, std::string reason) {
            return pmx::promote(
                pmx::http::ResponseReadError{.url = std::move(url), .reason = std::move(reason)});
        },
        "url"_a, "reason"_a);

    // Source
    m.def(
        "market_group_not_found",
        [](std::string slug) {
            return pmx::promote(pmx::source::MarketGroupNotFound{.slug = std::move(slug)});
        },
        "slug"_a);
    m.def(
        "market_not_found",
        [](std::string group_slug, std::string market_slug) {
            return pmx::promote(pmx::source::MarketNotFound{.group_slug = std::move(group_slug),
                                                            .market_slug = std::move(market_slug)});
        },
        "group_slug"_a, "market_slug"_a);
    m.def(
        "invalid_api_response",
        [](std::string endpoint, std::string reason, const std::string& raw_body) {
            return pmx::promote(
                pmx::invalid_api_response(std::move(endpoint), std::move(reason), raw_body));
        },
        "endpoint"_a, "reason"_a, "raw_body"_a = "");
    m.def(
        "rate_limit_exceeded",
        [](std::optional<long long> retry_after_s) {
            pmx::source::RateLimitExceeded err;
            if (retry_after_s) {
                err.retry_after = seconds(*retry_after_s);
            }
            return pmx::promote(std::move(err));
        },
        "retry_after_s"_a = nb::none());
    m.def(
        "authentication_failed",
        [](std::string reason) {
            return pmx::promote(pmx::source::AuthenticationFailed{.reason = std::move(reason)});
        },
        "reason"_a);
    m.def(
        "api_unavailable",
        [](std::string service_name, std::string reason) {
            return pmx::promote(pmx::source::ApiUnavailable{.service_name = std::move(service_name),
                                                            .reason = std::move(reason)});
        },
        "service_name"_a, "reason"_a);

    // Parse
    m.def(
        "json_deserialization_failed",
        [](std::optional<std::string> field_name, std::string expected_type,
           const std::string& raw_json, std::string reason) {
            return pmx::promote(pmx::json_deserialization_failed(
                std::move(field_name), std::move(expected_type), raw_json, std::move(reason)));
        },
        "field_name"_a.none(), "expected_type"_a, "raw_json"_a, "reason"_a);
    m.def(
        "json_syntax_error",
        [](const std::string& raw_json, std::size_t line, std::size_t column,
           const std::string& reason) {
            return pmx::promote(pmx::json_syntax_error(raw_json, line, column, reason));
        },
        "raw_json"_a, "line"_a, "column"_a, "reason"_a);
    m.def(
        "missing_field",
        [](std::string field_name, std::string parent_type) {
            return pmx::promote(pmx::parse::MissingField{.field_name = std::move(field_name),
                                                         .parent_type = std::move(parent_type)});
        },
        "field_name"_a, "parent_type"_a = "");
    m.def(
        "invalid_field_format",
        [](std::string field_name, std::string expected_format, const std::string& actual) {
            return pmx::promote(pmx::invalid_field_format(std::move(field_name),
                                                          std::move(expected_format), actual));
        },
        "field_name"_a, "expected_format"_a, "actual"_a);
    m.def(
        "invalid_array_length",
        [](std::string field_name, std::size_t expected, std::size_t actual) {
            return pmx::promote(pmx::parse::InvalidArrayLength{
                .field_name = std::move(field_name), .expected = expected, .actual = actual});
        },
        "field_name"_a, "expected"_a, "actual"_a);
    m.def(
        "invalid_number",
        [](std::string field_name, const std::string& raw_value, std::string reason) {
            return pmx::promote(
                pmx::invalid_number(std::move(field_name), raw_value, std::move(reason)));
        },
        "field_name"_a, "raw_value"_a, "reason"_a);

    // Normalization
    m.def(
        "token_id_extraction_failed",
        [](std::string market_slug, std::string reason) {
            return pmx::promote(pmx::normalize::TokenIdExtractionFailed{
                .market_slug = std::move(market_slug), .reason = std::move(reason)});
        },
        "market_slug"_a, "reason"_a);
    m.def(
        "outcome_mapping_failed",
        [](std::string market_slug, std::vector<std::string> outcomes, std::string reason) {
            return pmx::promote(pmx::normalize::OutcomeMappingFailed{
                .market_slug = std::move(market_slug),
                .outcomes = std::move(outcomes),
                .reason = std::move(reason)});
        },
        "market_slug"_a, "outcomes"_a, "reason"_a);
    m.def(
        "invalid_price_data",
        [](std::string market_slug, std::string field_name, std::string reason) {
            return pmx::promote(pmx::normalize::InvalidPriceData{
                .market_slug = std::move(market_slug),
                .field_name = std::move(field_name),
                .reason = std::move(reason)});
        },
        "market_slug"_a, "field_name"_a, "reason"_a);
    m.def(
        "invalid_volume_data",
        [](std::string market_slug, std::string field_name, std::string reason) {
            return pmx::promote(pmx::normalize::InvalidVolumeData{
                .market_slug = std::move(market_slug),
                .field_name = std::move(field_name),
                .reason = std::move(reason)});
        },
        "market_slug"_a, "field_name"_a, "reason"_a);
    m.def(
        "validation_failed",
        [](std::string market_slug, std::string reason) {
            return pmx::promote(pmx::normalize::ValidationFailed{
                .market_slug = std::move(market_slug), .reason = std::move(reason)});
        },
        "market_slug"_a, "reason"_a);
    m.def(
        "empty_required_field",
        [](std::string market_slug, std::string field_name) {
            return pmx::promote(pmx::normalize::EmptyRequiredField{
                .market_slug = std::move(market_slug), .field_name = std::move(field_name)});
        },
        "market_slug"_a, "field_name"_a);

    // Analysis
    m.def(
        "insufficient_data",
        [](std::string analysis_type, std::string reason) {
            return pmx::promote(pmx::analysis::InsufficientData{
                .analysis_type = std::move(analysis_type), .reason = std::move(reason)});
        },
        "analysis_type"_a, "reason"_a);
    m.def(
        "calculation_failed",
        [](std::string analysis_type, std::string reason) {
            return pmx::promote(pmx::analysis::CalculationFailed{
                .analysis_type = std::move(analysis_type), .reason = std::move(reason)});
        },
        "analysis_type"_a, "reason"_a);
    m.def(
        "invalid_position",
        [](std::string position_id, std::string reason) {
            return pmx::promote(pmx::analysis::InvalidPosition{
                .position_id = std::move(position_id), .reason = std::move(reason)});
        },
        "position_id"_a, "reason"_a);
    m.def(
        "statistical_error",
        [](std::string analysis_type, std::string reason) {
            return pmx::promote(pmx::analysis::StatisticalError{
                .analysis_type = std::move(analysis_type), .reason = std::move(reason)});
        },
        "analysis_type"_a, "reason"_a);
    m.def(
        "stale_data",
        [](std::string analysis_type, long long age_s, long long max_age_s) {
            return pmx::promote(pmx::analysis::StaleData{.analysis_type = std::move(analysis_type),
                                                         .age = seconds(age_s),
                                                         .max_age = seconds(max_age_s)});
        },
        "analysis_type"_a, "age_s"_a, "max_age_s"_a);

    // Output
    m.def(
        "formatting_failed",
        [](std::string data_type, std::string reason) {
            return pmx::promote(pmx::output::FormattingFailed{.data_type = std::move(data_type),
                                                              .reason = std::move(reason)});
        },
        "data_type"_a, "reason"_a);
    m.def(
        "write_failed",
        [](std::string target, std::string reason) {
            return pmx::promote(
                pmx::output::WriteFailed{.target = std::move(target), .reason = std::move(reason)});
        },
        "target"_a, "reason"_a);

    // =========================================================================
    // Presentation
    // =========================================================================

    nb::class_<pmx::PresentationConfig>(m, "PresentationConfig",
                                        "Settings for the presentation layer")
        .def(nb::init<>())
        .def_rw("exit_code", &pmx::PresentationConfig::exit_code);

    m.def(
        "load_presentation_config",
        [](const std::string& path) {
            auto config = pmx::load_presentation_config(path);
            if (!config) {
                raise_pmx_error(pmx::error_message(config.error()));
            }
            return *config;
        },
        "path"_a, "Load presentation settings from a YAML file (raises PmxError)");

    nb::class_<pmx::Report>(m, "Report", "What the outermost boundary shows for a failure")
        .def_ro("message", &pmx::Report::message)
        .def_ro("stage", &pmx::Report::stage)
        .def_prop_ro("tip", [](const pmx::Report& r) { return std::string(r.tip); })
        .def_ro("exit_code", &pmx::Report::exit_code)
        .def("format", &pmx::format_report)
        .def("__repr__", [](const pmx::Report& r) {
            std::ostringstream oss;
            oss << "Report(stage=" << pmx::stage_name(r.stage) << ", exit_code=" << r.exit_code
                << ")";
            return oss.str();
        });

    m.def(
        "make_report",
        [](const pmx::AppError& error, const pmx::PresentationConfig& config) {
            return pmx::make_report(error, config);
        },
        "error"_a, "config"_a = pmx::PresentationConfig{});
}

} // namespace pmx_python
