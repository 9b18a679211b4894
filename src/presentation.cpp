#include "pmx/presentation.hpp"

#include <cstdlib>
#include <iostream>
#include <ostream>

#include <spdlog/spdlog.h>

namespace pmx {

Report make_report(const AppError& error, const PresentationConfig& config) {
    // Configs built in code skip the YAML range check
    const int code =
        is_failure_exit_code(config.exit_code) ? config.exit_code : kFailureExitCode;

    return Report{
        .message = error.message(),
        .stage = error.stage(),
        .tip = tip_for(error.stage()),
        .exit_code = code,
    };
}

std::string format_report(const Report& report) {
    std::string out = "Error: ";
    out += report.message;
    out += '\n';
    if (!report.tip.empty()) {
        out += "Tip: ";
        out += report.tip;
        out += '\n';
    }
    return out;
}

int present(const AppError& error, std::ostream& out, const PresentationConfig& config) {
    const auto report = make_report(error, config);

    spdlog::debug("[pmx] presenting {} failure ({}), exit code {}", stage_name(report.stage),
                  error.kind(), report.exit_code);

    out << format_report(report);
    out.flush();
    if (!out) {
        // Nothing left to report to; the exit status still signals failure
        spdlog::error("[pmx] failed to write failure report for {} stage",
                      stage_name(report.stage));
    }
    return report.exit_code;
}

void present_and_exit(const AppError& error, const PresentationConfig& config) {
    const int code = present(error, std::cerr, config);
    std::exit(code);
}

} // namespace pmx
