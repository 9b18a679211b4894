#include "pmx/app_error.hpp"

namespace pmx {

std::string stage_message(const AppError& e) {
    return e.visit([](const auto& stage_error) { return error_message(stage_error); });
}

std::string AppError::message() const {
    std::string out(stage_label(stage()));
    out += ": ";
    out += stage_message(*this);
    return out;
}

} // namespace pmx
