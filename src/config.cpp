#include "pmx/config.hpp"

#include <string>
#include <utility>

#include <spdlog/spdlog.h>
#include <yaml-cpp/yaml.h>

namespace pmx {

namespace {

constexpr const char* kConfigDataType = "presentation config";

unexpected<OutputError> config_error(std::string reason) {
    return unexpected<OutputError>(OutputError{
        output::FormattingFailed{.data_type = kConfigDataType, .reason = std::move(reason)}});
}

// Throws YAML::Exception on conversion failures; callers translate it
expected<PresentationConfig, OutputError> from_node(const YAML::Node& root,
                                                    const std::string& origin) {
    PresentationConfig config;

    if (!root || root.IsNull()) {
        return config;
    }
    if (!root.IsMap()) {
        return config_error(origin + ": top level must be a mapping");
    }

    const YAML::Node section = root["presentation"];
    if (!section || section.IsNull()) {
        return config;
    }
    if (!section.IsMap()) {
        return config_error(origin + ": 'presentation' must be a mapping");
    }

    for (const auto& item : section) {
        const auto key = item.first.as<std::string>();
        const YAML::Node& value = item.second;

        if (key == "exit_code") {
            const auto code = value.as<long long>();
            if (code < 1 || code > kMaxExitCode) {
                return config_error(origin + ": exit_code must be between 1 and " +
                                    std::to_string(kMaxExitCode) + ", got " +
                                    std::to_string(code));
            }
            config.exit_code = static_cast<int>(code);
        } else if (key == "log_level") {
            const auto name = value.as<std::string>();
            auto level = parse_log_level(name);
            if (!level) {
                return config_error(origin + ": unknown log_level '" + name + "'");
            }
            config.log_level = *level;
        } else {
            spdlog::warn("[pmx] ignoring unknown presentation key '{}' in {}", key, origin);
        }
    }

    return config;
}

} // namespace

expected<PresentationConfig, OutputError> parse_presentation_config(std::string_view yaml_text) {
    const std::string origin = "<inline config>";
    try {
        return from_node(YAML::Load(std::string(yaml_text)), origin);
    } catch (const YAML::Exception& e) {
        return config_error(origin + ": " + e.what());
    }
}

expected<PresentationConfig, OutputError> load_presentation_config(const std::string& path) {
    YAML::Node root;
    try {
        root = YAML::LoadFile(path);
    } catch (const YAML::Exception& e) {
        return config_error(std::string("Failed to load config '") + path + "': " + e.what());
    }

    try {
        auto config = from_node(root, path);
        if (config) {
            spdlog::debug("[pmx] loaded presentation config from {}", path);
        }
        return config;
    } catch (const YAML::Exception& e) {
        return config_error(path + ": " + e.what());
    }
}

} // namespace pmx
