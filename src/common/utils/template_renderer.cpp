// common/utils/template_renderer.cpp
#include "common/utils/template_renderer.h"
#include "core/errors.h"
#include <mutex>

namespace expflow {

InjaTemplateRenderer::InjaTemplateRenderer() : env_() {
    env_.set_expression("{{", "}}");
    env_.set_statement("{%", "%}");
    env_.set_comment("{#", "#}");
    env_.set_line_statement("##");

    configure_security();
}

void InjaTemplateRenderer::configure_security() {
    // Output paths never need includes; refuse them outright
    env_.set_include_callback([](const std::filesystem::path&, const std::string&) -> inja::Template {
        throw inja::InjaError("render_error", "Include is disabled for security.", inja::SourceLocation{});
    });
}

std::string InjaTemplateRenderer::render(std::string_view template_str, const nlohmann::json& data) {
    // Stage runners render from worker threads; the shared environment is not thread-safe
    static InjaTemplateRenderer renderer;
    static std::mutex mutex;
    std::lock_guard<std::mutex> lock(mutex);
    return renderer.render_with_env(template_str, data);
}

std::string InjaTemplateRenderer::render_with_env(std::string_view template_str, const nlohmann::json& data) {
    try {
        return env_.render(template_str, data);
    } catch (const inja::InjaError& e) {
        throw ConfigError("Template render error: " + std::string(e.message));
    }
}

} // namespace expflow
