// core/types/environment.cpp
#include "core/types/environment.h"
#include "common/utils/template_renderer.h"

namespace expflow {

std::string Environment::stage_output_dir(const StageName& stage) const {
    nlohmann::json data = to_json();
    data["stage"] = stage;
    return InjaTemplateRenderer::render(output_template, data);
}

nlohmann::json Environment::to_json() const {
    return nlohmann::json{
        {"experiment", experiment},
        {"save_path", save_path},
        {"debug", debug},
        {"extra", extra}
    };
}

} // namespace expflow
