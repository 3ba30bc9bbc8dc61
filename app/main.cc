#include "app/app.h"

#include "core/log.h"

#ifndef SKYGRID_SHADER_DIR
#define SKYGRID_SHADER_DIR "shaders"
#endif

int main() {
    skygrid::core::initializeLogLevelFromEnvironment();
    SKYGRID_LOGI("main") << "startup";

    skygrid::render::RendererConfig config{};
    config.shaderDir = SKYGRID_SHADER_DIR;

    skygrid::app::App app;
    if (!app.init(config)) {
        SKYGRID_LOGE("main") << "app initialization failed";
        app.shutdown();
        return 1;
    }

    const int exitCode = app.run();
    app.shutdown();
    SKYGRID_LOGI("main") << "shutdown";
    return exitCode;
}
