#include "app/survey.h"

#include "core/log.h"

// Program entry point
// Responsible for: reading the environment, running one survey, and reporting the exit status.
// Should NOT do: implement planning or persistence.
int main() {
    delve::core::initializeLogLevelFromEnvironment();
    DELVE_LOGI("main") << "startup";
    delve::app::SurveyApp app(delve::app::surveyConfigFromEnvironment());

    if (!app.init()) {
        DELVE_LOGE("main") << "survey init failed, exiting";
        return 1;
    }

    app.run();
    if (!app.shutdown()) {
        DELVE_LOGE("main") << "survey finished but chunks were not saved";
        return 1;
    }
    DELVE_LOGI("main") << "exit success";
    return 0;
}
