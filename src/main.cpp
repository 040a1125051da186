/**
 * BrlsWebImage - Image gallery for borealis
 *
 * Main entry point
 */

#include <borealis.hpp>
#include <cstdlib>

#include "app/application.hpp"

#ifdef __vita__
// Room for decoded images and curl buffers
int _newlib_heap_size_user = 192 * 1024 * 1024;  // 192 MB heap
#endif

int main(int argc, char* argv[]) {
    (void)argc;
    (void)argv;

    if (!brls::Application::init()) {
        brls::Logger::error("Unable to init borealis application");
        return EXIT_FAILURE;
    }

    brls::Application::createWindow("BrlsWebImage");
    brls::Application::setGlobalQuit(true);

    webimage::Application& app = webimage::Application::getInstance();
    if (app.init()) {
        app.run();
    } else {
        brls::Logger::error("FATAL: App initialization failed");
    }
    app.shutdown();

    return EXIT_SUCCESS;
}
