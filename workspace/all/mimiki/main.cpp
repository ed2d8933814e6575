#include <signal.h>
#include <stdlib.h>

#include <stdexcept>
#include <string>
#include <vector>

#include "catalog.h"
#include "config.h"
#include "defines.h"
#include "hotkeys.h"
#include "launcher.h"
#include "log.h"
#include "power.h"
#include "process.h"
#include "profiles.h"
#include "sdl_renderer.h"
#include "session.h"

using namespace Mimiki;

static volatile sig_atomic_t appQuit = false;

static void sigHandler(int sig)
{
    switch (sig)
    {
    case SIGINT:
    case SIGTERM:
        appQuit = true;
        break;
    default:
        break;
    }
}

namespace {
    HotkeyConfig hotkeyConfig(const LauncherSettings &settings)
    {
        HotkeyConfig config;
        config.longPressMs = settings.longPressMs;
        config.wakeDebounceMs = settings.wakeDebounceMs;
        config.brightnessDefault = settings.brightnessDefault;
        config.backlightEnabled = settings.backlightEnabled;
        return config;
    }

    SdlRendererConfig rendererConfig(const LauncherSettings &settings)
    {
        SdlRendererConfig config;
        config.width = SCREEN_WIDTH;
        config.height = SCREEN_HEIGHT;
        config.fontPath = settings.fontPath;
        config.fontSize = settings.fontSize;
        config.backgroundPath = settings.backgroundPath;
        return config;
    }

    void powerOff(const LauncherSettings &settings)
    {
        LOG_info("Shutting down...\n");
        ProcessResult result = Process_run(settings.poweroffCommand,
                                           {Process_programName(settings.poweroffCommand)});
        if (!Process_succeeded(result))
            LOG_error("%s failed (exit %d, signal %d)\n", settings.poweroffCommand.c_str(),
                      result.exitCode, result.signal);
    }
}

int main(int argc, char *argv[])
{
    SdlRenderer *renderer = nullptr;
    HotkeyMonitor *monitor = nullptr;
    SystemPowerActions *actions = nullptr;

    try
    {
        LOG_info("MIMIKI Launcher - Starting...\n");

        LauncherSettings settings = CFG_load();
        LOG_setLevel(settings.logLevel);
        CFG_print(&settings);

        signal(SIGINT, sigHandler);
        signal(SIGTERM, sigHandler);

        renderer = new SdlRenderer(rendererConfig(settings));
        if (!renderer->init())
            throw std::runtime_error("failed to initialize display");

        std::vector<SystemProfile> profiles = defaultProfiles();
        CatalogBuilder builder(settings.romRoots, (size_t)settings.maxGames);
        Catalog catalog = builder.build(profiles);

        GovernorControl governors(settings.cpuRoot, settings.gpuGovernorPath);
        ProcessSupervisor supervisor(governors, {settings.idleCpuGovernor, settings.idleGpuGovernor});
        supervisor.applyIdle();
        LOG_info("Standing by...\n");

        actions = new SystemPowerActions(settings.sleepStatePath, settings.backlightPath);
        monitor = new HotkeyMonitor(*actions, hotkeyConfig(settings));
        if (!monitor->init(settings.inputDir))
            throw std::runtime_error("no input devices found in " + settings.inputDir);

        MenuSession session(*renderer, *monitor, supervisor, profiles, catalog, settings.frameDelayMs);
        session.run(&appQuit);

        monitor->shutdown();
        renderer->quit();

        if (session.shutdownRequested() && settings.poweroffOnShutdown)
            powerOff(settings);

        delete monitor;
        delete actions;
        delete renderer;
        return EXIT_SUCCESS;
    }
    catch (const std::exception &e)
    {
        LOG_error("%s\n", e.what());
        if (monitor)
            monitor->shutdown();
        if (renderer)
            renderer->quit();

        delete monitor;
        delete actions;
        delete renderer;
        return EXIT_FAILURE;
    }
}
