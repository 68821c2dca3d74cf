/*
 * Copyright (C) 2025 EPAM Systems, Inc.
 *
 * SPDX-License-Identifier: Apache-2.0
 */

#include <csignal>
#include <cstring>
#include <execinfo.h>
#include <iostream>
#include <pthread.h>
#include <thread>

#include <Poco/Util/HelpFormatter.h>
#include <systemd/sd-daemon.h>

#include <core/common/tools/logger.hpp>

#include <common/utils/exception.hpp>
#include <common/utils/time.hpp>
#include <common/version/version.hpp>

#include "app.hpp"

namespace bootkit::app {

namespace {

/***********************************************************************************************************************
 * Static
 **********************************************************************************************************************/

void CrashHandler(int sig)
{
    constexpr auto cMaxFrames = 64;

    void* frames[cMaxFrames];

    std::cerr << "bootkitd crashed: " << strsignal(sig) << std::endl;

    auto count = backtrace(frames, cMaxFrames);

    backtrace_symbols_fd(frames, count, STDERR_FILENO);

    raise(sig);
}

void InstallCrashHandler()
{
    struct sigaction action { };

    action.sa_handler = CrashHandler;
    action.sa_flags   = SA_RESETHAND;

    for (auto sig : {SIGILL, SIGABRT, SIGFPE, SIGSEGV, SIGBUS}) {
        sigaction(sig, &action, nullptr);
    }
}

// Termination signals are waited by the main thread only. Must be called before any thread is started.
void BlockTerminationSignals()
{
    sigset_t signals;

    sigemptyset(&signals);
    sigaddset(&signals, SIGINT);
    sigaddset(&signals, SIGQUIT);
    sigaddset(&signals, SIGTERM);

    if (auto ret = pthread_sigmask(SIG_BLOCK, &signals, nullptr); ret != 0) {
        BOOTKIT_ERROR_THROW(Error(ret), "can't block termination signals");
    }
}

} // namespace

/***********************************************************************************************************************
 * Protected
 **********************************************************************************************************************/

void App::initialize(Application& self)
{
    if (mStopProcessing) {
        return;
    }

    InstallCrashHandler();

    try {
        BlockTerminationSignals();

        auto err = mLogger.Init();
        BOOTKIT_ERROR_CHECK_AND_THROW(err, "can't initialize logger");

        Application::initialize(self);

        Init();

        mInitialized = true;

        Start();
    } catch (const std::exception& e) {
        LOG_ERR() << "Initialization failed" << Log::Field(common::utils::ToAosError(e));

        throw;
    }
}

void App::uninitialize()
{
    Application::uninitialize();

    if (!mInitialized) {
        return;
    }

    mCleanupManager.ExecuteCleanups();
}

void App::reinitialize(Application& self)
{
    Application::reinitialize(self);
}

int App::main(const ArgVec& args)
{
    (void)args;

    if (mStopProcessing) {
        return Application::EXIT_OK;
    }

    return Run();
}

void App::defineOptions(Poco::Util::OptionSet& options)
{
    Application::defineOptions(options);

    options.addOption(Poco::Util::Option("help", "h", "displays help information")
                          .callback(Poco::Util::OptionCallback<App>(this, &App::HandleHelp)));
    options.addOption(Poco::Util::Option("config", "c", "path to config file")
                          .argument("${file}")
                          .callback(Poco::Util::OptionCallback<App>(this, &App::HandleConfigFile)));
    options.addOption(Poco::Util::Option("verbose", "v", "sets current log level")
                          .argument("${level}")
                          .callback(Poco::Util::OptionCallback<App>(this, &App::HandleLogLevel)));
    options.addOption(Poco::Util::Option("version", "", "displays version information")
                          .callback(Poco::Util::OptionCallback<App>(this, &App::HandleVersion)));
    options.addOption(Poco::Util::Option("journal", "j", "redirects logs to systemd journal")
                          .callback(Poco::Util::OptionCallback<App>(this, &App::HandleJournal)));
    options.addOption(Poco::Util::Option("session", "s", "uses session bus instead of system bus")
                          .callback(Poco::Util::OptionCallback<App>(this, &App::HandleSession)));
    options.addOption(Poco::Util::Option("idle-timeout", "i", "stops service after inactivity period")
                          .argument("${duration}")
                          .callback(Poco::Util::OptionCallback<App>(this, &App::HandleIdleTimeout)));
}

/***********************************************************************************************************************
 * Private
 **********************************************************************************************************************/

void App::Init()
{
    LOG_INF() << "Init bootkit" << Log::Field("version", BOOTKIT_VERSION);

    auto err = config::ParseConfig(mConfigFile, mConfig);
    BOOTKIT_ERROR_CHECK_AND_THROW(err, "can't parse config");

    if (mSessionBus) {
        mConfig.mDBus.mSessionBus = true;
    }

    if (mIdleTimeout.has_value()) {
        Tie(mConfig.mIdleTimeout, err) = common::utils::ParseDuration(*mIdleTimeout);
        BOOTKIT_ERROR_CHECK_AND_THROW(err, "can't parse idle timeout");
    }

    err = mDatabase.Init(mConfig.mDatabasePath);
    BOOTKIT_ERROR_CHECK_AND_THROW(err, "can't initialize database");

    err = mHandler.Init(mConfig.mGrub, mDatabase);
    BOOTKIT_ERROR_CHECK_AND_THROW(err, "can't initialize handler");

    bool hasSnapshots = false;

    Tie(hasSnapshots, err) = mDatabase.HasSnapshots();
    BOOTKIT_ERROR_CHECK_AND_THROW(err, "can't check snapshots");

    if (!hasSnapshots) {
        LOG_INF() << "Save initial grub config snapshot";

        if (err = mHandler.SaveSnapshot(); !err.IsNone()) {
            LOG_WRN() << "Can't save initial snapshot" << Log::Field(err);
        }
    }

    err = mServer.Init(mConfig.mDBus, mHandler);
    BOOTKIT_ERROR_CHECK_AND_THROW(err, "can't initialize D-Bus server");
}

void App::Start()
{
    LOG_INF() << "Start bootkit";

    auto err = mServer.Start();
    BOOTKIT_ERROR_CHECK_AND_THROW(err, "can't start D-Bus server");

    mCleanupManager.AddCleanup([this]() {
        if (auto err = mServer.GracefulShutdown(); !err.IsNone()) {
            LOG_ERR() << "Can't shutdown D-Bus server" << Log::Field(err);
        }
    });

    // Notify systemd
    if (auto ret = sd_notify(0, cSDNotifyReady); ret < 0) {
        BOOTKIT_ERROR_CHECK_AND_THROW(ret, "can't notify systemd");
    }

    err = mEventCoordinator.Init(mConfig, mWatcher, mServer.GetHandle());
    BOOTKIT_ERROR_CHECK_AND_THROW(err, "can't initialize event coordinator");
}

int App::Run()
{
    RetWithError<events::ExitReason> result {events::ExitReason::eShutdown, ErrorEnum::eNone};

    std::thread listener([this, &result]() {
        result = mEventCoordinator.ListenEvents();

        if (result.mValue != events::ExitReason::eShutdown) {
            terminate();
        }
    });

    waitForTerminationRequest();

    LOG_DBG() << "Stop listening events";

    mEventCoordinator.SignalShutdown();

    listener.join();

    LOG_DBG() << "Gracefully shutdown D-Bus server";

    mCleanupManager.ExecuteCleanups();

    switch (result.mValue) {
    case events::ExitReason::eError:
        LOG_ERR() << "Bootkit shutdown due to error" << Log::Field(result.mError);

        return Application::EXIT_SOFTWARE;

    case events::ExitReason::eIdle:
        LOG_INF() << "Bootkit shutdown due to inactivity";

        break;

    default:
        LOG_INF() << "Bootkit shutdown due to termination request";

        break;
    }

    return Application::EXIT_OK;
}

void App::HandleHelp(const std::string& name, const std::string& value)
{
    (void)name;
    (void)value;

    mStopProcessing = true;

    Poco::Util::HelpFormatter helpFormatter(options());

    helpFormatter.setCommand(commandName());
    helpFormatter.setUsage("[OPTIONS]");
    helpFormatter.setHeader("Bootkit bootloader configuration service.");
    helpFormatter.format(std::cout);

    stopOptionsProcessing();
}

void App::HandleConfigFile(const std::string& name, const std::string& value)
{
    (void)name;

    mConfigFile = value;
}

void App::HandleLogLevel(const std::string& name, const std::string& value)
{
    (void)name;

    auto [level, err] = common::logger::Logger::ParseLogLevel(value);
    if (!err.IsNone()) {
        throw Poco::Exception("unsupported log level", value);
    }

    mLogger.SetLogLevel(level);
}

void App::HandleVersion(const std::string& name, const std::string& value)
{
    (void)name;
    (void)value;

    mStopProcessing = true;

    std::cout << "Bootkit version: " << BOOTKIT_VERSION << std::endl;

    stopOptionsProcessing();
}

void App::HandleJournal(const std::string& name, const std::string& value)
{
    (void)name;
    (void)value;

    mLogger.SetBackend(common::logger::Logger::Backend::eJournald);
}

void App::HandleSession(const std::string& name, const std::string& value)
{
    (void)name;
    (void)value;

    mSessionBus = true;
}

void App::HandleIdleTimeout(const std::string& name, const std::string& value)
{
    (void)name;

    mIdleTimeout = value;
}

} // namespace bootkit::app
