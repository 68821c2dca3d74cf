/*
 * Copyright (C) 2025 EPAM Systems, Inc.
 *
 * SPDX-License-Identifier: Apache-2.0
 */

#ifndef BOOTKIT_APP_APP_HPP_
#define BOOTKIT_APP_APP_HPP_

#include <optional>
#include <string>

#include <Poco/Util/ServerApplication.h>

#include <common/logger/logger.hpp>
#include <common/utils/cleanupmanager.hpp>
#include <common/utils/fswatcher.hpp>
#include <config/config.hpp>
#include <database/database.hpp>
#include <dbus/server.hpp>
#include <events/eventcoordinator.hpp>
#include <handler/handler.hpp>

namespace bootkit::app {

/**
 * Bootkit daemon application.
 */
class App : public Poco::Util::ServerApplication {
public:
    /**
     * Constructor.
     */
    App() = default;

protected:
    void initialize(Application& self) override;
    void uninitialize() override;
    void reinitialize(Application& self) override;
    int  main(const ArgVec& args) override;
    void defineOptions(Poco::Util::OptionSet& options) override;

private:
    static constexpr auto cSDNotifyReady = "READY=1";

    void HandleHelp(const std::string& name, const std::string& value);
    void HandleConfigFile(const std::string& name, const std::string& value);
    void HandleLogLevel(const std::string& name, const std::string& value);
    void HandleVersion(const std::string& name, const std::string& value);
    void HandleJournal(const std::string& name, const std::string& value);
    void HandleSession(const std::string& name, const std::string& value);
    void HandleIdleTimeout(const std::string& name, const std::string& value);

    void Init();
    void Start();
    int  Run();

    common::logger::Logger        mLogger;
    common::utils::CleanupManager mCleanupManager;
    config::Config                mConfig;
    database::Database            mDatabase;
    handler::Handler              mHandler;
    dbus::Server                  mServer;
    common::utils::FSWatcher      mWatcher;
    events::EventCoordinator      mEventCoordinator;
    bool                          mStopProcessing {};
    bool                          mInitialized {};
    std::string                   mConfigFile {config::cDefaultConfigFile};
    bool                          mSessionBus {};
    std::optional<std::string>    mIdleTimeout;
};

} // namespace bootkit::app

#endif
