/*
 * SamAudit - Offline Windows Credential Audit
 * Copyright (C) 2026 SamAudit Developers
 *
 * This program is free software: you can redistribute it and/or modify
 * it under the terms of the GNU Affero General Public License as published
 * by the Free Software Foundation, either version 3 of the License, or
 * (at your option) any later version.
 *
 * This program is distributed in the hope that it will be useful,
 * but WITHOUT ANY WARRANTY; without even the implied warranty of
 * MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE. See the
 * GNU Affero General Public License for more details.
 *
 * You should have received a copy of the GNU Affero General Public License
 * along with this program. If not, see <https://www.gnu.org/licenses/>.
 */
#include "pch.h"
#include "AuditApp.hpp"
#include "CommandLine.hpp"

#include "../Utils/Logger.hpp"

#include <csignal>

using namespace SamAudit;

namespace {

    std::atomic<bool> g_cancelRequested{ false };

    void OnInterrupt(int) {
        g_cancelRequested.store(true);
    }

}  // namespace

int main(int argc, char** argv) {
    const std::vector<std::string> args(argv, argv + argc);

    App::CommandLine cl;
    std::string parseError;
    if (!App::CommandLine::Parse(args, cl, parseError)) {
        std::cerr << "samaudit: " << parseError << "\n\n" << App::UsageText();
        return App::EXIT_USAGE;
    }
    if (cl.showHelp) {
        std::cout << App::UsageText();
        return App::EXIT_CLEAN;
    }

    Config::AuditConfig config;
    if (!App::ResolveConfig(cl, config, std::cerr)) {
        return App::EXIT_USAGE;
    }

    try {
        Utils::Logger::Instance().Initialize(config.ToLoggerConfig());
    }
    catch (const std::exception& ex) {
        std::cerr << "samaudit: logger initialization failed: " << ex.what() << "\n";
        return App::EXIT_USAGE;
    }

    std::signal(SIGINT, OnInterrupt);

    const int code = App::RunAudit(cl, config, &g_cancelRequested, std::cout, std::cerr);

    Utils::Logger::Instance().ShutDown();
    return code;
}
