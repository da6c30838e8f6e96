/*
 * Copyright (c) 2026, Alex <uni@vrsal.cc>
 * SPDX-License-Identifier: BSD-3-Clause
 */

#include <cstdlib>
#include <spdlog/spdlog.h>
#include <thread>
#include <unistd.h>

#include "AgentClient.hpp"
#include "AgentConfig.hpp"
#include "Collector.hpp"
#include "SignalHandler.hpp"
#include "StringUtil.hpp"

static void PrintUsage()
{
	fmt::print("usage: netzkarte-agent [-v] [server-address] [port] [pretty-name]\n");
}

int main(int argc, char** argv)
{
	if (std::getenv("INVOCATION_ID") != nullptr)
	{
		// Running under systemd so we don't need the timestamp from spdlog
		spdlog::set_pattern("[%^%l%$] %v");
	}

	auto& Config = NAgentConfig::GetInstance();

	int Positional = 0;
	for (int i = 1; i < argc; ++i)
	{
		std::string_view const Arg = argv[i];
		if (Arg == "-h" || Arg == "--help")
		{
			PrintUsage();
			return 0;
		}
		if (Arg == "-v")
		{
			spdlog::set_level(spdlog::level::debug);
			continue;
		}

		switch (Positional++)
		{
			case 0:
				Config.ServerAddress = Arg;
				break;
			case 1:
				if (auto Port = NStringUtil::ParseNumber<NPort>(Arg))
				{
					Config.ServerPort = *Port;
					break;
				}
				spdlog::critical("Invalid port '{}'", Arg);
				return 1;
			case 2:
				Config.PrettyName = Arg;
				break;
			default:
				PrintUsage();
				return 1;
		}
	}

	if (geteuid() != 0)
	{
		spdlog::warn("Not running as root, sockets of other users won't have a process");
	}

	// Installs the SIGINT/SIGTERM handlers
	auto& Signals = NSignalHandler::GetInstance();

	spdlog::info("Netzkarte agent starting");
	Config.LogConfig();

	NCommandCollector Collector(Config.bPreferNetstat);
	NAgentClient      Client(Config.ServerAddress, Config.ServerPort, Collector, Config.PrettyName);
	Client.Start();

	while (!Signals.bStop && Client.IsRunning())
	{
		std::this_thread::sleep_for(std::chrono::milliseconds(100));
	}

	Client.Stop();
	spdlog::info("Netzkarte agent stopped");
	return 0;
}
