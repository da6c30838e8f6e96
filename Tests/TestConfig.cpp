/*
 * Copyright (c) 2026, Alex <uni@vrsal.cc>
 * SPDX-License-Identifier: BSD-3-Clause
 */

#include <gtest/gtest.h>
#include <string>
#include <vector>

#include "TestHelpers.hpp"
#include "AgentConfig.hpp"
#include "ServerConfig.hpp"

using namespace NTestHelpers;

TEST(ServerConfigTest, LoadOverridesDefaults)
{
	NTempDir Dir;
	ASSERT_TRUE(Dir.Write("netzkarte.ini",
		"[server]\n"
		"address = 127.0.0.1\n"
		"port = 7700\n"
		"capture_timeout_ms = 2500\n"
		"recording_interval_s = 2\n"
		"\n"
		"[graph]\n"
		"no_loopback = true\n"
		"exclude_processes = svchost, ,System,  chrome\n"
		"\n"
		"[log]\n"
		"level = debug\n"));

	NServerConfig Config;
	ASSERT_TRUE(Config.Load((Dir.Get() / "netzkarte.ini").string()));
	EXPECT_EQ(Config.Server.Address, "127.0.0.1");
	EXPECT_EQ(Config.Server.Port, 7700);
	EXPECT_EQ(Config.Server.CaptureTimeoutMs, 2500);
	EXPECT_EQ(Config.Server.RecordingIntervalSeconds, 2u);
	EXPECT_FALSE(Config.Graph.bIncludeLoopback);
	EXPECT_EQ(Config.Graph.ExcludedProcessPrefixes, (std::vector<std::string>{ "svchost", "System", "chrome" }));
	EXPECT_TRUE(Config.Graph.IsExcluded("chrome.exe"));
	EXPECT_FALSE(Config.Graph.IsExcluded("sshd"));
	EXPECT_EQ(Config.LogLevel, "debug");
}

TEST(ServerConfigTest, MissingKeysKeepCurrentValues)
{
	NTempDir Dir;
	ASSERT_TRUE(Dir.Write("partial.ini", "[graph]\nno_loopback = false\n"));

	NServerConfig Config;
	Config.Server.Port = 9000;
	Config.Graph.bIncludeLoopback = false;
	Config.Graph.ExcludedProcessPrefixes = { "svchost" };
	Config.LogLevel = "warn";

	ASSERT_TRUE(Config.Load((Dir.Get() / "partial.ini").string()));
	EXPECT_EQ(Config.Server.Port, 9000);
	EXPECT_TRUE(Config.Graph.bIncludeLoopback);
	EXPECT_EQ(Config.Graph.ExcludedProcessPrefixes, (std::vector<std::string>{ "svchost" }));
	EXPECT_EQ(Config.LogLevel, "warn");
}

TEST(ServerConfigTest, UnreadableFileIsRefused)
{
	NTempDir      Dir;
	NServerConfig Config;
	Config.Server.Port = 9000;
	EXPECT_FALSE(Config.Load((Dir.Get() / "missing.ini").string()));
	EXPECT_EQ(Config.Server.Port, 9000);
}

TEST(AgentConfigTest, LoadOverridesDefaults)
{
	NTempDir Dir;
	ASSERT_TRUE(Dir.Write("netzkarte-agent.ini",
		"[agent]\n"
		"server = 10.0.0.1\n"
		"port = 7700\n"
		"pretty_name = Debian 12 build box\n"
		"prefer_netstat = yes\n"));

	NAgentConfig Config;
	ASSERT_TRUE(Config.Load((Dir.Get() / "netzkarte-agent.ini").string()));
	EXPECT_EQ(Config.ServerAddress, "10.0.0.1");
	EXPECT_EQ(Config.ServerPort, 7700);
	EXPECT_EQ(Config.PrettyName, "Debian 12 build box");
	EXPECT_TRUE(Config.bPreferNetstat);

	EXPECT_FALSE(Config.Load((Dir.Get() / "missing.ini").string()));
	EXPECT_EQ(Config.ServerAddress, "10.0.0.1");
}
