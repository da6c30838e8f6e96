/*
 * Copyright (c) 2026, Alex <uni@vrsal.cc>
 * SPDX-License-Identifier: BSD-3-Clause
 */

#include "ServerConfig.hpp"

#include <INIReader.h>
#include <spdlog/spdlog.h>

#include "Filesystem.hpp"
#include "StringUtil.hpp"

NServerConfig::NServerConfig()
{
	if (NFilesystem::Exists("./netzkarte.ini"))
	{
		Load("./netzkarte.ini");
	}
	else if (NFilesystem::Exists("/etc/netzkarte/netzkarte.ini"))
	{
		Load("/etc/netzkarte/netzkarte.ini");
	}
	else
	{
		spdlog::debug("no configuration file found, using defaults");
	}
}

bool NServerConfig::Load(std::string const& Path)
{
	INIReader Reader(Path);

	auto SafeGet = [&](std::string const& Section, std::string const& Name, std::string& OutVal) {
		if (Reader.HasValue(Section, Name))
		{
			OutVal = Reader.Get(Section, Name, OutVal);
		}
	};

	if (Reader.ParseError() < 0)
	{
		spdlog::error("can't load '{}': {}", Path, Reader.ParseErrorMessage());
		return false;
	}

	SafeGet("server", "address", Server.Address);
	Server.Port = static_cast<NPort>(Reader.GetInteger("server", "port", Server.Port));
	Server.CaptureTimeoutMs = Reader.GetInteger("server", "capture_timeout_ms", Server.CaptureTimeoutMs);
	Server.RecordingIntervalSeconds =
		static_cast<uint32_t>(Reader.GetInteger("server", "recording_interval_s", Server.RecordingIntervalSeconds));

	Graph.bIncludeLoopback = !Reader.GetBoolean("graph", "no_loopback", !Graph.bIncludeLoopback);
	if (Reader.HasValue("graph", "exclude_processes"))
	{
		std::string const Excluded = Reader.Get("graph", "exclude_processes", "");
		Graph.ExcludedProcessPrefixes.clear();
		for (auto const& Prefix : NStringUtil::Split(Excluded, ','))
		{
			if (auto const Trimmed = NStringUtil::Trim(Prefix); !Trimmed.empty())
			{
				Graph.ExcludedProcessPrefixes.emplace_back(Trimmed);
			}
		}
	}

	SafeGet("log", "level", LogLevel);
	spdlog::debug("loaded configuration from '{}'", Path);
	return true;
}

void NServerConfig::LogConfig() const
{
	spdlog::info("listen address={}", Server.Address.empty() ? "*" : Server.Address);
	spdlog::info("port={}", Server.Port);
	spdlog::info("capture timeout={}ms", Server.CaptureTimeoutMs);
	spdlog::info("recording interval={}s", Server.RecordingIntervalSeconds);
	if (!Graph.bIncludeLoopback)
	{
		spdlog::info("same host connections are hidden");
	}
	for (auto const& Prefix : Graph.ExcludedProcessPrefixes)
	{
		spdlog::info("excluding processes starting with '{}'", Prefix);
	}
}
