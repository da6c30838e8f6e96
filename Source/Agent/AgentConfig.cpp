/*
 * Copyright (c) 2026, Alex <uni@vrsal.cc>
 * SPDX-License-Identifier: BSD-3-Clause
 */

#include "AgentConfig.hpp"

#include <INIReader.h>
#include <spdlog/spdlog.h>

#include "Filesystem.hpp"

NAgentConfig::NAgentConfig()
{
	if (NFilesystem::Exists("./netzkarte-agent.ini"))
	{
		Load("./netzkarte-agent.ini");
	}
	else if (NFilesystem::Exists("/etc/netzkarte/netzkarte-agent.ini"))
	{
		Load("/etc/netzkarte/netzkarte-agent.ini");
	}
}

bool NAgentConfig::Load(std::string const& Path)
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

	SafeGet("agent", "server", ServerAddress);
	ServerPort = static_cast<NPort>(Reader.GetInteger("agent", "port", ServerPort));
	SafeGet("agent", "pretty_name", PrettyName);
	bPreferNetstat = Reader.GetBoolean("agent", "prefer_netstat", bPreferNetstat);
	return true;
}

void NAgentConfig::LogConfig() const
{
	spdlog::info("server={}:{}", ServerAddress, ServerPort);
	if (!PrettyName.empty())
	{
		spdlog::info("pretty name={}", PrettyName);
	}
	if (bPreferNetstat)
	{
		spdlog::info("using netstat instead of ss");
	}
}
