/*
 * Copyright (c) 2026, Alex <uni@vrsal.cc>
 * SPDX-License-Identifier: BSD-3-Clause
 */

#include "Collector.hpp"

#include <array>
#include <cstdio>
#include <unistd.h>
#include <climits>
#include <spdlog/spdlog.h>

#include "ErrnoUtil.hpp"
#include "Parsers/LinuxParser.hpp"

namespace
{
	// Column names and state words must not depend on the user's locale
	constexpr char const* SsCommand = "LC_ALL=C ss -tuanp 2>/dev/null";
	constexpr char const* NetstatCommand = "LC_ALL=C netstat -tunap 2>/dev/null";
	constexpr char const* IpCommand = "LC_ALL=C ip addr 2>/dev/null";

	NHostName ReadHostName()
	{
		std::array<char, HOST_NAME_MAX + 1> Buffer{};
		if (gethostname(Buffer.data(), Buffer.size() - 1) != 0)
		{
			spdlog::error("gethostname failed: {}", NErrnoUtil::StrError());
			return "localhost";
		}
		return Buffer.data();
	}
} // namespace

NCommandCollector::NCommandCollector(bool bPreferNetstat_) : HostName(ReadHostName()), bPreferNetstat(bPreferNetstat_)
{
}

std::optional<std::string> NCommandCollector::Run(std::string const& Command)
{
	FILE* Pipe = popen(Command.c_str(), "r");
	if (Pipe == nullptr)
	{
		spdlog::error("Failed to run '{}': {}", Command, NErrnoUtil::StrError());
		return std::nullopt;
	}

	std::array<char, 4096> Buffer{};
	std::string            Output{};
	while (fgets(Buffer.data(), static_cast<int>(Buffer.size()), Pipe) != nullptr)
	{
		Output += Buffer.data();
	}

	int const Status = pclose(Pipe);
	if (Status != 0 && Output.empty())
	{
		spdlog::debug("'{}' exited with {}", Command, Status);
		return std::nullopt;
	}
	return Output;
}

std::optional<NHostInventory> NCommandCollector::Collect()
{
	NHostInventory Inventory{ .Name = HostName };
	NDiagnostics   Diagnostics{};
	bool           bHaveSockets{};

	auto Take = [&](NParseResult const& Result) {
		Diagnostics.insert(Diagnostics.end(), Result.Diagnostics.begin(), Result.Diagnostics.end());
		if (!Result.bOk)
		{
			return false;
		}
		Inventory.MergeFrom(Result.Inventory, &Diagnostics);
		return true;
	};

	auto CollectSs = [&] {
		auto Output = Run(SsCommand);
		return Output && Take(NLinuxParser::ParseSs(*Output, HostName, "ss"));
	};
	auto CollectNetstat = [&] {
		auto Output = Run(NetstatCommand);
		return Output && Take(NLinuxParser::ParseNetstat(*Output, HostName, "netstat"));
	};

	bHaveSockets = bPreferNetstat ? (CollectNetstat() || CollectSs()) : (CollectSs() || CollectNetstat());
	if (!bHaveSockets)
	{
		spdlog::error("Neither ss nor netstat produced a socket table");
	}

	bool bHaveInterfaces{};
	if (auto Output = Run(IpCommand))
	{
		bHaveInterfaces = Take(NLinuxParser::ParseIpAddr(*Output, HostName, "ip"));
	}
	if (!bHaveInterfaces)
	{
		spdlog::error("Can't list the interfaces of {}", HostName);
	}

	LogDiagnostics(Diagnostics);
	if (!bHaveSockets && !bHaveInterfaces)
	{
		return std::nullopt;
	}
	spdlog::debug("Collected {} interfaces and {} sockets", Inventory.Interfaces.size(), Inventory.Sockets.size());
	return Inventory;
}
