/*
 * Copyright (c) 2026, Alex <uni@vrsal.cc>
 * SPDX-License-Identifier: BSD-3-Clause
 */

#include "AgentRegistry.hpp"

#include <ranges>
#include <spdlog/spdlog.h>

bool NAgentRegistry::Add(NHostName const& HostName, std::shared_ptr<NAgentConnection> const& Connection)
{
	{
		std::lock_guard Lock(Mutex);
		if (!Agents.emplace(HostName, Connection).second)
		{
			return false;
		}
	}
	spdlog::info("Agent {} registered", HostName);
	OnAgentAdded(HostName);
	return true;
}

bool NAgentRegistry::Remove(NHostName const& HostName, NAgentConnection const* Connection)
{
	{
		std::lock_guard Lock(Mutex);
		auto            It = Agents.find(HostName);
		if (It == Agents.end() || It->second.get() != Connection)
		{
			return false;
		}
		Agents.erase(It);
	}
	spdlog::info("Agent {} removed", HostName);
	OnAgentRemoved(HostName);
	return true;
}

std::shared_ptr<NAgentConnection> NAgentRegistry::Find(NHostName const& HostName) const
{
	std::lock_guard Lock(Mutex);
	if (auto It = Agents.find(HostName); It != Agents.end())
	{
		return It->second;
	}
	return nullptr;
}

std::vector<NAgentInfo> NAgentRegistry::List() const
{
	std::vector<std::shared_ptr<NAgentConnection>> Connections{};
	{
		std::lock_guard Lock(Mutex);
		for (auto const& Connection : Agents | std::views::values)
		{
			Connections.push_back(Connection);
		}
	}

	// Connection state is read without holding the registry lock
	std::vector<NAgentInfo> Infos{};
	Infos.reserve(Connections.size());
	for (auto const& Connection : Connections)
	{
		Infos.push_back({ .HostName = Connection->GetHostName(),
			.PrettyName = Connection->GetPrettyName(),
			.PeerAddress = Connection->GetPeerAddress(),
			.State = Connection->GetState() });
	}
	return Infos;
}

void NAgentRegistry::Clear()
{
	std::map<NHostName, std::shared_ptr<NAgentConnection>> Removed{};
	{
		std::lock_guard Lock(Mutex);
		Removed.swap(Agents);
	}
	for (auto const& HostName : Removed | std::views::keys)
	{
		OnAgentRemoved(HostName);
	}
}
