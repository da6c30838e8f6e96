/*
 * Copyright (c) 2026, Alex <uni@vrsal.cc>
 * SPDX-License-Identifier: BSD-3-Clause
 */

#pragma once
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <vector>
#include <sigslot/signal.hpp>

#include "Types.hpp"
#include "Communication/AgentConnection.hpp"

struct NAgentInfo
{
	NHostName         HostName{};
	std::string       PrettyName{};
	std::string       PeerAddress{};
	EAgentState::Type State{};
};

// Registered agents by host name. Owned by the server, every connection gets a reference.
class NAgentRegistry
{
	mutable std::mutex                                     Mutex{};
	std::map<NHostName, std::shared_ptr<NAgentConnection>> Agents{};

public:
	sigslot::signal<NHostName const&> OnAgentAdded;
	sigslot::signal<NHostName const&> OnAgentRemoved;

	// Refused if another connection already uses the name
	bool Add(NHostName const& HostName, std::shared_ptr<NAgentConnection> const& Connection);

	// Only removes the entry if it still belongs to Connection
	bool Remove(NHostName const& HostName, NAgentConnection const* Connection);

	[[nodiscard]] std::shared_ptr<NAgentConnection> Find(NHostName const& HostName) const;

	[[nodiscard]] std::vector<NAgentInfo> List() const;

	void Clear();

	[[nodiscard]] size_t GetCount() const
	{
		std::lock_guard Lock(Mutex);
		return Agents.size();
	}
};
