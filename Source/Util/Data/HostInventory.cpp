/*
 * Copyright (c) 2026, Alex <uni@vrsal.cc>
 * SPDX-License-Identifier: BSD-3-Clause
 */

#include "HostInventory.hpp"

#include <algorithm>

namespace
{
	NSocketRecord StripName(NSocketRecord Record)
	{
		Record.ProcessName.clear();
		return Record;
	}
} // namespace

bool NHostInventory::AddInterface(NIPAddress const& Address)
{
	if (HasInterface(Address))
	{
		return false;
	}
	Interfaces.push_back(Address);
	return true;
}

bool NHostInventory::HasInterface(NIPAddress const& Address) const
{
	return std::ranges::find(Interfaces, Address) != Interfaces.end();
}

void NHostInventory::ApplyProcessNames()
{
	if (ProcessNames.empty())
	{
		return;
	}

	for (auto& Socket : Sockets)
	{
		if (Socket.Pid == 0 || !Socket.ProcessName.empty())
		{
			continue;
		}
		if (auto It = ProcessNames.find(Socket.Pid); It != ProcessNames.end())
		{
			Socket.ProcessName = It->second;
		}
	}
}

void NHostInventory::MergeFrom(NHostInventory const& Other, NDiagnostics* Diagnostics)
{
	auto Report = [&](std::string Message) {
		if (Diagnostics)
		{
			Diagnostics->push_back(NDiagnostic{
				.Kind = EDiagnosticKind::MergeConflict, .Host = Name, .Message = std::move(Message) });
		}
	};

	if (Name.empty())
	{
		Name = Other.Name;
	}
	if (!Other.PrettyName.empty())
	{
		PrettyName = Other.PrettyName;
	}

	for (auto const& Address : Other.Interfaces)
	{
		AddInterface(Address);
	}

	for (auto const& [Pid, ProcessName] : Other.ProcessNames)
	{
		auto [It, bInserted] = ProcessNames.emplace(Pid, ProcessName);
		if (!bInserted && It->second != ProcessName)
		{
			Report(fmt::format("pid {} is '{}' and '{}', keeping '{}'", Pid, It->second, ProcessName, ProcessName));
			It->second = ProcessName;
		}
	}

	std::map<NSocketRecord, size_t> Index{};
	for (size_t i = 0; i < Sockets.size(); ++i)
	{
		Index.emplace(StripName(Sockets[i]), i);
	}

	for (auto const& Incoming : Other.Sockets)
	{
		auto It = Index.find(StripName(Incoming));
		if (It == Index.end())
		{
			Index.emplace(StripName(Incoming), Sockets.size());
			Sockets.push_back(Incoming);
			continue;
		}

		auto& Existing = Sockets[It->second];
		if (Incoming.ProcessName.empty() || Existing.ProcessName == Incoming.ProcessName)
		{
			continue;
		}
		if (!Existing.ProcessName.empty())
		{
			Report(fmt::format("{} owned by '{}' and '{}', keeping '{}'", Incoming.LocalEndpoint.ToString(),
				Existing.ProcessName, Incoming.ProcessName, Incoming.ProcessName));
		}
		Existing.ProcessName = Incoming.ProcessName;
	}

	ApplyProcessNames();
	Normalize();
}

void NHostInventory::Normalize()
{
	std::sort(Interfaces.begin(), Interfaces.end());
	Interfaces.erase(std::unique(Interfaces.begin(), Interfaces.end()), Interfaces.end());

	std::sort(Sockets.begin(), Sockets.end());
	Sockets.erase(std::unique(Sockets.begin(), Sockets.end()), Sockets.end());

	// After sorting an unnamed record directly precedes its named twins
	std::vector<NSocketRecord> Result{};
	Result.reserve(Sockets.size());
	for (size_t i = 0; i < Sockets.size(); ++i)
	{
		bool const bHasNamedTwin = i + 1 < Sockets.size() && Sockets[i].ProcessName.empty()
			&& Sockets[i].GetEndpointKey() == Sockets[i + 1].GetEndpointKey();
		if (!bHasNamedTwin)
		{
			Result.push_back(std::move(Sockets[i]));
		}
	}
	Sockets = std::move(Result);
}
