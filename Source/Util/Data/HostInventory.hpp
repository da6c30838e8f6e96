/*
 * Copyright (c) 2026, Alex <uni@vrsal.cc>
 * SPDX-License-Identifier: BSD-3-Clause
 */

#pragma once
#include <map>
#include <string>
#include <vector>

#include "IPAddress.hpp"
#include "Types.hpp"
#include "Data/Diagnostic.hpp"
#include "Data/SocketRecord.hpp"

// Everything known about one host: its addresses and its sockets
struct NHostInventory
{
	NHostName                         Name{};
	std::string                       PrettyName{};
	std::vector<NIPAddress>           Interfaces{};
	std::vector<NSocketRecord>        Sockets{};
	std::map<NProcessId, std::string> ProcessNames{}; // from tasklist, used to fill in socket process names

	[[nodiscard]] bool IsEmpty() const { return Interfaces.empty() && Sockets.empty() && ProcessNames.empty(); }

	[[nodiscard]] std::string GetDisplayName() const { return PrettyName.empty() ? Name : PrettyName; }

	// Returns false if the address was already known
	bool AddInterface(NIPAddress const& Address);

	[[nodiscard]] bool HasInterface(NIPAddress const& Address) const;

	// Fills empty process names from the pid table
	void ApplyProcessNames();

	// Union with de-duplication. A record that only differs by its missing process name
	// is merged into the named one. Conflicting pid -> name facts are reported, the
	// incoming value wins.
	void MergeFrom(NHostInventory const& Other, NDiagnostics* Diagnostics = nullptr);

	// Sorts and de-duplicates interfaces and sockets
	void Normalize();

	template <class Archive>
	void serialize(Archive& archive)
	{
		archive(Name, PrettyName, Interfaces, Sockets, ProcessNames);
	}
};
