/*
 * Copyright (c) 2026, Alex <uni@vrsal.cc>
 * SPDX-License-Identifier: BSD-3-Clause
 */

#pragma once
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <vector>
#include <sigslot/signal.hpp>

#include "Types.hpp"
#include "Data/Diagnostic.hpp"
#include "Data/HostInventory.hpp"
#include "Data/Protocol.hpp"

// Immutable point in time copy of the whole store, sorted by host name
using NInventoryView = std::map<NHostName, NHostInventory>;

// Owns every host inventory. Writes to one host are serialized by that host's cell,
// different hosts can be written in parallel.
class NInventoryStore
{
	struct NHostCell
	{
		std::mutex     Mutex{};
		NHostInventory Inventory{};
		bool           bRecording{};
		bool           bWindowEmpty{}; // no snapshot arrived since BeginRecording()
	};

	mutable std::mutex                              CellsMutex{};
	std::map<NHostName, std::shared_ptr<NHostCell>> Cells{};

	std::shared_ptr<NHostCell> GetOrCreateCell(NHostName const& Host);

	[[nodiscard]] std::shared_ptr<NHostCell> FindCell(NHostName const& Host) const;

public:
	// Emitted after any write to a host, from the writing thread
	sigslot::signal<NHostName const&> OnHostChanged;

	void PutPartial(NHostName const& Host, NHostInventory const& Partial, NDiagnostics* Diagnostics = nullptr);

	// Refused (false) if the host is already recording
	bool BeginRecording(NHostName const& Host);

	// Closes the window and returns the merged inventory, nullopt if the host wasn't recording
	std::optional<NHostInventory> EndRecording(NHostName const& Host);

	// Inside a recording window sockets are unioned, outside the snapshot replaces the host.
	// Interfaces always come from the latest snapshot.
	void AddSnapshot(NHostName const& Host, NCaptureSnapshot const& Snapshot);

	[[nodiscard]] std::shared_ptr<NInventoryView const> Snapshot() const;

	bool Remove(NHostName const& Host);

	[[nodiscard]] std::optional<NHostInventory> Get(NHostName const& Host) const;

	[[nodiscard]] std::vector<NHostName> HostNames() const;

	[[nodiscard]] bool IsRecording(NHostName const& Host) const;

	[[nodiscard]] size_t GetHostCount() const
	{
		std::lock_guard Lock(CellsMutex);
		return Cells.size();
	}
};
