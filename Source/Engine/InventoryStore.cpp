/*
 * Copyright (c) 2026, Alex <uni@vrsal.cc>
 * SPDX-License-Identifier: BSD-3-Clause
 */

#include "InventoryStore.hpp"

#include <spdlog/spdlog.h>

std::shared_ptr<NInventoryStore::NHostCell> NInventoryStore::GetOrCreateCell(NHostName const& Host)
{
	std::lock_guard Lock(CellsMutex);
	auto&           Cell = Cells[Host];
	if (!Cell)
	{
		Cell = std::make_shared<NHostCell>();
		Cell->Inventory.Name = Host;
	}
	return Cell;
}

std::shared_ptr<NInventoryStore::NHostCell> NInventoryStore::FindCell(NHostName const& Host) const
{
	std::lock_guard Lock(CellsMutex);
	if (auto It = Cells.find(Host); It != Cells.end())
	{
		return It->second;
	}
	return nullptr;
}

void NInventoryStore::PutPartial(NHostName const& Host, NHostInventory const& Partial, NDiagnostics* Diagnostics)
{
	auto Cell = GetOrCreateCell(Host);
	{
		std::lock_guard Lock(Cell->Mutex);
		Cell->Inventory.MergeFrom(Partial, Diagnostics);
		Cell->Inventory.Name = Host;
	}
	OnHostChanged(Host);
}

bool NInventoryStore::BeginRecording(NHostName const& Host)
{
	auto            Cell = GetOrCreateCell(Host);
	std::lock_guard Lock(Cell->Mutex);
	if (Cell->bRecording)
	{
		spdlog::warn("{} is already recording", Host);
		return false;
	}
	Cell->bRecording = true;
	Cell->bWindowEmpty = true;
	return true;
}

std::optional<NHostInventory> NInventoryStore::EndRecording(NHostName const& Host)
{
	auto Cell = FindCell(Host);
	if (!Cell)
	{
		return std::nullopt;
	}

	std::lock_guard Lock(Cell->Mutex);
	if (!Cell->bRecording)
	{
		return std::nullopt;
	}
	Cell->bRecording = false;
	Cell->bWindowEmpty = false;
	return Cell->Inventory;
}

void NInventoryStore::AddSnapshot(NHostName const& Host, NCaptureSnapshot const& Snapshot)
{
	auto Cell = GetOrCreateCell(Host);
	{
		std::lock_guard Lock(Cell->Mutex);
		auto&           Inventory = Cell->Inventory;
		std::string     PrettyName = Snapshot.Inventory.PrettyName.empty() ? Inventory.PrettyName : Snapshot.Inventory.PrettyName;

		if (Cell->bRecording && !Cell->bWindowEmpty)
		{
			NDiagnostics Diagnostics{};
			Inventory.MergeFrom(Snapshot.Inventory, &Diagnostics);
			Inventory.Interfaces = Snapshot.Inventory.Interfaces;
			Inventory.Normalize();
			LogDiagnostics(Diagnostics);
		}
		else
		{
			Inventory = Snapshot.Inventory;
			Inventory.ApplyProcessNames();
			Inventory.Normalize();
			Cell->bWindowEmpty = false;
		}
		Inventory.Name = Host;
		Inventory.PrettyName = std::move(PrettyName);
		spdlog::debug("{}: snapshot with {} sockets, {} in store", Host, Snapshot.Inventory.Sockets.size(),
			Inventory.Sockets.size());
	}
	OnHostChanged(Host);
}

std::shared_ptr<NInventoryView const> NInventoryStore::Snapshot() const
{
	std::vector<std::shared_ptr<NHostCell>> CellList{};
	{
		std::lock_guard Lock(CellsMutex);
		CellList.reserve(Cells.size());
		for (auto const& [Name, Cell] : Cells)
		{
			CellList.push_back(Cell);
		}
	}

	auto View = std::make_shared<NInventoryView>();
	for (auto const& Cell : CellList)
	{
		std::lock_guard Lock(Cell->Mutex);
		View->emplace(Cell->Inventory.Name, Cell->Inventory);
	}
	return View;
}

bool NInventoryStore::Remove(NHostName const& Host)
{
	{
		std::lock_guard Lock(CellsMutex);
		if (Cells.erase(Host) == 0)
		{
			return false;
		}
	}
	OnHostChanged(Host);
	return true;
}

std::optional<NHostInventory> NInventoryStore::Get(NHostName const& Host) const
{
	auto Cell = FindCell(Host);
	if (!Cell)
	{
		return std::nullopt;
	}
	std::lock_guard Lock(Cell->Mutex);
	return Cell->Inventory;
}

std::vector<NHostName> NInventoryStore::HostNames() const
{
	std::lock_guard        Lock(CellsMutex);
	std::vector<NHostName> Names{};
	Names.reserve(Cells.size());
	for (auto const& [Name, Cell] : Cells)
	{
		Names.push_back(Name);
	}
	return Names;
}

bool NInventoryStore::IsRecording(NHostName const& Host) const
{
	auto Cell = FindCell(Host);
	if (!Cell)
	{
		return false;
	}
	std::lock_guard Lock(Cell->Mutex);
	return Cell->bRecording;
}
