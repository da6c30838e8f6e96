/*
 * Copyright (c) 2026, Alex <uni@vrsal.cc>
 * SPDX-License-Identifier: BSD-3-Clause
 */

#pragma once
#include <filesystem>
#include <string>

#include "ConnectionGraph.hpp"
#include "InventoryStore.hpp"
#include "Json.hpp"

// Hands a finished graph to the outside world
class NGraphExport
{
public:
	// One row per edge:
	// Source host,Dest host,Source process,Dest process,Source PID,Dest PID,
	// Source process socket,Dest process socket,Protocol,Rule
	[[nodiscard]] static std::string ToConnectionsCsv(NConnectionGraph const& Graph);

	// Interfaces are only added if a view is passed
	[[nodiscard]] static NJson ToJson(NConnectionGraph const& Graph, NInventoryView const* View = nullptr);

	static bool WriteConnectionsCsv(NConnectionGraph const& Graph, std::filesystem::path const& Path);

	static bool WriteJson(NConnectionGraph const& Graph, std::filesystem::path const& Path,
		NInventoryView const* View = nullptr);
};
