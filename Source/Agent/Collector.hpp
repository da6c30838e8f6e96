/*
 * Copyright (c) 2026, Alex <uni@vrsal.cc>
 * SPDX-License-Identifier: BSD-3-Clause
 */

#pragma once
#include <optional>
#include <string>

#include "ICollector.hpp"

// Runs ss (or netstat) and ip in the C locale and parses their output
class NCommandCollector final : public ICollector
{
	NHostName HostName{};
	bool      bPreferNetstat{};

public:
	explicit NCommandCollector(bool bPreferNetstat_ = false);

	[[nodiscard]] NHostName GetHostName() const override { return HostName; }

	std::optional<NHostInventory> Collect() override;

	// stdout of Command, nullopt if it couldn't be started or failed without output
	static std::optional<std::string> Run(std::string const& Command);
};
