/*
 * Copyright (c) 2026, Alex <uni@vrsal.cc>
 * SPDX-License-Identifier: BSD-3-Clause
 */

#pragma once
#include <string>
#include <string_view>

#include "Parsers/ParseResult.hpp"

// Parsers for `Get-NetIPAddress` / `ipconfig`, `netstat -ano` and `tasklist /FO CSV`.
// Text is expected as UTF-8, NFilesystem::ReadTextFile() transcodes UTF-16 captures.
class NWindowsParser
{
public:
	static NParseResult ParseIpConfig(std::string_view Text, NHostName const& Host, std::string const& File = {});

	// Sockets only carry the pid, names come from the tasklist table when the inventories are merged
	static NParseResult ParseNetstat(std::string_view Text, NHostName const& Host, std::string const& File = {});

	// Fills NHostInventory::ProcessNames
	static NParseResult ParseTasklist(std::string_view Text, NHostName const& Host, std::string const& File = {});
};
