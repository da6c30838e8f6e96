/*
 * Copyright (c) 2026, Alex <uni@vrsal.cc>
 * SPDX-License-Identifier: BSD-3-Clause
 */

#pragma once
#include <filesystem>
#include <string>
#include <string_view>

#include "Parsers/ParseResult.hpp"

// Hand written or exported host tables:
//   <host>_ip.csv       one column "IP"
//   <host>_network.csv  protocol,local_socket,foreign_socket,state,pid,process_name
// v6 sockets are bracketed (RFC 2732), "*:port" is the dual stack wildcard.
class NCsvInventory
{
public:
	static NParseResult ParseIpFile(std::string_view Text, NHostName const& Host, std::string const& File = {});

	static NParseResult ParseNetworkFile(std::string_view Text, NHostName const& Host, std::string const& File = {});

	static NParseResult Parse(std::string_view IpText, std::string_view NetworkText, NHostName const& Host);

	[[nodiscard]] static std::string FormatIpFile(NHostInventory const& Inventory);

	[[nodiscard]] static std::string FormatNetworkFile(NHostInventory const& Inventory);

	// Writes <Dir>/<host>_ip.csv and <Dir>/<host>_network.csv
	static bool Write(NHostInventory const& Inventory, std::filesystem::path const& Dir);
};
