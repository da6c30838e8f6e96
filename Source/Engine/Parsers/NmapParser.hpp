/*
 * Copyright (c) 2026, Alex <uni@vrsal.cc>
 * SPDX-License-Identifier: BSD-3-Clause
 */

#pragma once
#include <string>
#include <string_view>

#include "Parsers/ParseResult.hpp"

// Output of `nmap -4|-6 <ip>` for a host nothing could be run on. Every open port becomes
// a LISTENING socket on the scanned address, the process is nmap's service guess with a "?".
class NNmapParser
{
public:
	static NParseResult Parse(
		std::string_view Text, NHostName const& Host, std::string_view ScannedAddress, std::string const& File = {});
};
