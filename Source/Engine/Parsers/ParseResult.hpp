/*
 * Copyright (c) 2026, Alex <uni@vrsal.cc>
 * SPDX-License-Identifier: BSD-3-Clause
 */

#pragma once
#include <string>

#include "Data/Diagnostic.hpp"
#include "Data/HostInventory.hpp"

// Output of a single format parser. A rejected file (bOk == false) contributes nothing,
// malformed lines only cost their own record.
struct NParseResult
{
	bool           bOk{ true };
	std::string    File{};
	NHostInventory Inventory{};
	NDiagnostics   Diagnostics{};

	NParseResult(NHostName const& Host, std::string File_) : File(std::move(File_)) { Inventory.Name = Host; }

	void LineError(size_t Line, std::string Message)
	{
		Diagnostics.push_back(NDiagnostic{ .Kind = EDiagnosticKind::ParseError,
			.Host = Inventory.Name,
			.File = File,
			.Line = Line,
			.Message = std::move(Message) });
	}

	void Fail(std::string Message, size_t Line = 0)
	{
		bOk = false;
		Inventory.Interfaces.clear();
		Inventory.Sockets.clear();
		Inventory.ProcessNames.clear();
		LineError(Line, std::move(Message));
	}

	// Rejects records that break the LISTENING/ESTABLISHED invariant
	bool AddSocket(size_t Line, NSocketRecord Record)
	{
		if (!Record.IsConsistent())
		{
			LineError(Line, "inconsistent socket record " + Record.ToString());
			return false;
		}
		Inventory.Sockets.push_back(std::move(Record));
		return true;
	}
};
