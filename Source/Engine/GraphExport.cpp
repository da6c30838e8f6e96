/*
 * Copyright (c) 2026, Alex <uni@vrsal.cc>
 * SPDX-License-Identifier: BSD-3-Clause
 */

#include "GraphExport.hpp"

#include <cctype>
#include <spdlog/spdlog.h>

#include "Csv.hpp"
#include "Filesystem.hpp"

namespace
{
	std::string ToUpper(std::string Str)
	{
		for (auto& C : Str)
		{
			C = static_cast<char>(std::toupper(static_cast<unsigned char>(C)));
		}
		return Str;
	}

	void SocketToJson(NSocketRecord const& Record, NJson::object& Json)
	{
		Json[JSON_KEY_PROTOCOL] = EProtocol::ToString(Record.Protocol);
		Json[JSON_KEY_LOCAL] = Record.LocalEndpoint.ToString();
		Json[JSON_KEY_FOREIGN] = Record.ForeignEndpoint ? NJson(Record.ForeignEndpoint->ToString()) : NJson(nullptr);
		Json[JSON_KEY_STATE] = EConnectionState::ToString(Record.State);
	}

	NJson::object ProcessToJson(NProcessRef const& Process)
	{
		NJson::object Json;
		Json[JSON_KEY_HOST] = Process.Host;
		Json[JSON_KEY_PID] = static_cast<int>(Process.Pid);
		Json[JSON_KEY_PROCESS] = Process.GetLabel();
		return Json;
	}
} // namespace

std::string NGraphExport::ToConnectionsCsv(NConnectionGraph const& Graph)
{
	std::string Out = NCsv::FormatRow({ "Source host", "Dest host", "Source process", "Dest process", "Source PID",
		"Dest PID", "Source process socket", "Dest process socket", "Protocol", "Rule" });

	for (auto const& Edge : Graph.Edges)
	{
		Out += NCsv::FormatRow({
			Edge.ClientHost,
			Edge.ServerHost,
			Edge.ClientSocket.GetProcessLabel(),
			Edge.ServerSocket.GetProcessLabel(),
			std::to_string(Edge.ClientSocket.Pid),
			std::to_string(Edge.ServerSocket.Pid),
			Edge.ClientSocket.LocalEndpoint.ToString(),
			Edge.ServerSocket.LocalEndpoint.ToString(),
			ToUpper(EProtocol::ToString(Edge.ClientSocket.Protocol)),
			EMatchRule::ToString(Edge.Rule),
		});
	}
	return Out;
}

NJson NGraphExport::ToJson(NConnectionGraph const& Graph, NInventoryView const* View)
{
	NJson::array HostArray;
	for (auto const& [Name, DisplayName] : Graph.Hosts)
	{
		NJson::object HostJson;
		HostJson[JSON_KEY_NAME] = Name;
		HostJson[JSON_KEY_DISPLAY_NAME] = DisplayName;

		if (View)
		{
			NJson::array Interfaces;
			if (auto It = View->find(Name); It != View->end())
			{
				for (auto const& Address : It->second.Interfaces)
				{
					Interfaces.emplace_back(Address.ToDisplayString());
				}
			}
			HostJson[JSON_KEY_INTERFACES] = Interfaces;
		}
		HostArray.emplace_back(HostJson);
	}

	NJson::array EdgeArray;
	for (auto const& Edge : Graph.Edges)
	{
		NJson::object ClientJson = ProcessToJson(Edge.GetClientProcess());
		NJson::object SocketJson;
		SocketToJson(Edge.ClientSocket, SocketJson);
		ClientJson[JSON_KEY_SOCKET] = SocketJson;

		NJson::object ServerJson = ProcessToJson(Edge.GetServerProcess());
		SocketJson.clear();
		SocketToJson(Edge.ServerSocket, SocketJson);
		ServerJson[JSON_KEY_SOCKET] = SocketJson;

		NJson::object EdgeJson;
		EdgeJson[JSON_KEY_CLIENT] = ClientJson;
		EdgeJson[JSON_KEY_SERVER] = ServerJson;
		EdgeJson[JSON_KEY_RULE] = EMatchRule::ToString(Edge.Rule);
		EdgeJson[JSON_KEY_HANDOVER] = Edge.Handover ? NJson(ProcessToJson(*Edge.Handover)) : NJson(nullptr);
		EdgeArray.emplace_back(EdgeJson);
	}

	NJson::array DiagnosticArray;
	for (auto const& Diagnostic : Graph.Diagnostics)
	{
		NJson::object DiagnosticJson;
		DiagnosticJson[JSON_KEY_KIND] = EDiagnosticKind::ToString(Diagnostic.Kind);
		DiagnosticJson[JSON_KEY_HOST] = Diagnostic.Host;
		DiagnosticJson[JSON_KEY_FILE] = Diagnostic.File;
		DiagnosticJson[JSON_KEY_LINE] = static_cast<int>(Diagnostic.Line);
		DiagnosticJson[JSON_KEY_MESSAGE] = Diagnostic.Message;
		DiagnosticArray.emplace_back(DiagnosticJson);
	}

	NJson::object Json;
	Json[JSON_KEY_HOSTS] = HostArray;
	Json[JSON_KEY_EDGES] = EdgeArray;
	Json[JSON_KEY_DIAGNOSTICS] = DiagnosticArray;
	return Json;
}

bool NGraphExport::WriteConnectionsCsv(NConnectionGraph const& Graph, std::filesystem::path const& Path)
{
	if (!NFilesystem::WriteTextFile(Path, ToConnectionsCsv(Graph)))
	{
		return false;
	}
	spdlog::info("Wrote {} connections to {}", Graph.Edges.size(), Path.string());
	return true;
}

bool NGraphExport::WriteJson(NConnectionGraph const& Graph, std::filesystem::path const& Path, NInventoryView const* View)
{
	if (!NFilesystem::WriteTextFile(Path, ToJson(Graph, View).dump()))
	{
		return false;
	}
	spdlog::info("Wrote graph with {} hosts and {} connections to {}", Graph.Hosts.size(), Graph.Edges.size(),
		Path.string());
	return true;
}
