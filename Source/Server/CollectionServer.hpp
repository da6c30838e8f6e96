/*
 * Copyright (c) 2026, Alex <uni@vrsal.cc>
 * SPDX-License-Identifier: BSD-3-Clause
 */

#pragma once
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include "AgentRegistry.hpp"
#include "InventoryStore.hpp"
#include "Data/Protocol.hpp"
#include "Communication/AgentConnection.hpp"
#include "Communication/AgentListener.hpp"

struct NServerSettings
{
	std::string Address{}; // empty listens on every address
	NPort       Port{ NETZKARTE_DEFAULT_PORT };
	NMsec       CaptureTimeoutMs{ 10000 };
	uint32_t    RecordingIntervalSeconds{ 5 };
};

// Accepts agents and drives captures into the inventory store
class NCollectionServer
{
	NServerSettings  Settings;
	NInventoryStore& Store;
	NAgentRegistry   Registry{};

	std::mutex                                     ConnectionsMutex{};
	std::vector<std::shared_ptr<NAgentConnection>> Connections{};

	std::mutex   DiagnosticsMutex{};
	NDiagnostics Diagnostics{};

	std::unique_ptr<NAgentListener> Listener{};

	void HandleNewConnection(std::shared_ptr<NClientSocket> const& Socket);

	void AddDiagnostic(NDiagnostic const& Diagnostic);

	std::shared_ptr<NAgentConnection> FindAgent(NHostName const& HostName) const;

public:
	NCollectionServer(NServerSettings Settings_, NInventoryStore& Store_);

	~NCollectionServer() { Stop(); }

	bool Start();

	void Stop();

	// Times out stale requests and drops closed connections, call periodically from the control thread
	void Tick();

	[[nodiscard]] NPort GetPort() const { return Listener ? Listener->GetPort() : Settings.Port; }

	[[nodiscard]] std::vector<NAgentInfo> ListActiveAgents() const { return Registry.List(); }

	// Blocks until the snapshot is in the store or the capture timed out
	bool TriggerCapture(NHostName const& HostName);

	bool StartRecording(NHostName const& HostName);

	// Blocks for the final snapshot, then returns everything recorded since StartRecording()
	std::optional<NHostInventory> StopRecording(NHostName const& HostName);

	NDiagnostics TakeDiagnostics();

	[[nodiscard]] NAgentRegistry& GetRegistry() { return Registry; }

	[[nodiscard]] NServerSettings const& GetSettings() const { return Settings; }
};
