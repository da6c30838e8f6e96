/*
 * Copyright (c) 2026, Alex <uni@vrsal.cc>
 * SPDX-License-Identifier: BSD-3-Clause
 */

#include "CollectionServer.hpp"

#include <algorithm>
#include <iterator>
#include <spdlog/spdlog.h>

NCollectionServer::NCollectionServer(NServerSettings Settings_, NInventoryStore& Store_)
	: Settings(std::move(Settings_)), Store(Store_)
{
}

bool NCollectionServer::Start()
{
	Listener = std::make_unique<NAgentListener>(Settings.Address, Settings.Port);
	Listener->OnNewConnection.connect(&NCollectionServer::HandleNewConnection, this);
	if (!Listener->StartListenThread())
	{
		Listener.reset();
		return false;
	}
	return true;
}

void NCollectionServer::Stop()
{
	if (Listener)
	{
		Listener->Stop();
		Listener.reset();
	}

	std::vector<std::shared_ptr<NAgentConnection>> Closing{};
	{
		std::lock_guard Lock(ConnectionsMutex);
		Closing.swap(Connections);
	}
	for (auto const& Connection : Closing)
	{
		if (Connection->IsActive())
		{
			Connection->Close("server shutting down");
		}
	}
	Registry.Clear();
	// Joins every socket thread
	Closing.clear();
}

void NCollectionServer::HandleNewConnection(std::shared_ptr<NClientSocket> const& Socket)
{
	auto Connection = std::make_shared<NAgentConnection>(Socket, Registry, Store);
	Connection->OnDiagnostic.connect(&NCollectionServer::AddDiagnostic, this);
	{
		std::lock_guard Lock(ConnectionsMutex);
		Connections.push_back(Connection);
	}
	Connection->Start();
}

void NCollectionServer::AddDiagnostic(NDiagnostic const& Diagnostic)
{
	Diagnostic.Log();
	std::lock_guard Lock(DiagnosticsMutex);
	Diagnostics.push_back(Diagnostic);
}

std::shared_ptr<NAgentConnection> NCollectionServer::FindAgent(NHostName const& HostName) const
{
	auto Connection = Registry.Find(HostName);
	if (!Connection)
	{
		spdlog::warn("No agent connected for {}", HostName);
	}
	return Connection;
}

void NCollectionServer::Tick()
{
	std::vector<std::shared_ptr<NAgentConnection>> Closed{};
	std::vector<std::shared_ptr<NAgentConnection>> Active{};
	{
		std::lock_guard Lock(ConnectionsMutex);
		auto            Split = std::stable_partition(Connections.begin(), Connections.end(),
			   [](std::shared_ptr<NAgentConnection> const& Connection) { return Connection->IsActive(); });
		std::move(Split, Connections.end(), std::back_inserter(Closed));
		Connections.erase(Split, Connections.end());
		Active = Connections;
	}

	for (auto const& Connection : Active)
	{
		Connection->CheckTimeout(Settings.CaptureTimeoutMs);
	}

	if (!Closed.empty())
	{
		spdlog::debug("Dropping {} closed agent connections", Closed.size());
	}
	// Closed connections are destroyed here, outside their own socket thread
}

bool NCollectionServer::TriggerCapture(NHostName const& HostName)
{
	auto Connection = FindAgent(HostName);
	if (!Connection || !Connection->RequestCapture())
	{
		return false;
	}

	spdlog::info("Capturing {}", HostName);
	if (!Connection->WaitForIdle(Settings.CaptureTimeoutMs))
	{
		Connection->CheckTimeout(0);
		return false;
	}
	spdlog::info("Capture of {} done", HostName);
	return true;
}

bool NCollectionServer::StartRecording(NHostName const& HostName)
{
	auto Connection = FindAgent(HostName);
	if (!Connection)
	{
		return false;
	}
	if (!Store.BeginRecording(HostName))
	{
		return false;
	}
	if (!Connection->RequestStartRecording(Settings.RecordingIntervalSeconds))
	{
		Store.EndRecording(HostName);
		return false;
	}
	spdlog::info("Recording {} every {}s", HostName, Settings.RecordingIntervalSeconds);
	return true;
}

std::optional<NHostInventory> NCollectionServer::StopRecording(NHostName const& HostName)
{
	auto Connection = FindAgent(HostName);
	if (Connection && Connection->RequestStopRecording())
	{
		if (!Connection->WaitForIdle(Settings.CaptureTimeoutMs))
		{
			Connection->CheckTimeout(0);
		}
	}

	auto Inventory = Store.EndRecording(HostName);
	if (Inventory)
	{
		spdlog::info("Recording of {} done, {} sockets", HostName, Inventory->Sockets.size());
	}
	return Inventory;
}

NDiagnostics NCollectionServer::TakeDiagnostics()
{
	std::lock_guard Lock(DiagnosticsMutex);
	NDiagnostics    Taken{};
	Taken.swap(Diagnostics);
	return Taken;
}
