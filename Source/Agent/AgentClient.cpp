/*
 * Copyright (c) 2026, Alex <uni@vrsal.cc>
 * SPDX-License-Identifier: BSD-3-Clause
 */

#include "AgentClient.hpp"

#include <algorithm>

#include "Time.hpp"
#include "Data/Protocol.hpp"

NAgentClient::NAgentClient(
	std::string const& ServerAddress, NPort ServerPort, ICollector& Collector_, std::string PrettyName_)
	: Socket(std::make_shared<NClientSocket>(ServerAddress, ServerPort))
	, Collector(Collector_)
	, PrettyName(std::move(PrettyName_))
{
	Socket->OnData.connect(&NAgentClient::HandleData, this);
}

void NAgentClient::Start()
{
	bRunning = true;
	ConnectionThread = std::thread(&NAgentClient::ConnectionThreadFunction, this);
}

void NAgentClient::Stop()
{
	bool const bWasRunning = bRunning.exchange(false);
	if (ConnectionThread.joinable())
	{
		ConnectionThread.join();
	}
	Socket->StopListenThread();
	StopRecording();
	if (bWasRunning && Socket->IsConnected())
	{
		SendMessage(MT_Exit, NExitMessage{ .Reason = "agent stopped" });
	}
	Socket->Close();
}

void NAgentClient::ConnectionThreadFunction()
{
	while (bRunning)
	{
		if (Socket->IsConnected())
		{
			std::this_thread::sleep_for(std::chrono::milliseconds(50));
			continue;
		}

		// Lost or never had a connection, a recording can't survive that
		StopRecording();
		Socket->StopListenThread();
		Socket->Close();
		if (!EnsureConnected())
		{
			for (int i = 0; i < 20 && bRunning; ++i)
			{
				std::this_thread::sleep_for(std::chrono::milliseconds(50));
			}
			continue;
		}

		spdlog::info("Connected to {}:{}", Socket->GetAddress(), Socket->GetPort());
		Socket->StartListenThread();
		if (!Register())
		{
			Socket->Close();
		}
	}
}

bool NAgentClient::EnsureConnected()
{
	if (Socket->GetState() == ES_Connected)
	{
		return true;
	}

	switch (Socket->GetState())
	{
		case ES_Initial:
			if (!Socket->Open())
			{
				return false;
			}
			[[fallthrough]];
		case ES_Opened:
			if (!Socket->Connect())
			{
				return false;
			}
		default:;
	}
	return Socket->GetState() == ES_Connected;
}

bool NAgentClient::Register()
{
	NRegisterMessage Register{ .HostName = Collector.GetHostName(), .PrettyName = PrettyName };
	if (auto Inventory = Collector.Collect())
	{
		Register.Addresses = Inventory->Interfaces;
	}

	if (Socket->SendFramed(EncodeMessage(MT_Register, Register)) < 0)
	{
		spdlog::error("Failed to register with the server: {}", NErrnoUtil::StrError());
		return false;
	}
	spdlog::info("Registered as {} with {} addresses", Register.HostName, Register.Addresses.size());
	return true;
}

void NAgentClient::HandleData(NBuffer& Buf)
{
	auto const Type = ReadMessageTypeFromBuffer(Buf);
	switch (Type)
	{
		case MT_CaptureRequest:
			HandleCaptureRequest(Buf);
			break;
		case MT_Exit:
		{
			NExitMessage Exit{};
			if (DecodeMessage(Buf, Exit))
			{
				spdlog::warn("Server closed the session: {}", Exit.Reason);
			}
			bRunning = false;
			Socket->Close();
			break;
		}
		default:
			spdlog::error("Received unexpected message type {} from server", static_cast<int>(Type));
			Socket->Close();
			break;
	}
}

void NAgentClient::HandleCaptureRequest(NBuffer const& Buf)
{
	NCaptureRequest Request{};
	if (!DecodeMessage(Buf, Request))
	{
		spdlog::error("Received undecodable capture request");
		Socket->Close();
		return;
	}

	spdlog::info("Capture request: {}", ECaptureMode::ToString(Request.Mode));
	switch (Request.Mode)
	{
		case ECaptureMode::Single:
			SendSnapshot(true);
			break;
		case ECaptureMode::StartRecord:
			StartRecording(std::max<uint32_t>(Request.IntervalSeconds, 1));
			break;
		case ECaptureMode::StopRecord:
			StopRecording();
			SendSnapshot(true);
			break;
		default:
			spdlog::warn("Unknown capture mode {}", static_cast<int>(Request.Mode));
			break;
	}
}

void NAgentClient::SendSnapshot(bool bFinal)
{
	auto Inventory = Collector.Collect();
	if (!Inventory)
	{
		spdlog::error("Nothing collected, no snapshot sent");
		return;
	}

	NCaptureSnapshot Snapshot{ .Inventory = std::move(*Inventory), .Timestamp = NTime::GetEpochMs(), .bFinal = bFinal };
	spdlog::debug("Sending snapshot with {} sockets{}", Snapshot.Inventory.Sockets.size(), bFinal ? " (final)" : "");
	SendMessage(MT_CaptureSnapshot, Snapshot);
}

void NAgentClient::StartRecording(uint32_t IntervalSeconds)
{
	std::lock_guard ControlLock(RecordControlMutex);
	StopRecordThread();
	{
		std::lock_guard Lock(RecordMutex);
		bRecording = true;
	}
	RecordThread = std::thread(&NAgentClient::RecordThreadFunction, this, IntervalSeconds);
}

void NAgentClient::StopRecording()
{
	std::lock_guard ControlLock(RecordControlMutex);
	StopRecordThread();
}

void NAgentClient::StopRecordThread()
{
	{
		std::lock_guard Lock(RecordMutex);
		bRecording = false;
	}
	RecordCondition.notify_all();
	if (RecordThread.joinable())
	{
		RecordThread.join();
	}
}

void NAgentClient::RecordThreadFunction(uint32_t IntervalSeconds)
{
	std::unique_lock Lock(RecordMutex);
	while (bRecording)
	{
		Lock.unlock();
		SendSnapshot(false);
		Lock.lock();
		RecordCondition.wait_for(Lock, std::chrono::seconds(IntervalSeconds), [this] { return !bRecording; });
	}
}
