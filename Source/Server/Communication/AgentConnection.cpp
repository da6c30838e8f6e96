/*
 * Copyright (c) 2026, Alex <uni@vrsal.cc>
 * SPDX-License-Identifier: BSD-3-Clause
 */

#include "AgentConnection.hpp"

#include <spdlog/spdlog.h>

#include "AgentRegistry.hpp"
#include "InventoryStore.hpp"
#include "Time.hpp"
#include "Data/Protocol.hpp"

NAgentConnection::NAgentConnection(
	std::shared_ptr<NClientSocket> Socket_, NAgentRegistry& Registry_, NInventoryStore& Store_)
	: Socket(std::move(Socket_)), Registry(Registry_), Store(Store_)
{
}

NAgentConnection::~NAgentConnection()
{
	// Joins the socket thread before any slot target goes away
	Socket->StopListenThread();
	DataConnection.disconnect();
	ClosedConnection.disconnect();
	Socket->Close();
}

void NAgentConnection::Start()
{
	DataConnection = Socket->OnData.connect([this](NBuffer& Buf) { HandleData(Buf); });
	ClosedConnection = Socket->OnClosed.connect([this] { HandleClosed(); });
	Socket->StartListenThread();
}

std::string NAgentConnection::GetDisplayName() const
{
	// Called with and without the state lock held, only reads the socket
	return Socket->GetAddress();
}

void NAgentConnection::SetState(EAgentState::Type NewState)
{
	if (State != NewState)
	{
		spdlog::debug("Agent {} ({}): {} -> {}", HostName, GetDisplayName(), EAgentState::ToString(State),
			EAgentState::ToString(NewState));
	}
	State = NewState;
	StateChanged.notify_all();
}

void NAgentConnection::Report(EDiagnosticKind::Type Kind, std::string Message)
{
	NDiagnostic Diagnostic{ .Kind = Kind, .Host = GetHostName(), .Message = std::move(Message) };
	if (Diagnostic.Host.empty())
	{
		Diagnostic.Host = GetDisplayName();
	}
	OnDiagnostic(Diagnostic);
}

void NAgentConnection::HandleData(NBuffer& Buf)
{
	auto const Type = ReadMessageTypeFromBuffer(Buf);
	if (Type == MT_Invalid)
	{
		Fail("invalid message type");
		return;
	}

	bool bIsRegistered{};
	{
		std::lock_guard Lock(Mutex);
		bIsRegistered = bRegistered;
	}

	if (!bIsRegistered && Type != MT_Register)
	{
		Fail(fmt::format("message {} before registration", static_cast<int>(Type)));
		return;
	}

	switch (Type)
	{
		case MT_Register:
			if (bIsRegistered)
			{
				Fail("duplicate registration");
				return;
			}
			HandleRegister(Buf);
			break;
		case MT_CaptureSnapshot:
			HandleSnapshot(Buf);
			break;
		case MT_Exit:
		{
			NExitMessage Exit{};
			if (DecodeMessage(Buf, Exit))
			{
				spdlog::info("Agent {} is leaving: {}", GetHostName(), Exit.Reason);
			}
			Socket->Close();
			break;
		}
		default:
			Fail(fmt::format("unexpected message {} from agent", static_cast<int>(Type)));
			break;
	}
}

void NAgentConnection::HandleRegister(NBuffer const& Buf)
{
	NRegisterMessage Register{};
	if (!DecodeMessage(Buf, Register))
	{
		Fail("undecodable register message");
		return;
	}
	if (Register.ProtocolVersion != NETZKARTE_PROTOCOL_VERSION)
	{
		Fail(fmt::format(
			"agent speaks protocol version {}, expected {}", Register.ProtocolVersion, NETZKARTE_PROTOCOL_VERSION));
		return;
	}
	if (Register.HostName.empty())
	{
		Fail("agent registered without a host name");
		return;
	}

	if (!Registry.Add(Register.HostName, shared_from_this()))
	{
		spdlog::warn("Refusing second agent for {} from {}", Register.HostName, GetDisplayName());
		Close(fmt::format("an agent for {} is already connected", Register.HostName));
		return;
	}

	NHostInventory Partial{ .Name = Register.HostName, .PrettyName = Register.PrettyName };
	for (auto const& Address : Register.Addresses)
	{
		Partial.AddInterface(Address);
	}
	NDiagnostics Diagnostics{};
	Store.PutPartial(Register.HostName, Partial, &Diagnostics);
	LogDiagnostics(Diagnostics);

	std::lock_guard Lock(Mutex);
	HostName = Register.HostName;
	PrettyName = Register.PrettyName;
	bRegistered = true;
	if (State == EAgentState::Connected)
	{
		SetState(EAgentState::Idle);
	}
}

void NAgentConnection::HandleSnapshot(NBuffer const& Buf)
{
	NCaptureSnapshot Snapshot{};
	if (!DecodeMessage(Buf, Snapshot))
	{
		Fail("undecodable capture snapshot");
		return;
	}

	NHostName         Name{};
	EAgentState::Type Current{};
	{
		std::lock_guard Lock(Mutex);
		Name = HostName;
		Current = State;
		if (Current == EAgentState::Recording)
		{
			RequestTime = NTime::GetSteadyMs();
		}
	}
	if (!Snapshot.Inventory.Name.empty() && Snapshot.Inventory.Name != Name)
	{
		spdlog::warn("Agent {} sent a snapshot for {}, storing it as {}", Name, Snapshot.Inventory.Name, Name);
	}

	if (Current != EAgentState::Capturing && Current != EAgentState::Recording
		&& Current != EAgentState::StoppingRecording)
	{
		// Late answer to a request that already timed out
		spdlog::debug("Dropping snapshot from {} in state {}", Name, EAgentState::ToString(Current));
		return;
	}

	// Store slots may call back into the server, the state lock is not held here
	Store.AddSnapshot(Name, Snapshot);

	bool const bDone = Current == EAgentState::Capturing || (Current == EAgentState::StoppingRecording && Snapshot.bFinal);
	std::lock_guard Lock(Mutex);
	if (bDone && State == Current)
	{
		SetState(EAgentState::Idle);
	}
}

void NAgentConnection::HandleClosed()
{
	EAgentState::Type PreviousState{};
	NHostName         Name{};
	{
		std::lock_guard Lock(Mutex);
		PreviousState = State;
		Name = HostName;
	}

	if (!Name.empty())
	{
		Registry.Remove(Name, this);
	}

	if (PreviousState == EAgentState::Recording || PreviousState == EAgentState::StoppingRecording)
	{
		// Snapshots already received stay in the store
		Store.EndRecording(Name);
		Report(EDiagnosticKind::AgentDisconnected, "disconnected while recording, keeping the snapshots received so far");
	}
	else if (PreviousState == EAgentState::Capturing)
	{
		Report(EDiagnosticKind::AgentDisconnected, "disconnected during a capture");
	}
	else
	{
		spdlog::info("Agent {} disconnected", Name.empty() ? GetDisplayName() : Name);
	}

	std::lock_guard Lock(Mutex);
	SetState(EAgentState::Disconnected);
}

void NAgentConnection::Fail(std::string const& Message)
{
	Report(EDiagnosticKind::ProtocolDecodeError, Message);
	Close(Message);
}

void NAgentConnection::Close(std::string const& Reason)
{
	if (Socket->IsConnected())
	{
		SendMessage(MT_Exit, NExitMessage{ .Reason = Reason });
	}
	// The socket thread notices and emits OnClosed
	Socket->Close();
}

bool NAgentConnection::RequestCapture()
{
	std::lock_guard Lock(Mutex);
	if (State != EAgentState::Idle)
	{
		spdlog::warn("Can't capture {}, agent is {}", HostName, EAgentState::ToString(State));
		return false;
	}
	if (!SendMessage(MT_CaptureRequest, NCaptureRequest{ .Mode = ECaptureMode::Single }))
	{
		return false;
	}
	RequestTime = NTime::GetSteadyMs();
	SetState(EAgentState::Capturing);
	return true;
}

bool NAgentConnection::RequestStartRecording(uint32_t IntervalSeconds)
{
	std::lock_guard Lock(Mutex);
	if (State != EAgentState::Idle)
	{
		spdlog::warn("Can't record {}, agent is {}", HostName, EAgentState::ToString(State));
		return false;
	}
	if (!SendMessage(MT_CaptureRequest, NCaptureRequest{ .Mode = ECaptureMode::StartRecord, .IntervalSeconds = IntervalSeconds }))
	{
		return false;
	}
	RecordingIntervalMs = static_cast<NMsec>(IntervalSeconds) * 1000;
	RequestTime = NTime::GetSteadyMs();
	SetState(EAgentState::Recording);
	return true;
}

bool NAgentConnection::RequestStopRecording()
{
	std::lock_guard Lock(Mutex);
	if (State != EAgentState::Recording)
	{
		spdlog::warn("{} is not recording, agent is {}", HostName, EAgentState::ToString(State));
		return false;
	}
	if (!SendMessage(MT_CaptureRequest, NCaptureRequest{ .Mode = ECaptureMode::StopRecord }))
	{
		return false;
	}
	RequestTime = NTime::GetSteadyMs();
	SetState(EAgentState::StoppingRecording);
	return true;
}

bool NAgentConnection::WaitForIdle(NMsec TimeoutMs)
{
	std::unique_lock Lock(Mutex);
	StateChanged.wait_for(Lock, std::chrono::milliseconds(TimeoutMs), [this] {
		return State == EAgentState::Idle || State == EAgentState::Disconnected;
	});
	return State == EAgentState::Idle;
}

bool NAgentConnection::CheckTimeout(NMsec TimeoutMs)
{
	std::string Message{};
	NHostName   Name{};
	bool        bRecordingExpired{};
	{
		std::lock_guard Lock(Mutex);
		NMsec           Limit = TimeoutMs;
		if (State == EAgentState::Recording)
		{
			Limit += RecordingIntervalMs;
		}
		else if (State != EAgentState::Capturing && State != EAgentState::StoppingRecording)
		{
			return false;
		}
		NMsec const Elapsed = NTime::GetSteadyMs() - RequestTime;
		if (Elapsed < Limit)
		{
			return false;
		}
		Message = fmt::format("no snapshot after {}ms while {}", Elapsed, EAgentState::ToString(State));
		Name = HostName;
		bRecordingExpired = State == EAgentState::Recording;
		if (bRecordingExpired)
		{
			// Best effort, the agent may be gone already
			SendMessage(MT_CaptureRequest, NCaptureRequest{ .Mode = ECaptureMode::StopRecord });
		}
		SetState(EAgentState::Idle);
	}
	if (bRecordingExpired)
	{
		// Snapshots received so far stay in the store
		Store.EndRecording(Name);
	}
	Report(EDiagnosticKind::AgentTimeout, Message);
	return true;
}
