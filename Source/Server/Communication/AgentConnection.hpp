/*
 * Copyright (c) 2026, Alex <uni@vrsal.cc>
 * SPDX-License-Identifier: BSD-3-Clause
 */

#pragma once
#include <condition_variable>
#include <memory>
#include <mutex>
#include <string>
#include <sigslot/signal.hpp>

#include "Messages.hpp"
#include "Socket.hpp"
#include "Types.hpp"
#include "Data/Diagnostic.hpp"

class NAgentRegistry;
class NInventoryStore;

namespace EAgentState
{
	enum Type : uint8_t
	{
		Connected = 0, // socket accepted, no Register yet
		Idle,
		Capturing,
		Recording,
		StoppingRecording, // StopRecord sent, waiting for the final snapshot
		Disconnected
	};

	inline char const* ToString(Type State)
	{
		switch (State)
		{
			case Connected:
				return "connected";
			case Idle:
				return "idle";
			case Capturing:
				return "capturing";
			case Recording:
				return "recording";
			case StoppingRecording:
				return "stopping";
			case Disconnected:
				return "disconnected";
			default:
				return "unknown";
		}
	}
} // namespace EAgentState

// Server side of one agent connection. All transitions happen either on message arrival
// (socket thread) or on a request from the control side, both under the state mutex.
class NAgentConnection : public std::enable_shared_from_this<NAgentConnection>
{
	std::shared_ptr<NClientSocket> Socket;
	NAgentRegistry&                Registry;
	NInventoryStore&               Store;

	mutable std::mutex      Mutex{};
	std::condition_variable StateChanged{};
	EAgentState::Type       State{ EAgentState::Connected };
	NHostName               HostName{};
	std::string             PrettyName{};
	NMsec                   RequestTime{}; // steady clock, last request or recorded snapshot
	NMsec                   RecordingIntervalMs{};
	bool                    bRegistered{};

	sigslot::scoped_connection DataConnection{};
	sigslot::scoped_connection ClosedConnection{};

	void HandleData(NBuffer& Buf);

	void HandleClosed();

	void HandleRegister(NBuffer const& Buf);

	void HandleSnapshot(NBuffer const& Buf);

	// Protocol violation: reported, then the connection is dropped
	void Fail(std::string const& Message);

	void SetState(EAgentState::Type NewState);

	void Report(EDiagnosticKind::Type Kind, std::string Message);

	template <class T>
	bool SendMessage(EMessageType Type, T const& Data)
	{
		if (Socket->SendFramed(EncodeMessage(Type, Data)) < 0)
		{
			spdlog::warn("Failed to send message {} to agent {}", static_cast<int>(Type), GetDisplayName());
			return false;
		}
		return true;
	}

	[[nodiscard]] std::string GetDisplayName() const;

public:
	sigslot::signal<NDiagnostic const&> OnDiagnostic;

	NAgentConnection(std::shared_ptr<NClientSocket> Socket_, NAgentRegistry& Registry_, NInventoryStore& Store_);

	~NAgentConnection();

	void Start();

	// Sends Exit and drops the connection
	void Close(std::string const& Reason);

	bool RequestCapture();

	bool RequestStartRecording(uint32_t IntervalSeconds);

	bool RequestStopRecording();

	// Blocks until no request is pending. False if it timed out or the agent went away.
	bool WaitForIdle(NMsec TimeoutMs);

	// Gives up on a request older than TimeoutMs, the agent is treated as idle again.
	// A recording expires when no snapshot arrived for one interval plus TimeoutMs.
	bool CheckTimeout(NMsec TimeoutMs);

	[[nodiscard]] EAgentState::Type GetState() const
	{
		std::lock_guard Lock(Mutex);
		return State;
	}

	[[nodiscard]] bool IsActive() const { return GetState() != EAgentState::Disconnected; }

	[[nodiscard]] NHostName GetHostName() const
	{
		std::lock_guard Lock(Mutex);
		return HostName;
	}

	[[nodiscard]] std::string GetPrettyName() const
	{
		std::lock_guard Lock(Mutex);
		return PrettyName;
	}

	[[nodiscard]] std::string const& GetPeerAddress() const { return Socket->GetAddress(); }
};
