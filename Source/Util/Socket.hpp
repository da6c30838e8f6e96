/*
 * Copyright (c) 2026, Alex <uni@vrsal.cc>
 * SPDX-License-Identifier: BSD-3-Clause
 */

#pragma once

#include <poll.h>
#include <string>
#include <sys/socket.h>
#include <unistd.h>
#include <memory>
#include <mutex>
#include <thread>
#include <utility>
#include <atomic>

#include <sigslot/signal.hpp>

#include "Buffer.hpp"
#include "Types.hpp"

// Frames above this size are treated as a corrupt or hostile stream
static constexpr uint32_t NETZKARTE_MAX_FRAME_LENGTH = 16 NMiB;

class NSocket
{
protected:
	int         SocketFd{ -1 };
	std::string Address{};
	NPort       Port{};

	explicit NSocket(int SocketFd_) : SocketFd(SocketFd_) {}

public:
	NSocket(std::string Address_, NPort Port_) : Address(std::move(Address_)), Port(Port_) {}

	[[nodiscard]] std::string const& GetAddress() const { return Address; }

	[[nodiscard]] NPort GetPort() const { return Port; }
};

enum ESocketState
{
	ES_Initial,
	ES_Opened,
	ES_Connected
};

// Stream socket carrying length prefixed frames. Once StartListenThread() is called
// every complete frame is emitted through OnData, connection loss through OnClosed.
// While the listen thread runs it owns the receive side: Close() from any thread only
// shuts the connection down, the listen thread releases the fd when it notices.
class NClientSocket : public NSocket
{
	std::atomic<ESocketState> State{};

	std::atomic<bool> bListening{ false };
	std::thread       ListenThread{};

	// Guards SocketFd changes, sending and bReaderAlive
	std::mutex FdMutex{};
	bool       bReaderAlive{};
	NBuffer    FrameBuffer{};
	NBuffer    Accum{}; // listen thread only

	void ListenThreadFunction();

	ssize_t SendLocked(NBuffer const& Buf);

	void ReleaseFdLocked();

public:
	sigslot::signal<NBuffer&> OnData;
	sigslot::signal<>         OnClosed;

	// Accepted socket, peer address is taken from the accept() result
	NClientSocket(int SocketFd_, std::string PeerAddress) : NSocket(SocketFd_)
	{
		Address = std::move(PeerAddress);
		State = ES_Connected;
	}

	NClientSocket(std::string const& Address_, NPort Port_) : NSocket(Address_, Port_) {}

	~NClientSocket()
	{
		StopListenThread();
		Close();
	}

	void Close();

	bool Open();

	bool Connect();

	ssize_t Send(NBuffer const& Buf);

	// Prepends the u32 length and sends the whole frame, safe to call from any thread
	ssize_t SendFramed(std::string const& Data);

	// Listen thread only
	bool Receive(NBuffer& Buf, bool* bDataToRead = nullptr);

	void StartListenThread();

	void StopListenThread();

	[[nodiscard]] bool IsConnected() const { return GetState() == ES_Connected; }

	[[nodiscard]] ESocketState GetState() const { return State.load(std::memory_order_acquire); }

	void SetState(ESocketState NewState) { State.store(NewState, std::memory_order_release); }
};

class NServerSocket : public NSocket
{
public:
	NServerSocket(std::string const& Address_, NPort Port_) : NSocket(Address_, Port_) {}

	~NServerSocket() { Close(); }

	void Close()
	{
		if (SocketFd < 0)
		{
			return;
		}

		close(SocketFd);
		SocketFd = -1;
	}

	// Port 0 binds an ephemeral port, GetPort() reports the real one afterwards
	bool BindAndListen();

	std::shared_ptr<NClientSocket> Accept(int TimeoutMs = -1, bool* bTimedOut = nullptr) const;
};
