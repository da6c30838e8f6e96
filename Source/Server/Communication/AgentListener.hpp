/*
 * Copyright (c) 2026, Alex <uni@vrsal.cc>
 * SPDX-License-Identifier: BSD-3-Clause
 */

#pragma once
#include <atomic>
#include <memory>
#include <string>
#include <thread>
#include <sigslot/signal.hpp>

#include "Socket.hpp"

// TCP accept loop for agent connections
class NAgentListener
{
	std::unique_ptr<NServerSocket> Socket;

	std::atomic<bool> bRunning{ false };
	std::thread       ListenThread{};

	void ListenThreadFunction();

public:
	// Emitted from the accept thread
	sigslot::signal<std::shared_ptr<NClientSocket> const&> OnNewConnection;

	NAgentListener(std::string const& Address, NPort Port);

	~NAgentListener() { Stop(); }

	bool StartListenThread();

	void Stop();

	// The bound port, differs from the configured one when that was 0
	[[nodiscard]] NPort GetPort() const { return Socket->GetPort(); }
};
