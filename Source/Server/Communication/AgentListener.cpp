/*
 * Copyright (c) 2026, Alex <uni@vrsal.cc>
 * SPDX-License-Identifier: BSD-3-Clause
 */

#include "AgentListener.hpp"

#include <spdlog/spdlog.h>

#include "ErrnoUtil.hpp"

NAgentListener::NAgentListener(std::string const& Address, NPort Port)
{
	Socket = std::make_unique<NServerSocket>(Address, Port);
}

void NAgentListener::Stop()
{
	bRunning = false;
	if (ListenThread.joinable())
	{
		ListenThread.join();
	}
	Socket->Close();
}

bool NAgentListener::StartListenThread()
{
	if (!Socket->BindAndListen())
	{
		spdlog::error("Failed to listen on {}:{}: {}", Socket->GetAddress().empty() ? "*" : Socket->GetAddress(),
			Socket->GetPort(), NErrnoUtil::StrError());
		return false;
	}

	spdlog::info("Waiting for agents on port {}", Socket->GetPort());
	bRunning = true;
	ListenThread = std::thread(&NAgentListener::ListenThreadFunction, this);
	return true;
}

void NAgentListener::ListenThreadFunction()
{
	while (bRunning)
	{
		if (auto ClientSocket = Socket->Accept(500))
		{
			spdlog::info("Agent connected from {}", ClientSocket->GetAddress());
			OnNewConnection(ClientSocket);
		}
	}
}
