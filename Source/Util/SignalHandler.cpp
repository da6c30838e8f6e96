/*
 * Copyright (c) 2026, Alex <uni@vrsal.cc>
 * SPDX-License-Identifier: BSD-3-Clause
 */

#include "SignalHandler.hpp"

#include <csignal>

static void OnSigint(int)
{
	NSignalHandler::GetInstance().bStop = true;
}

NSignalHandler::NSignalHandler()
{
	signal(SIGINT, OnSigint);
	signal(SIGTERM, OnSigint);
	// A vanished agent must not kill the server on the next send
	signal(SIGPIPE, SIG_IGN);
}
