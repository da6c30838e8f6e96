/*
 * Copyright (c) 2026, Alex <uni@vrsal.cc>
 * SPDX-License-Identifier: BSD-3-Clause
 */

#pragma once
#include <json11.hpp>

using NJson = json11::Json;

// Json consts
#define nJC static constexpr char const*

nJC JSON_KEY_HOSTS = "hosts";
nJC JSON_KEY_EDGES = "edges";
nJC JSON_KEY_DIAGNOSTICS = "diagnostics";
nJC JSON_KEY_NAME = "name";
nJC JSON_KEY_DISPLAY_NAME = "display_name";
nJC JSON_KEY_CLIENT = "client";
nJC JSON_KEY_SERVER = "server";
nJC JSON_KEY_HANDOVER = "handover";
nJC JSON_KEY_HOST = "host";
nJC JSON_KEY_PID = "pid";
nJC JSON_KEY_PROCESS = "process";
nJC JSON_KEY_SOCKET = "socket";
nJC JSON_KEY_LOCAL = "local";
nJC JSON_KEY_FOREIGN = "foreign";
nJC JSON_KEY_PROTOCOL = "protocol";
nJC JSON_KEY_STATE = "state";
nJC JSON_KEY_RULE = "rule";
nJC JSON_KEY_KIND = "kind";
nJC JSON_KEY_FILE = "file";
nJC JSON_KEY_LINE = "line";
nJC JSON_KEY_MESSAGE = "message";
nJC JSON_KEY_INTERFACES = "interfaces";
