/*
 * Copyright (c) 2026, Alex <uni@vrsal.cc>
 * SPDX-License-Identifier: BSD-3-Clause
 */

#pragma once
#include <sys/types.h>
#include <cstdint>
#include <chrono>
#include <string>

#define NKiB *1024
#define NMiB *1024 NKiB

using NProcessId = uint32_t; // 0 means unknown
using NPort = uint16_t;
using NMsec = int64_t;
using NHostName = std::string;
