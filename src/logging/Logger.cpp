//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: Logger.cpp
// Purpose: Definitions for Logger static members.
//==========================================================================================================

#include "logging/Logger.h"

std::atomic<Logger::Level> Logger::sLogLevel{Logger::Level::INFO};
std::atomic<bool> Logger::sUseStderr{false};
std::ofstream Logger::sLogFile;
std::mutex Logger::sLogMutex;
