// SPDX-License-Identifier: Apache-2.0
// SPDX-FileCopyrightText: Copyright 2026 The roast-pid-control Authors

#include "tuning.hpp"

#include <string>

std::string loggingPath;
bool loggingEnabled = false;

bool debugEnabled = false;

bool coreLoggingEnabled = false;
