/*
 * BrowserJar - Browser Cookie Extraction Engine
 * Copyright (C) 2026 BrowserJar Project
 *
 * This program is free software: you can redistribute it and/or modify
 * it under the terms of the GNU Affero General Public License as published
 * by the Free Software Foundation, either version 3 of the License, or
 * (at your option) any later version.
 *
 * This program is distributed in the hope that it will be useful,
 * but WITHOUT ANY WARRANTY; without even the implied warranty of
 * MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE. See the
 * GNU Affero General Public License for more details.
 *
 * You should have received a copy of the GNU Affero General Public License
 * along with this program. If not, see <https://www.gnu.org/licenses/>.
 */
/*
 * ============================================================================
 * BrowserJar - PRECOMPILED HEADER
 * ============================================================================
 * Includes: Stable STL and platform SDK headers.
 * ============================================================================
 */

#ifndef PCH_H
#define PCH_H

#pragma once

#ifdef _WIN32
#  ifndef WIN32_LEAN_AND_MEAN
#    define WIN32_LEAN_AND_MEAN
#  endif
#  ifndef NOMINMAX
#    define NOMINMAX
#  endif
#  include <windows.h>
#  include <wincrypt.h>
#endif

// STL - Containers & Utilities
#include <memory>
#include <string>
#include <string_view>
#include <vector>
#include <array>
#include <span>
#include <map>
#include <optional>
#include <functional>
#include <cstdint>
#include <cstring>
#include <algorithm>

// STL - Concurrency & Time
#include <atomic>
#include <mutex>
#include <thread>
#include <future>
#include <chrono>

// STL - Filesystem
#include <filesystem>

#endif // PCH_H
