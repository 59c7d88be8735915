/*
 * SamAudit - Offline Windows Credential Audit
 * Copyright (C) 2026 SamAudit Developers
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
 * SamAudit - PRECOMPILED HEADER
 * ============================================================================
 * Target: Fast compilation of the core library and CLI.
 * Includes: Stable STL and OpenSSL headers shared by most translation units.
 * ============================================================================
 */

#ifndef PCH_H
#define PCH_H

#pragma once

// C++20 Standard Library - Core & Containers
#include <iostream>
#include <memory>
#include <string>
#include <string_view>
#include <vector>
#include <array>
#include <span>
#include <optional>
#include <variant>
#include <cstdint>
#include <cstring>
#include <algorithm>
#include <iterator>
#include <type_traits>
#include <concepts>
#include <filesystem>
#include <functional>
#include <map>
#include <unordered_map>
#include <sstream>
#include <cstdio>
#include <cwchar>

// C++20 - Concurrency & Time
#include <atomic>
#include <mutex>
#include <thread>
#include <chrono>

// Performance & Memory
#include <limits>
#include <bit>

// OpenSSL (libcrypto)
#include <openssl/evp.h>
#include <openssl/crypto.h>

#endif // PCH_H
