/*
 * Part of the MacAuth (MA) project.
 *
 * SPDX-FileCopyrightText: 2025 MacAuth contributors
 * SPDX-License-Identifier: Apache-2.0
 *
 * This file is part of MacAuth (MA). See LICENSE for details.
 */

#pragma once
#include <string>

namespace macauth {

// Thread-safe logging (to stdout + optional file).
void set_log_file(const std::string& path);
void log_line(const std::string& line);

} // namespace macauth
