// SPDX-License-Identifier: LGPL-2.1-or-later OR LicenseRef-TOE-Commercial
// SPDX-FileCopyrightText: Copyright (c) 2025 newmassrael
//
// This file is part of TOE (Test Orchestration Engine).
//
// Dual Licensed:
// 1. LGPL-2.1: Free for unmodified use (see LICENSE-LGPL-2.1.md)
// 2. Commercial: For modifications (contact newmassrael@gmail.com)
//
// Commercial License:
//   Individual: $100 cumulative
//   Enterprise: $500 cumulative
//   Contact: https://github.com/newmassrael

#pragma once

#include <optional>
#include <string>
#include <vector>

namespace TOE {

/**
 * @brief Pure, synchronous classification of service output lines
 *
 * scan() looks for fatal signatures (a crash invalidates the whole run).
 * isImportant()/isHarmless() only decide what is surfaced to the console
 * and to the report; they never affect the run.
 */
class CrashDetector {
public:
    CrashDetector();
    explicit CrashDetector(std::vector<std::string> fatalSignatures);

    /**
     * @return The first fatal signature contained in line, if any
     */
    std::optional<std::string> scan(const std::string &line) const;

    const std::vector<std::string> &signatures() const {
        return fatalSignatures_;
    }

    static const std::vector<std::string> &defaultFatalSignatures();

    /**
     * @brief Auth, database, error and client-library markers worth keeping in the report
     */
    static bool isImportant(const std::string &line);

    /**
     * @brief Tooling noise on stderr that is never echoed
     */
    static bool isHarmless(const std::string &line);

private:
    std::vector<std::string> fatalSignatures_;
};

}  // namespace TOE
