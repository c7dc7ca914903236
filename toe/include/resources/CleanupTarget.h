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

#include <filesystem>
#include <string>
#include <vector>

namespace TOE {

enum class CleanupKind {
    File,                 // single file
    FileWithWalSiblings,  // database file plus its -wal and -shm companions
    Directory             // directory tree, removed recursively
};

const char *toString(CleanupKind kind);

/**
 * @brief A path to bring back to "absent" before or after a run
 */
struct CleanupTarget {
    std::filesystem::path path;
    CleanupKind kind = CleanupKind::File;

    static CleanupTarget file(const std::filesystem::path &path) {
        return CleanupTarget{path, CleanupKind::File};
    }

    static CleanupTarget database(const std::filesystem::path &path) {
        return CleanupTarget{path, CleanupKind::FileWithWalSiblings};
    }

    static CleanupTarget directory(const std::filesystem::path &path) {
        return CleanupTarget{path, CleanupKind::Directory};
    }

    /**
     * @brief Concrete filesystem paths this target covers
     */
    std::vector<std::filesystem::path> expand() const;

    /**
     * @brief One target per entry of dir (File or Directory); empty if dir is missing
     */
    static std::vector<CleanupTarget> entriesOf(const std::filesystem::path &dir);
};

}  // namespace TOE
