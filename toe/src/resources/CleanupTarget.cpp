// SPDX-License-Identifier: LGPL-2.1-or-later OR LicenseRef-TOE-Commercial
// SPDX-FileCopyrightText: Copyright (c) 2025 newmassrael

#include "resources/CleanupTarget.h"
#include "common/Logger.h"

#include <algorithm>
#include <system_error>

namespace TOE {

const char *toString(CleanupKind kind) {
    switch (kind) {
    case CleanupKind::File:
        return "file";
    case CleanupKind::FileWithWalSiblings:
        return "database";
    case CleanupKind::Directory:
        return "directory";
    }
    return "unknown";
}

std::vector<std::filesystem::path> CleanupTarget::expand() const {
    if (kind == CleanupKind::FileWithWalSiblings) {
        return {path, std::filesystem::path(path.string() + "-wal"), std::filesystem::path(path.string() + "-shm")};
    }
    return {path};
}

std::vector<CleanupTarget> CleanupTarget::entriesOf(const std::filesystem::path &dir) {
    std::vector<CleanupTarget> targets;
    std::error_code ec;
    if (!std::filesystem::is_directory(dir, ec)) {
        return targets;
    }

    for (std::filesystem::directory_iterator it(dir, ec), end; !ec && it != end; it.increment(ec)) {
        std::error_code typeEc;
        if (it->is_directory(typeEc)) {
            targets.push_back(directory(it->path()));
        } else {
            targets.push_back(file(it->path()));
        }
    }
    if (ec) {
        LOG_WARN("Could not list {}: {}", dir.string(), ec.message());
    }

    // directory_iterator order is unspecified
    std::sort(targets.begin(), targets.end(),
              [](const CleanupTarget &a, const CleanupTarget &b) { return a.path < b.path; });
    return targets;
}

}  // namespace TOE
