// SPDX-License-Identifier: LGPL-2.1-or-later OR LicenseRef-TOE-Commercial
// SPDX-FileCopyrightText: Copyright (c) 2025 newmassrael

#include "process/ICommandRunner.h"
#include "common/Logger.h"

#include <array>
#include <cstdio>
#include <sys/wait.h>

namespace TOE {

CommandResult ShellCommandRunner::run(const std::string &command) {
    CommandResult result;

    std::string cmd = command + " 2>/dev/null";
    FILE *fp = popen(cmd.c_str(), "r");
    if (!fp) {
        LOG_DEBUG("ShellCommandRunner: popen failed for '{}'", command);
        return result;
    }
    result.launched = true;

    std::array<char, 4096> buffer{};
    size_t n = 0;
    while ((n = fread(buffer.data(), 1, buffer.size(), fp)) > 0) {
        result.output.append(buffer.data(), n);
    }

    int status = pclose(fp);
    if (status == -1) {
        result.exitCode = -1;
    } else if (WIFEXITED(status)) {
        result.exitCode = WEXITSTATUS(status);
    } else {
        result.exitCode = 128 + (WIFSIGNALED(status) ? WTERMSIG(status) : 0);
    }

    LOG_TRACE("ShellCommandRunner: '{}' exited {} ({} bytes)", command, result.exitCode, result.output.size());
    return result;
}

}  // namespace TOE
