#pragma once

#include "process/ICommandRunner.h"
#include <gmock/gmock.h>

namespace TOE {
namespace Test {

/**
 * @brief gmock implementation of ICommandRunner
 */
class MockCommandRunner : public ICommandRunner {
public:
    MOCK_METHOD(CommandResult, run, (const std::string &command), (override));

    static CommandResult ok(const std::string &output = "") {
        return CommandResult{true, 0, output};
    }

    static CommandResult exited(int code, const std::string &output = "") {
        return CommandResult{true, code, output};
    }

    static CommandResult notFound() {
        return CommandResult{true, 127, ""};
    }
};

}  // namespace Test
}  // namespace TOE
