// src/commands/command_executor.hpp
#pragma once

#include "commands/action_result.hpp"
#include "commands/command.hpp"

namespace commands {

class CommandExecutor {
public:
    virtual ~CommandExecutor() = default;

    virtual ActionResult execute(const Command& cmd) = 0;
};

} // namespace commands
