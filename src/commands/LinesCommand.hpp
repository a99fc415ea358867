#pragma once
#include "Command.hpp"

class LinesCommand : public Command {
public:
    int run() override;

private:
    friend class CmdTestBase<LinesCommand>;
    static LinesCommand instance; // Static instance to trigger registration
    LinesCommand(bool reg=false);
};
