#pragma once
#include "Command.hpp"

class DemoCommand : public Command {
public:
    int run() override;

private:
    friend class CmdTestBase<DemoCommand>;
    static DemoCommand instance; // Static instance to trigger registration
    DemoCommand(bool reg=false);
};
