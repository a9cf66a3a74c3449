#pragma once

#include "ConfigParser.hpp"
#include "ConfigGlobal.hpp"

class ControlFlow
{
public:
    ControlFlow() = default;

    int Run();

private:
    ConfigParser Parser;

    void LogPairs();
};
