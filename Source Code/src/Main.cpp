#include "ControlFlow.hpp"
#include "ConfigGlobal.hpp"

int main()
{
    ConfigGlobal::InitializeDefaults();

    ControlFlow Flow;
    return Flow.Run();
}
