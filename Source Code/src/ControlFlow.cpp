#include <iostream>
#include <string>

#include "ControlFlow.hpp"
#include "Logger.hpp"
#include "ConfigGlobal.hpp"
#include "TransferEngine.hpp"

// Fatal startup errors are reported but the exit code stays 0, callers only read the logs.
int ControlFlow::Run()
{
    if (!Log.Init(ConfigGlobal::LogDir))
    {
        std::cerr << "Failed to set up the log file in " << ConfigGlobal::LogDir << ", exiting.\n";
        return 0;
    }

    Log.Info("Program started");

    if (!Parser.LoadOrCreate(ConfigGlobal::ConfigFile))
    {
        for (const auto& Error : Parser.GetErrors())
        {
            std::cerr << "Config Error: " << Error << "\n";
            Log.Error("Config: " + Error);
        }
        Log.Error("Failed to load configuration from " + ConfigGlobal::ConfigFile + ", exiting.");
        return 0;
    }

    for (const auto& Info : Parser.GetInfos())
    {
        Log.Info(Info);
    }

    Log.CleanupOldLogs(ConfigGlobal::LogRetentionDays);
    LogPairs();

    TransferEngine Engine(Parser.GetConfig());
    Engine.Run();

    Log.Info("Program finished");
    return 0;
}

void ControlFlow::LogPairs()
{
    const MoverConfig& Config = Parser.GetConfig();

    Log.Info("Minimum file size: " + std::to_string(Config.MinFileSize) + " bytes");
    for (const auto& Pair : Config.Pairs)
    {
        Log.Info("  " + Pair.Source + " -> " + Pair.Target);
    }
}
