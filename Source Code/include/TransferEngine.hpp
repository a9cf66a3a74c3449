#pragma once

#include <string>

#include "MoverConfig.hpp"
#include "FileScanner.hpp"

class TransferEngine
{
public:
    explicit TransferEngine(const MoverConfig& Config);

    // Processes every configured pair in order. A failing pair is logged and does not stop the others.
    void Run();

    // Moves every qualifying file under Pair.Source into Pair.Target, stopping at the first failure.
    bool ProcessDirectory(const DirectoryPair& Pair, std::string& Error);

    static std::filesystem::path DestinationFor(const std::filesystem::path& SourceFile, const std::string& TargetDir);

private:
    MoverConfig Config;
    FileScanner Scanner;

    bool TransferFile(const ScannedFileInfo& File, const std::string& TargetDir, std::string& Error);
};
