#include "TransferEngine.hpp"
#include "FileCopier.hpp"
#include "Logger.hpp"

#include <filesystem>

TransferEngine::TransferEngine(const MoverConfig& Config)
    : Config(Config)
{
}

// Flattens: only the base name is kept, the source subdirectory structure is not recreated.
std::filesystem::path TransferEngine::DestinationFor(const std::filesystem::path& SourceFile, const std::string& TargetDir)
{
    return std::filesystem::path(TargetDir) / SourceFile.filename();
}

void TransferEngine::Run()
{
    for (const auto& Pair : Config.Pairs)
    {
        Log.Write("Processing source folder: " + Pair.Source);

        std::string Error;
        if (!ProcessDirectory(Pair, Error))
        {
            Log.Error("Error processing folder " + Pair.Source + ": " + Error);
        }
    }
}

bool TransferEngine::ProcessDirectory(const DirectoryPair& Pair, std::string& Error)
{
    bool Ok = Scanner.Walk(Pair.Source, [this, &Pair](const ScannedFileInfo& File, std::string& VisitError)
    {
        return TransferFile(File, Pair.Target, VisitError);
    });

    if (!Ok)
    {
        Error = Scanner.GetLastError();
    }
    return Ok;
}

bool TransferEngine::TransferFile(const ScannedFileInfo& File, const std::string& TargetDir, std::string& Error)
{
    if (File.Size < static_cast<uintmax_t>(Config.MinFileSize))
    {
        return true;
    }

    std::filesystem::path TargetPath = DestinationFor(File.Path, TargetDir);

    std::string Reason;
    if (!FileCopier::RelocateFile(File.Path, TargetPath, Reason))
    {
        Log.Error("Error moving file " + File.Path.string() + " to " + TargetPath.string() + ": " + Reason);
        Error = Reason;
        return false;
    }

    Log.Write("File " + File.Path.string() + " moved to " + TargetPath.string());
    return true;
}
