#pragma once

#include <filesystem>
#include <string>

class FileCopier
{
public:
    // Copies SourcePath to TargetPath and deletes the source afterwards. Never overwrites an
    // existing TargetPath. On failure returns false and describes the cause in Reason.
    static bool RelocateFile(const std::filesystem::path& SourcePath, const std::filesystem::path& TargetPath, std::string& Reason);

private:

#ifndef _WIN32
    static bool CopyFileRangeSupported();
    static bool CopyContents(int SrcFd, int DestFd, std::string& Reason);
    static bool CopyContentsBuffered(int SrcFd, int DestFd, std::string& Reason);
#endif
};
