#pragma once

#include <cstdint>
#include <filesystem>
#include <functional>
#include <string>
#include <vector>

struct ScannedFileInfo
{
    std::filesystem::path Path;
    uintmax_t Size = 0;
};

class FileScanner
{
public:
    // Returning false stops the walk; the visitor puts the cause into Error.
    using Visitor = std::function<bool(const ScannedFileInfo& File, std::string& Error)>;

    FileScanner() = default;

    bool Walk(const std::string& RootPath, const Visitor& Visit);

    const std::string& GetLastError() const;

private:
    std::string LastError;

    bool VisitFile(const std::filesystem::path& Path, const Visitor& Visit);
    bool PushChildren(const std::filesystem::path& Directory, std::vector<std::filesystem::path>& DirStack);
};
