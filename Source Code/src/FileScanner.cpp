#include <algorithm>
#include <filesystem>

#include "FileScanner.hpp"

namespace FS = std::filesystem;

const std::string& FileScanner::GetLastError() const
{
    return LastError;
}

bool FileScanner::Walk(const std::string& RootPath, const Visitor& Visit)
{
    LastError.clear();
    FS::path Root(RootPath);

    std::error_code ec;
    FS::file_status RootStatus = FS::status(Root, ec);
    if (ec || !FS::exists(RootStatus))
    {
        LastError = "Source path is not accessible: " + Root.string() + (ec ? " (" + ec.message() + ")" : std::string());
        return false;
    }

    if (FS::is_regular_file(RootStatus)) // Single file case
    {
        return VisitFile(Root, Visit);
    }
    if (!FS::is_directory(RootStatus))
    {
        LastError = "Source path is neither a directory nor a file: " + Root.string();
        return false;
    }

    // Pre-order, entries of each directory in lexical order
    std::vector<FS::path> DirStack;
    if (!PushChildren(Root, DirStack))
    {
        return false;
    }

    while (!DirStack.empty())
    {
        FS::path Current = DirStack.back();
        DirStack.pop_back();

        FS::file_status Status = FS::symlink_status(Current, ec);
        if (ec)
        {
            LastError = "Failed to access " + Current.string() + ": " + ec.message();
            return false;
        }

        // Links are neither followed nor moved
        if (FS::is_symlink(Status))
        {
            continue;
        }
        if (FS::is_directory(Status))
        {
            if (!PushChildren(Current, DirStack))
            {
                return false;
            }
        }
        else if (FS::is_regular_file(Status))
        {
            if (!VisitFile(Current, Visit))
            {
                return false;
            }
        }
    }
    return true;
}

bool FileScanner::VisitFile(const FS::path& Path, const Visitor& Visit)
{
    std::error_code ec;
    ScannedFileInfo Info;
    Info.Path = Path;
    Info.Size = FS::file_size(Path, ec);
    if (ec)
    {
        LastError = "Failed to get size of " + Path.string() + ": " + ec.message();
        return false;
    }

    std::string VisitError;
    if (!Visit(Info, VisitError))
    {
        LastError = VisitError;
        return false;
    }
    return true;
}

bool FileScanner::PushChildren(const FS::path& Directory, std::vector<FS::path>& DirStack)
{
    std::vector<FS::path> Children;

    std::error_code ec;
    FS::directory_iterator It(Directory, ec);
    for (; !ec && It != FS::directory_iterator(); It.increment(ec))
    {
        Children.push_back(It->path());
    }
    if (ec)
    {
        LastError = "Failed to read directory " + Directory.string() + ": " + ec.message();
        return false;
    }

    std::sort(Children.begin(), Children.end(), [](const FS::path& A, const FS::path& B)
    {
            return A.filename().string() < B.filename().string();
    });

    // Reversed so the lexically first child is popped first
    DirStack.insert(DirStack.end(), Children.rbegin(), Children.rend());
    return true;
}
