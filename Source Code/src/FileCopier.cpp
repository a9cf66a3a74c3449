#include "FileCopier.hpp"
#include "Logger.hpp"
#include <filesystem>
#include <cstdint>

#ifdef _WIN32
#include <Windows.h>

bool FileCopier::RelocateFile(const std::filesystem::path& SourcePath, const std::filesystem::path& TargetPath, std::string& Reason)
{
    HANDLE SrcHandle = CreateFileW(SourcePath.c_str(), GENERIC_READ, FILE_SHARE_READ, nullptr, OPEN_EXISTING, FILE_ATTRIBUTE_NORMAL, nullptr);
    if (SrcHandle == INVALID_HANDLE_VALUE)
    {
        Reason = "failed to open source file (Error: " + std::to_string(GetLastError()) + ")";
        return false;
    }
    CloseHandle(SrcHandle);

    // COPY_FILE_FAIL_IF_EXISTS: an existing destination is a conflict, never overwritten
    BOOL Result = CopyFileExW(SourcePath.c_str(), TargetPath.c_str(), nullptr, nullptr, nullptr, COPY_FILE_FAIL_IF_EXISTS);
    if (!Result)
    {
        DWORD Err = GetLastError();
        if (Err == ERROR_FILE_EXISTS)
        {
            Reason = "target file already exists: " + TargetPath.string();
        }
        else
        {
            Reason = "failed to copy contents (Error: " + std::to_string(Err) + ")";
        }
        return false;
    }

    if (!DeleteFileW(SourcePath.c_str()))
    {
        Reason = "failed to delete source file after copy (Error: " + std::to_string(GetLastError()) + ")";
        return false;
    }
    return true;
}

#else

#include <fcntl.h>
#include <unistd.h>
#include <cerrno>
#include <cstring>
#include <vector>

namespace
{
    constexpr size_t COPY_CHUNK_SIZE = 64ULL * 1024 * 1024; // per copy_file_range call
    constexpr size_t BUFFER_SIZE = 1024 * 1024;

    bool CheckCopyFileRangeSupport()
    {
        int srcFd = open("/dev/null", O_RDONLY);
        int destFd = open("/dev/null", O_WRONLY);
        if (srcFd < 0 || destFd < 0) {
            if (srcFd >= 0) close(srcFd);
            if (destFd >= 0) close(destFd);
            return false;
        }

        ssize_t result = copy_file_range(srcFd, nullptr, destFd, nullptr, 1, 0);
        bool supported = (result >= 0 || errno != ENOSYS);

        close(srcFd);
        close(destFd);
        return supported;
    }
}

bool FileCopier::CopyFileRangeSupported()
{
    static const bool Supported = CheckCopyFileRangeSupport();
    return Supported;
}

bool FileCopier::CopyContentsBuffered(int SrcFd, int DestFd, std::string& Reason)
{
    std::vector<char> Buffer(BUFFER_SIZE);
    for (;;)
    {
        ssize_t Read = read(SrcFd, Buffer.data(), Buffer.size());
        if (Read < 0)
        {
            if (errno == EINTR)
                continue;
            Reason = std::string("read failed: ") + strerror(errno);
            return false;
        }
        if (Read == 0)
        {
            return true;
        }

        ssize_t Offset = 0;
        while (Offset < Read)
        {
            ssize_t Written = write(DestFd, Buffer.data() + Offset, static_cast<size_t>(Read - Offset));
            if (Written < 0)
            {
                if (errno == EINTR)
                    continue;
                Reason = std::string("write failed: ") + strerror(errno);
                return false;
            }
            Offset += Written;
        }
    }
}

bool FileCopier::CopyContents(int SrcFd, int DestFd, std::string& Reason)
{
    if (!CopyFileRangeSupported())
    {
        return CopyContentsBuffered(SrcFd, DestFd, Reason);
    }

    uintmax_t Copied = 0;
    for (;;)
    {
        ssize_t Result = copy_file_range(SrcFd, nullptr, DestFd, nullptr, COPY_CHUNK_SIZE, 0);
        if (Result < 0)
        {
            if (errno == EINTR)
                continue;

            // Filesystems that reject copy_file_range (cross device on older kernels, FUSE, SMB) get the plain loop
            if (Copied == 0 && (errno == EXDEV || errno == EINVAL || errno == ENOSYS || errno == EOPNOTSUPP))
            {
                return CopyContentsBuffered(SrcFd, DestFd, Reason);
            }
            Reason = std::string("copy_file_range failed: ") + strerror(errno);
            return false;
        }
        if (Result == 0)
        {
            return true;
        }
        Copied += static_cast<uintmax_t>(Result);
    }
}

bool FileCopier::RelocateFile(const std::filesystem::path& SourcePath, const std::filesystem::path& TargetPath, std::string& Reason)
{
    int srcFd = open(SourcePath.c_str(), O_RDONLY | O_CLOEXEC);
    if (srcFd < 0)
    {
        Reason = std::string("failed to open source file: ") + strerror(errno);
        return false;
    }

    // O_EXCL makes the existence check and the creation one step
    int destFd = open(TargetPath.c_str(), O_WRONLY | O_CREAT | O_EXCL | O_CLOEXEC, 0644);
    if (destFd < 0)
    {
        int OpenErrno = errno;
        close(srcFd);
        if (OpenErrno == EEXIST)
        {
            Reason = "target file already exists: " + TargetPath.string();
        }
        else
        {
            Reason = std::string("failed to create target file: ") + strerror(OpenErrno);
        }
        return false;
    }

    std::string CopyError;
    bool CopyOk = CopyContents(srcFd, destFd, CopyError);

    close(srcFd);
    if (close(destFd) != 0 && CopyOk)
    {
        CopyOk = false;
        CopyError = std::string("close failed: ") + strerror(errno);
    }

    if (!CopyOk)
    {
        Reason = "failed to copy contents: " + CopyError;

        // The partial target was created by us above, the source stays in place
        if (unlink(TargetPath.c_str()) != 0)
        {
            Reason += " (partial target file left behind: " + std::string(strerror(errno)) + ")";
        }
        else
        {
            Log.Info("Removed partial target file: " + TargetPath.string());
        }
        return false;
    }

    // Both handles are closed at this point, the source goes only after a complete copy
    if (unlink(SourcePath.c_str()) != 0)
    {
        Reason = std::string("failed to delete source file after copy: ") + strerror(errno);
        return false;
    }
    return true;
}

#endif
