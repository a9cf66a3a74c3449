#pragma once

#include <cstdint>
#include <string>
#include <vector>

struct DirectoryPair
{
    std::string Source;
    std::string Target;
};

// Loaded once at startup, read-only afterwards. Pairs keep the order of the config file.
struct MoverConfig
{
    std::vector<DirectoryPair> Pairs;
    int64_t MinFileSize = 0;
};
