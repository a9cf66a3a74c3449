#pragma once

#include <string>

namespace ConfigGlobal
{
    extern std::string ConfigFile;
    extern std::string LogDir;
    extern unsigned short int LogRetentionDays;

    void InitializeDefaults();
}
