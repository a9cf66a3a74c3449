#include "ConfigGlobal.hpp"

namespace ConfigGlobal
{
    std::string ConfigFile;
    std::string LogDir;
    unsigned short int LogRetentionDays;

    void InitializeDefaults()
    {
        ConfigFile = "config.json"; //Relative to the working directory, an absolute path works as well
        LogDir = "logs"; //Same as above
        LogRetentionDays = 5;
    }
}
