#pragma once

#include <string>
#include <vector>

#include <nlohmann/json_fwd.hpp>

#include "MoverConfig.hpp"

class ConfigParser
{
public:
    ConfigParser() = default;

    // Reads the config at FilePath, or writes the defaults there when the file is missing.
    bool LoadOrCreate(const std::string& FilePath);

    const MoverConfig& GetConfig() const;
    const std::vector<std::string>& GetErrors() const;
    const std::vector<std::string>& GetInfos() const;
    void Reset();

    static MoverConfig DefaultConfig();

private:
    void AddError(const std::string& Message);
    void AddInfo(const std::string& Message);

    bool Parse(const std::string& FilePath);
    bool WriteDefault(const std::string& FilePath);
    bool ReadStringList(const nlohmann::json& Root, const std::string& Key, std::vector<std::string>& Out);

    MoverConfig Config;
    std::vector<std::string> Errors;
    std::vector<std::string> Infos;
};
