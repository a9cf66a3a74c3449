#include <cstdint>
#include <filesystem>
#include <fstream>
#include <limits>
#include <string>

#include <nlohmann/json.hpp>

#include "ConfigParser.hpp"

namespace FS = std::filesystem;

const MoverConfig& ConfigParser::GetConfig() const
{
    return Config;
}

const std::vector<std::string>& ConfigParser::GetErrors() const
{
    return Errors;
}

const std::vector<std::string>& ConfigParser::GetInfos() const
{
    return Infos;
}

void ConfigParser::Reset()
{
    Config = MoverConfig{};
    Errors.clear();
    Infos.clear();
}

void ConfigParser::AddError(const std::string& Message)
{
    Errors.push_back(Message);
}

void ConfigParser::AddInfo(const std::string& Message)
{
    Infos.push_back(Message);
}

MoverConfig ConfigParser::DefaultConfig()
{
    MoverConfig Defaults;
    Defaults.Pairs = {
        { "e:/FilesNota/572149/1", "//192.168.2.15/5/test/1" },
        { "e:/FilesNota/572149/2", "//192.168.2.15/5/test/2" },
    };
    Defaults.MinFileSize = 26463150;
    return Defaults;
}

bool ConfigParser::LoadOrCreate(const std::string& FilePath)
{
    Reset();

    std::error_code ec;
    bool Exists = FS::exists(FilePath, ec);
    if (ec)
    {
        AddError("Failed to check config file " + FilePath + ": " + ec.message());
        return false;
    }

    if (!Exists)
    {
        return WriteDefault(FilePath);
    }
    return Parse(FilePath);
}

bool ConfigParser::WriteDefault(const std::string& FilePath)
{
    MoverConfig Defaults = DefaultConfig();

    // ordered_json keeps source_dirs, target_dirs, min_file_size in this order on disk
    nlohmann::ordered_json Root;
    Root["source_dirs"] = nlohmann::ordered_json::array();
    Root["target_dirs"] = nlohmann::ordered_json::array();
    for (const auto& Pair : Defaults.Pairs)
    {
        Root["source_dirs"].push_back(Pair.Source);
        Root["target_dirs"].push_back(Pair.Target);
    }
    Root["min_file_size"] = Defaults.MinFileSize;

    std::ofstream File(FilePath, std::ios::out | std::ios::trunc);
    if (!File.is_open())
    {
        AddError("Failed to create config file: " + FilePath);
        return false;
    }

    File << Root.dump(2);
    File.close();
    if (File.fail())
    {
        AddError("Failed to write default settings to config file: " + FilePath);
        return false;
    }

    Config = std::move(Defaults);
    AddInfo("Config file not found, default settings written to " + FilePath);
    return true;
}

bool ConfigParser::ReadStringList(const nlohmann::json& Root, const std::string& Key, std::vector<std::string>& Out)
{
    auto It = Root.find(Key);
    if (It == Root.end())
    {
        AddError("Missing key '" + Key + "'.");
        return false;
    }
    if (!It->is_array())
    {
        AddError("Key '" + Key + "' must be an array of paths.");
        return false;
    }

    for (size_t Index = 0; Index < It->size(); ++Index)
    {
        const auto& Value = (*It)[Index];
        if (!Value.is_string())
        {
            AddError("Key '" + Key + "' entry " + std::to_string(Index) + " is not a string.");
            return false;
        }
        Out.push_back(Value.get<std::string>());
    }
    return true;
}

bool ConfigParser::Parse(const std::string& FilePath)
{
    std::ifstream File(FilePath);
    if (!File.is_open())
    {
        AddError("Failed to open config file: " + FilePath);
        return false;
    }

    nlohmann::json Root;
    try
    {
        Root = nlohmann::json::parse(File);
    }
    catch (const nlohmann::json::exception& e)
    {
        AddError("Failed to read config file " + FilePath + ": " + e.what());
        return false;
    }

    if (!Root.is_object())
    {
        AddError("Config file " + FilePath + " must contain a JSON object.");
        return false;
    }

    std::vector<std::string> Sources;
    std::vector<std::string> Targets;
    bool SourcesOk = ReadStringList(Root, "source_dirs", Sources);
    bool TargetsOk = ReadStringList(Root, "target_dirs", Targets);

    auto SizeIt = Root.find("min_file_size");
    if (SizeIt == Root.end())
    {
        AddError("Missing key 'min_file_size'.");
    }
    else if (!SizeIt->is_number_integer())
    {
        AddError("Key 'min_file_size' must be an integer number of bytes.");
    }
    else if (SizeIt->is_number_unsigned() && SizeIt->get<uint64_t>() > static_cast<uint64_t>(std::numeric_limits<int64_t>::max()))
    {
        AddError("Key 'min_file_size' is too large.");
    }
    else if (SizeIt->get<int64_t>() < 0)
    {
        AddError("Key 'min_file_size' must not be negative.");
    }
    else
    {
        Config.MinFileSize = SizeIt->get<int64_t>();
    }

    if (SourcesOk && TargetsOk && Sources.size() != Targets.size())
    {
        AddError("source_dirs has " + std::to_string(Sources.size()) + " entries but target_dirs has " + std::to_string(Targets.size()) + ", every source needs exactly one target.");
    }

    if (!Errors.empty())
    {
        Config = MoverConfig{};
        return false;
    }

    for (size_t Index = 0; Index < Sources.size(); ++Index)
    {
        Config.Pairs.push_back({ Sources[Index], Targets[Index] });
    }

    if (Config.Pairs.empty())
    {
        AddInfo("No source directories configured, nothing to move.");
    }
    return true;
}
