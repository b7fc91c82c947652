//===----------------------------------------------------------------------===//
//
// Part of the OpenCyphal project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

//===----------------------------------------------------------------------===//
///
/// @file
/// Implements generator configuration loading and validation.
///
//===----------------------------------------------------------------------===//

#include "gofreeze/Driver/GenerateConfig.h"

#include <algorithm>
#include <fstream>
#include <sstream>
#include <system_error>
#include <vector>

#include "gofreeze/CodeGen/NamingPolicy.h"

namespace gofreeze
{
namespace
{

struct StringSetting final
{
    const char* key;
    std::string GenerateConfig::*field;
};

struct BoolSetting final
{
    const char* key;
    bool GenerateConfig::*field;
};

constexpr StringSetting kStringSettings[] = {
    {"pkg", &GenerateConfig::pkg},
    {"rootDir", &GenerateConfig::rootDir},
    {"importFile", &GenerateConfig::importFile},
    {"outputFile", &GenerateConfig::outputFile},
    {"documentSuffix", &GenerateConfig::documentSuffix},
    {"registerFunc", &GenerateConfig::registerFunc},
    {"variable", &GenerateConfig::variable},
    {"headerComment", &GenerateConfig::headerComment},
    {"pathField", &GenerateConfig::pathField},
};

constexpr BoolSetting kBoolSettings[] = {
    {"sortMapKeys", &GenerateConfig::sortMapKeys},
    {"sizedArrays", &GenerateConfig::sizedArrays},
    {"detectCycles", &GenerateConfig::detectCycles},
    {"dryRun", &GenerateConfig::dryRun},
    {"noOverwrite", &GenerateConfig::noOverwrite},
};

llvm::Error configError(const std::string& message)
{
    return llvm::createStringError(llvm::inconvertibleErrorCode(), "%s", message.c_str());
}

template <typename T>
void overrideIfSet(const std::optional<T>& value, T& out)
{
    if (value)
    {
        out = *value;
    }
}

}  // namespace

llvm::Error applyConfigJson(const llvm::json::Value& json, GenerateConfig& config)
{
    const auto* object = json.getAsObject();
    if (object == nullptr)
    {
        return configError("config must be a JSON object");
    }

    std::vector<std::string> keys;
    for (const auto& entry : *object)
    {
        keys.push_back(llvm::StringRef(entry.first).str());
    }
    std::sort(keys.begin(), keys.end());

    for (const std::string& key : keys)
    {
        const llvm::json::Value& value = *object->get(key);

        const auto* stringSetting = std::find_if(std::begin(kStringSettings),
                                                 std::end(kStringSettings),
                                                 [&](const StringSetting& s) { return key == s.key; });
        if (stringSetting != std::end(kStringSettings))
        {
            const auto text = value.getAsString();
            if (!text)
            {
                return configError("config key '" + key + "' must be a string");
            }
            config.*(stringSetting->field) = text->str();
            continue;
        }

        const auto* boolSetting = std::find_if(std::begin(kBoolSettings),
                                               std::end(kBoolSettings),
                                               [&](const BoolSetting& s) { return key == s.key; });
        if (boolSetting != std::end(kBoolSettings))
        {
            const auto flag = value.getAsBoolean();
            if (!flag)
            {
                return configError("config key '" + key + "' must be a boolean");
            }
            config.*(boolSetting->field) = *flag;
            continue;
        }

        return configError("unknown config key '" + key + "'");
    }
    return llvm::Error::success();
}

llvm::Error applyConfigFile(const std::filesystem::path& path, GenerateConfig& config)
{
    std::ifstream in(path, std::ios::binary);
    if (!in.good())
    {
        return llvm::createStringError(llvm::inconvertibleErrorCode(),
                                       "failed to read config file %s",
                                       path.string().c_str());
    }
    std::ostringstream text;
    text << in.rdbuf();

    auto parsed = llvm::json::parse(text.str());
    if (!parsed)
    {
        return llvm::createStringError(llvm::inconvertibleErrorCode(),
                                       "%s: invalid JSON: %s",
                                       path.string().c_str(),
                                       llvm::toString(parsed.takeError()).c_str());
    }
    if (auto err = applyConfigJson(*parsed, config))
    {
        return llvm::createStringError(llvm::inconvertibleErrorCode(),
                                       "%s: %s",
                                       path.string().c_str(),
                                       llvm::toString(std::move(err)).c_str());
    }
    return llvm::Error::success();
}

llvm::Expected<GenerateConfig> resolveGenerateConfig(const GenerateOverrides& overrides)
{
    GenerateConfig config;

    if (overrides.configFile)
    {
        if (auto err = applyConfigFile(*overrides.configFile, config))
        {
            return std::move(err);
        }
    }
    else
    {
        const std::filesystem::path implicitConfig =
            std::filesystem::path(overrides.rootDir.value_or(config.rootDir)) / kConfigFileName;
        std::error_code ec;
        if (std::filesystem::is_regular_file(implicitConfig, ec))
        {
            if (auto err = applyConfigFile(implicitConfig, config))
            {
                return std::move(err);
            }
        }
    }

    overrideIfSet(overrides.pkg, config.pkg);
    overrideIfSet(overrides.rootDir, config.rootDir);
    overrideIfSet(overrides.importFile, config.importFile);
    overrideIfSet(overrides.outputFile, config.outputFile);
    overrideIfSet(overrides.registerFunc, config.registerFunc);
    overrideIfSet(overrides.variable, config.variable);
    overrideIfSet(overrides.sortMapKeys, config.sortMapKeys);
    overrideIfSet(overrides.sizedArrays, config.sizedArrays);
    overrideIfSet(overrides.detectCycles, config.detectCycles);
    overrideIfSet(overrides.dryRun, config.dryRun);
    overrideIfSet(overrides.noOverwrite, config.noOverwrite);
    overrideIfSet(overrides.verbose, config.verbose);
    return config;
}

llvm::Error validateGenerateConfig(const GenerateConfig& config)
{
    if (config.pkg.empty())
    {
        return configError("missing root package path (--pkg)");
    }
    if (config.outputFile.empty() || config.outputFile.find('/') != std::string::npos)
    {
        return configError("output file must be a plain file name, got '" + config.outputFile + "'");
    }
    if (config.importFile.empty())
    {
        return configError("import file must not be empty");
    }
    if (config.documentSuffix.empty())
    {
        return configError("document suffix must not be empty");
    }
    if (!goIsValidIdentifier(config.variable))
    {
        return configError("variable name is not a Go identifier: '" + config.variable + "'");
    }
    if (!config.pathField.empty() && !goIsValidIdentifier(config.pathField))
    {
        return configError("path field is not a Go identifier: '" + config.pathField + "'");
    }
    return llvm::Error::success();
}

}  // namespace gofreeze
