//===----------------------------------------------------------------------===//
//
// Part of the OpenCyphal project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

//===----------------------------------------------------------------------===//
///
/// @file
/// Generator configuration: defaults, JSON config files and command-line overrides.
///
//===----------------------------------------------------------------------===//
#ifndef GOFREEZE_DRIVER_GENERATE_CONFIG_H
#define GOFREEZE_DRIVER_GENERATE_CONFIG_H

#include <filesystem>
#include <optional>
#include <string>

#include "gofreeze/CodeGen/GoFile.h"
#include "gofreeze/Frontend/Discovery.h"

#include "llvm/Support/Error.h"
#include "llvm/Support/JSON.h"

namespace gofreeze
{

/// @brief File name of the config file picked up from the root directory.
inline constexpr const char* kConfigFileName = "gofreeze.json";

/// @brief Settings of one `generate` run.
struct GenerateConfig final
{
    /// @brief Import path of the root package. Required.
    std::string pkg;

    /// @brief Root of the directory walk.
    std::string rootDir{"."};

    /// @brief Aggregate import file, relative to @ref rootDir.
    std::string importFile{"builtin_gen.go"};

    /// @brief Name of the file written into every unit directory.
    std::string outputFile{"freeze_gen.go"};

    /// @brief File-name suffix of value documents.
    std::string documentSuffix{kDefaultDocumentSuffix};

    /// @brief Registration function called from `init`, as `<import path>.<Name>`; empty disables the stub.
    std::string registerFunc{"github.com/influxdata/flux.RegisterPackage"};

    /// @brief Name of the frozen variable.
    std::string variable{"pkgAST"};

    /// @brief Header comment of every generated file.
    std::string headerComment{kDefaultHeaderComment};

    /// @brief String field of the top-level record that receives the unit's relative path; empty disables it.
    std::string pathField{"Path"};

    bool sortMapKeys{false};
    bool sizedArrays{false};
    bool detectCycles{true};
    bool dryRun{false};
    bool noOverwrite{false};

    /// @brief Prints per-unit progress lines.
    bool verbose{false};
};

/// @brief Values given on the command line; set fields override the config file.
struct GenerateOverrides final
{
    std::optional<std::string> pkg;
    std::optional<std::string> rootDir;
    std::optional<std::string> importFile;
    std::optional<std::string> outputFile;
    std::optional<std::string> registerFunc;
    std::optional<std::string> variable;
    std::optional<std::string> configFile;
    std::optional<bool>        sortMapKeys;
    std::optional<bool>        sizedArrays;
    std::optional<bool>        detectCycles;
    std::optional<bool>        dryRun;
    std::optional<bool>        noOverwrite;
    std::optional<bool>        verbose;
};

/// @brief Applies the keys of a JSON config object.
///
/// @details Recognized keys: `pkg`, `rootDir`, `importFile`, `outputFile`,
/// `documentSuffix`, `registerFunc`, `variable`, `headerComment`, `pathField`
/// (strings) and `sortMapKeys`, `sizedArrays`, `detectCycles`, `dryRun`,
/// `noOverwrite` (booleans). Unknown keys and mistyped values are errors.
///
/// @param[in] json Parsed config document.
/// @param[in,out] config Configuration to update.
/// @return Success or a descriptive error.
llvm::Error applyConfigJson(const llvm::json::Value& json, GenerateConfig& config);

/// @brief Reads a JSON config file and applies it.
/// @param[in] path Config file path.
/// @param[in,out] config Configuration to update.
/// @return Success or a descriptive error.
llvm::Error applyConfigFile(const std::filesystem::path& path, GenerateConfig& config);

/// @brief Builds the effective configuration.
///
/// @details Starts from defaults, applies the explicit config file or, when
/// none is given, `gofreeze.json` in the effective root directory if present,
/// then applies every set override.
///
/// @param[in] overrides Command-line values.
/// @return Effective configuration or a descriptive error.
llvm::Expected<GenerateConfig> resolveGenerateConfig(const GenerateOverrides& overrides);

/// @brief Validates a configuration before a run.
/// @param[in] config Configuration.
/// @return Success or an error naming the first invalid setting.
llvm::Error validateGenerateConfig(const GenerateConfig& config);

}  // namespace gofreeze

#endif  // GOFREEZE_DRIVER_GENERATE_CONFIG_H
