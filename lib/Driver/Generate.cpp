//===----------------------------------------------------------------------===//
//
// Part of the OpenCyphal project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

//===----------------------------------------------------------------------===//
///
/// @file
/// Implements the `generate` pipeline: walk, load, encode, render and write.
///
//===----------------------------------------------------------------------===//

#include "gofreeze/Driver/Generate.h"

#include <filesystem>
#include <utility>

#include "gofreeze/CodeGen/EmitCommon.h"
#include "gofreeze/CodeGen/GoCode.h"
#include "gofreeze/CodeGen/GoFile.h"
#include "gofreeze/CodeGen/NamingPolicy.h"
#include "gofreeze/Frontend/Discovery.h"

namespace gofreeze
{
namespace
{

std::string unitImportPath(const std::string& pkg, const std::string& relativePath)
{
    if (relativePath == ".")
    {
        return pkg;
    }
    return pkg + "/" + relativePath;
}

std::string packageNameFromPath(llvm::StringRef packagePath)
{
    while (packagePath.consume_back("/"))
    {
    }
    const std::size_t slash = packagePath.rfind('/');
    return goSanitizeIdentifier(slash == llvm::StringRef::npos ? packagePath : packagePath.substr(slash + 1));
}

std::string joinDocumentNames(const std::vector<std::filesystem::path>& documents)
{
    std::string out;
    for (const std::filesystem::path& document : documents)
    {
        if (!out.empty())
        {
            out += ", ";
        }
        out += document.filename().string();
    }
    return out;
}

}  // namespace

EncodeOptions encodeOptionsFor(const GenerateConfig& config)
{
    EncodeOptions options;
    options.sizedArrays    = config.sizedArrays;
    options.sortMapEntries = config.sortMapKeys;
    options.detectCycles   = config.detectCycles;
    return options;
}

bool assignUnitPath(ValueDocument& document, const llvm::StringRef fieldName, const llvm::StringRef relativePath)
{
    if (!document.root || fieldName.empty())
    {
        return false;
    }
    RuntimeValue* record = document.root.get();
    if (const auto* pointer = std::get_if<PointerValue>(&record->data))
    {
        record = pointer->pointee.get();
    }
    if (record == nullptr)
    {
        return false;
    }

    FieldValue* field = record->findField(fieldName);
    if (field == nullptr || !field->value || !field->value->type || field->value->type->kind != TypeKind::String)
    {
        return false;
    }
    field->value = makeScalar(field->value->type, ScalarValue(relativePath.str()));
    return true;
}

llvm::Expected<std::string> renderDocumentExpression(const ValueDocument& document, const EncodeOptions& options)
{
    auto encoded = encodeValue(*document.root, options);
    if (!encoded)
    {
        return encoded.takeError();
    }
    GoImportSet imports;
    return renderGoExpr(*encoded, imports);
}

llvm::Expected<GenerateResult> runGenerate(const GenerateConfig& config,
                                           DiagnosticEngine&     diagnostics,
                                           llvm::raw_ostream*    log)
{
    if (auto err = validateGenerateConfig(config))
    {
        return std::move(err);
    }

    GenerateResult  result;
    EmitWritePolicy policy;
    policy.dryRun          = config.dryRun;
    policy.noOverwrite     = config.noOverwrite;
    policy.recordedOutputs = &result.outputFiles;

    const EncodeOptions options = encodeOptionsFor(config);
    auto progress = [&](const std::string& line) {
        if (config.verbose && log != nullptr)
        {
            *log << "[gofreeze] " << line << "\n";
        }
    };

    auto visitUnit = [&](const UnitDirectory& unit) -> llvm::Error {
        ++result.directoriesVisited;
        if (unit.documents.empty())
        {
            return llvm::Error::success();
        }
        if (unit.documents.size() > 1)
        {
            return llvm::createStringError(llvm::inconvertibleErrorCode(),
                                           "found multiple units in the same directory: %s documents [%s]",
                                           unit.directory.string().c_str(),
                                           joinDocumentNames(unit.documents).c_str());
        }

        const std::filesystem::path& documentPath = unit.documents.front();
        auto                         document     = loadValueDocument(documentPath);
        if (!document)
        {
            return document.takeError();
        }

        const std::string importPath = unitImportPath(config.pkg, unit.relativePath);
        if (importPath != config.pkg)
        {
            result.unitImportPaths.push_back(importPath);
        }

        if (!config.pathField.empty() && !assignUnitPath(*document, config.pathField, unit.relativePath))
        {
            diagnostics.warning({documentPath.string(), 0, 0, "root.value"},
                                "top-level value has no string field '" + config.pathField +
                                    "'; unit path not recorded");
        }

        auto encoded = encodeValue(*document->root, options);
        if (!encoded)
        {
            return llvm::createStringError(llvm::inconvertibleErrorCode(),
                                           "failed to encode %s: %s",
                                           documentPath.string().c_str(),
                                           llvm::toString(encoded.takeError()).c_str());
        }

        GoUnitFileSpec spec;
        spec.headerComment = config.headerComment;
        spec.packageName   = document->packageName;
        spec.packagePath   = importPath;
        spec.registerFunc  = config.registerFunc;
        spec.variable      = config.variable;
        auto text          = renderUnitFile(spec, *encoded);
        if (!text)
        {
            return llvm::createStringError(llvm::inconvertibleErrorCode(),
                                           "%s: %s",
                                           documentPath.string().c_str(),
                                           llvm::toString(text.takeError()).c_str());
        }

        const std::filesystem::path outputPath = unit.directory / config.outputFile;
        if (auto err = writeGeneratedFile(outputPath, *text, policy))
        {
            return err;
        }
        ++result.unitsGenerated;
        progress(unit.relativePath + " -> " + outputPath.string());
        return llvm::Error::success();
    };

    if (auto err = walkUnitDirectories(config.rootDir, config.documentSuffix, visitUnit))
    {
        return std::move(err);
    }

    const std::filesystem::path importFilePath = std::filesystem::path(config.rootDir) / config.importFile;
    const std::string           importText =
        renderImportFile(config.headerComment, packageNameFromPath(config.pkg), result.unitImportPaths);
    if (auto err = writeGeneratedFile(importFilePath, importText, policy))
    {
        return std::move(err);
    }
    progress("import file -> " + importFilePath.string());

    if (result.unitsGenerated == 0)
    {
        diagnostics.note({config.rootDir, 0, 0, ""},
                         "no value documents matching '*" + config.documentSuffix + "' were found");
    }
    return result;
}

}  // namespace gofreeze
