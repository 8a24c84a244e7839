#pragma once

#include <optional>

#include <nrp/manifest/merger.hpp>
#include <nrp/util.hpp>

struct CompileOptions
{
    fs::path m_DatasetDir;
    fs::path m_OverridePath;
    fs::path m_OutputPath;
    std::optional<fs::path> m_LocalOverridePath;
    std::optional<fs::path> m_LocalOutputPath;
};

struct CompileResult
{
    CompiledManifests m_Manifests;
    fs::path m_OutputPath;
    std::optional<fs::path> m_LocalOverridePath;
    std::optional<fs::path> m_LocalOutputPath;
};

/*
        An explicit path wins, otherwise `<stem>.local.toml` next to the override file is used if it exists
*/
std::optional<fs::path> ResolveLocalOverridePath(const fs::path& override_path,
                                                 const std::optional<fs::path>& explicit_path);

/*
        Full prepare pipeline, nothing is written unless every stage succeeded
*/
CompileResult CompileManifest(const CompileOptions& options);
