#include <nrp/manifest/compiler.hpp>

#include <vector>

#include <fmt/format.h>

#include <nrp/config.hpp>
#include <nrp/errors.hpp>
#include <nrp/manifest/overrides.hpp>
#include <nrp/manifest/serializer.hpp>
#include <nrp/manifest/source_loader.hpp>
#include <nrp/util/log.hpp>

std::optional<fs::path> ResolveLocalOverridePath(const fs::path& override_path,
                                                 const std::optional<fs::path>& explicit_path)
{
    if (explicit_path.has_value())
    {
        if (!fs::exists(explicit_path.value()))
        {
            throw LoadError{ fmt::format("Local override file {} does not exist", explicit_path->string()) };
        }
        return explicit_path;
    }

    fs::path sibling{ override_path };
    sibling.replace_filename(fmt::format("{}.local.toml", override_path.stem().string()));
    if (fs::exists(sibling))
    {
        LogInfo("Using local override file {}", sibling.string());
        return sibling;
    }
    return std::nullopt;
}

CompileResult CompileManifest(const CompileOptions& options)
{
    const std::optional<fs::path> local_override_path{
        ResolveLocalOverridePath(options.m_OverridePath, options.m_LocalOverridePath),
    };

    const OverrideFile overrides{ ParseOverrideFile(options.m_OverridePath) };
    if (overrides.m_Collections.empty())
    {
        throw LoadError{ fmt::format("{} declares no [[collection]]", options.m_OverridePath.string()) };
    }

    std::optional<OverrideFile> local_overrides;
    if (local_override_path.has_value())
    {
        local_overrides = ParseOverrideFile(local_override_path.value());
    }

    SourceDataset dataset{ LoadSourceDataset(options.m_DatasetDir, overrides.m_Collections) };

    CompileResult result{
        .m_Manifests{
            MergeOverrides(std::move(dataset),
                           overrides,
                           local_overrides.has_value() ? &local_overrides.value() : nullptr),
        },
        .m_OutputPath{ options.m_OutputPath },
        .m_LocalOverridePath{ local_override_path },
        .m_LocalOutputPath{},
    };

    std::vector<ManifestOutput> outputs{
        ManifestOutput{ &result.m_Manifests.m_Primary, options.m_OutputPath },
    };
    if (!result.m_Manifests.m_Overlay.Empty())
    {
        result.m_LocalOutputPath = options.m_LocalOutputPath.value_or(g_Cfg.m_LocalOverlayPath);
        outputs.push_back(ManifestOutput{ &result.m_Manifests.m_Overlay, result.m_LocalOutputPath.value() });
    }

    WriteManifests(outputs);
    return result;
}
