#include <optional>
#include <ranges>
#include <span>
#include <string>
#include <string_view>
#include <vector>

#include <fmt/format.h>

#include <nrp/config.hpp>
#include <nrp/errors.hpp>
#include <nrp/manifest/compiler.hpp>
#include <nrp/util/log.hpp>

#include <nrp/version.hpp>

enum ExitCode : int
{
    Success = 0,
    UsageError = 1,
    LoadFailure = 2,
    MergeConflict = 3,
    WriteFailure = 4,
};

struct CommandLineOptions
{
    bool m_HelpDisplayed{ false };
    bool m_Valid{ true };

    std::vector<std::string> m_Positional{};
    std::optional<fs::path> m_LocalManifest{ std::nullopt };
    std::optional<fs::path> m_LocalOutput{ std::nullopt };
};

constexpr const char c_HelpStr[]{
    R"(
prepare <source_dataset_dir> <override_manifest.toml> <output_manifest> [options]

Compiles the card manifest from the printings dataset and the override file.

    --help                  Display this information.
    --version               Display the program and manifest format version.
    --verbose               Print debug messages.
    --local-manifest <path> Use this local override file instead of looking
                            for <override_manifest>.local.toml.
    --local-output <path>   Write the local overlay here instead of the
                            configured overlay path.
)"
};

CommandLineOptions ParseCommandLine(int argc, char** raw_argv)
{
    using namespace std::string_view_literals;

    std::span argv{ raw_argv, static_cast<size_t>(argc) };

    CommandLineOptions cli;

    if (std::ranges::contains(argv, "--help"sv))
    {
        fmt::print("{}", c_HelpStr);
        cli.m_HelpDisplayed = true;
        return cli;
    }

    if (std::ranges::contains(argv, "--version"sv))
    {
        fmt::print("prepare {} (manifest format {})\n", NrpVersion(), ManifestFormatVersion());
        cli.m_HelpDisplayed = true;
        return cli;
    }

    const auto next_param{
        [&](size_t& i, std::string_view arg) -> std::optional<std::string_view>
        {
            if (i + 1 >= argv.size())
            {
                LogError("Missing value for command line option {}", arg);
                cli.m_Valid = false;
                return std::nullopt;
            }
            ++i;
            return std::string_view{ argv[i] };
        }
    };

    for (size_t i = 1; i < argv.size(); i++)
    {
        const std::string_view arg{ argv[i] };
        if (arg == "--verbose")
        {
            // Already applied to the log flags
        }
        else if (arg == "--local-manifest")
        {
            if (const auto param{ next_param(i, arg) })
            {
                cli.m_LocalManifest = fs::path{ param.value() };
            }
        }
        else if (arg == "--local-output")
        {
            if (const auto param{ next_param(i, arg) })
            {
                cli.m_LocalOutput = fs::path{ param.value() };
            }
        }
        else if (arg.starts_with("--"))
        {
            LogError("Unknown command line option {}", arg);
            cli.m_Valid = false;
        }
        else
        {
            cli.m_Positional.emplace_back(arg);
        }
    }

    if (cli.m_Positional.size() != 3)
    {
        LogError("Expected 3 arguments but got {}, see --help", cli.m_Positional.size());
        cli.m_Valid = false;
    }

    return cli;
}

int main(int argc, char** argv)
{
    Log::RegisterThreadName("MainThread");

    g_Cfg = LoadConfig();

    LogFlags log_flags{
        LogFlags::Console |
        LogFlags::DetailFile |
        LogFlags::DetailLine |
        LogFlags::DetailThread |
        LogFlags::DetailStacktrace
    };
    if (g_Cfg.m_LogToFile)
    {
        log_flags |= LogFlags::File;
    }

    // Verbosity has to be known before the log is created
    const bool verbose{
        std::ranges::contains(std::span{ argv, static_cast<size_t>(argc) },
                              std::string_view{ "--verbose" })
    };
    if (verbose)
    {
        log_flags |= LogFlags::Verbose;
    }
    Log main_log{ log_flags, Log::c_MainLogName };

    const CommandLineOptions cli{ ParseCommandLine(argc, argv) };
    if (cli.m_HelpDisplayed)
    {
        return ExitCode::Success;
    }
    if (!cli.m_Valid)
    {
        return ExitCode::UsageError;
    }

    const CompileOptions options{
        .m_DatasetDir{ cli.m_Positional[0] },
        .m_OverridePath{ cli.m_Positional[1] },
        .m_OutputPath{ cli.m_Positional[2] },
        .m_LocalOverridePath{ cli.m_LocalManifest },
        .m_LocalOutputPath{ cli.m_LocalOutput },
    };

    try
    {
        const CompileResult result{ CompileManifest(options) };

        const Manifest& primary{ result.m_Manifests.m_Primary };
        LogInfo("Wrote {} cards with {} printings and {} inserts to {}",
                primary.m_Cards.size(),
                primary.NumPrintings(),
                primary.m_Inserts.size(),
                result.m_OutputPath.string());
        if (result.m_LocalOutputPath.has_value())
        {
            LogInfo("Wrote local overlay to {}", result.m_LocalOutputPath->string());
        }
    }
    catch (const LoadError& e)
    {
        LogError("{}", e.what());
        return ExitCode::LoadFailure;
    }
    catch (const MergeConflictError& e)
    {
        LogError("{}", e.what());
        return ExitCode::MergeConflict;
    }
    catch (const SerializationError& e)
    {
        LogError("{}", e.what());
        return ExitCode::WriteFailure;
    }

    return ExitCode::Success;
}
