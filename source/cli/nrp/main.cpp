#include <atomic>
#include <charconv>
#include <chrono>
#include <csignal>
#include <optional>
#include <ranges>
#include <span>
#include <stop_token>
#include <string>
#include <string_view>
#include <thread>
#include <vector>

#include <fmt/format.h>

#include <magic_enum/magic_enum.hpp>

#include <QCoreApplication>
#include <QThreadPool>
#include <QTimer>

#include <nrp/config.hpp>
#include <nrp/errors.hpp>
#include <nrp/pdf/generate.hpp>
#include <nrp/sheet/layout.hpp>
#include <nrp/units.hpp>
#include <nrp/util/log.hpp>

#include <nrp/version.hpp>

enum ExitCode : int
{
    Success = 0,
    UsageError = 1,
    LoadFailure = 2,
    LayoutFailure = 5,
    Cancelled = 6,
    WriteFailure = 7,
};

struct CommandLineOptions
{
    bool m_HelpDisplayed{ false };
    bool m_Valid{ true };

    std::vector<std::string> m_Positional{};
    std::optional<fs::path> m_LocalOverlay{ std::nullopt };
    std::optional<std::string> m_ImageRoot{ std::nullopt };
};

constexpr const char c_HelpStr[]{
    R"(
proxysheet <manifest> <selection> <output.pdf> [options]

Lays out the selected printings on printable sheets and writes them to a pdf.

    --help                      Display this information.
    --version                   Display the program version.
    --verbose                   Print debug messages.
    --local-overlay <path>      Use this local overlay manifest, otherwise the
                                configured overlay path is used if it exists.
    --page-size <name>          One of the configured page sizes, e.g. A4.
    --card-size <name>          One of the configured card sizes, e.g. Standard.
    --bleed "<n> <unit>"        Bleed around each card, e.g. "2 mm".
    --spacing "<n> <unit>"      Gap between neighbouring cards.
    --columns <n>               Cards per row.
    --rows <n>                  Rows per page.
    --cut-indicator <mode>      Marks, Lines or None.
    --image-root <url>          Base url of the card images.
    --deterministic             Leave the creation date out of the pdf.
)"
};

namespace
{
std::atomic_bool g_Interrupted{ false };

void OnInterrupt(int /*signal*/)
{
    g_Interrupted.store(true);
}

std::optional<uint32_t> ParseCount(std::string_view str)
{
    int32_t value{};
    const auto [ptr, ec]{ std::from_chars(str.data(), str.data() + str.size(), value) };
    if (ec != std::errc{} || ptr != str.data() + str.size() || value < 0)
    {
        return std::nullopt;
    }
    return static_cast<uint32_t>(value);
}
} // namespace

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
        fmt::print("proxysheet {} ({})\n", NrpVersion(), NrpBuildTime());
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

    const auto invalid_param{
        [&](std::string_view arg, std::string_view param)
        {
            LogError("Invalid value {} for command line option {}", param, arg);
            cli.m_Valid = false;
        }
    };

    // Geometry options go straight into the config, it is the source of the geometry profile
    for (size_t i = 1; i < argv.size(); i++)
    {
        const std::string_view arg{ argv[i] };
        if (arg == "--verbose")
        {
            // Already applied to the log flags
        }
        else if (arg == "--deterministic")
        {
            g_Cfg.m_DeterministicPdfOutput = true;
        }
        else if (arg == "--local-overlay")
        {
            if (const auto param{ next_param(i, arg) })
            {
                cli.m_LocalOverlay = fs::path{ param.value() };
            }
        }
        else if (arg == "--image-root")
        {
            if (const auto param{ next_param(i, arg) })
            {
                cli.m_ImageRoot = std::string{ param.value() };
            }
        }
        else if (arg == "--page-size")
        {
            if (const auto param{ next_param(i, arg) })
            {
                g_Cfg.m_DefaultPageSize = std::string{ param.value() };
            }
        }
        else if (arg == "--card-size")
        {
            if (const auto param{ next_param(i, arg) })
            {
                g_Cfg.m_DefaultCardSize = std::string{ param.value() };
            }
        }
        else if (arg == "--bleed")
        {
            if (const auto param{ next_param(i, arg) })
            {
                if (const auto bleed{ ParseLength(param.value()) })
                {
                    g_Cfg.m_BleedEdge = bleed.value();
                }
                else
                {
                    invalid_param(arg, param.value());
                }
            }
        }
        else if (arg == "--spacing")
        {
            if (const auto param{ next_param(i, arg) })
            {
                if (const auto spacing{ ParseLength(param.value()) })
                {
                    g_Cfg.m_Spacing = Size{ spacing.value(), spacing.value() };
                }
                else
                {
                    invalid_param(arg, param.value());
                }
            }
        }
        else if (arg == "--columns" || arg == "--rows")
        {
            if (const auto param{ next_param(i, arg) })
            {
                if (const auto count{ ParseCount(param.value()) })
                {
                    (arg == "--columns" ? g_Cfg.m_Columns : g_Cfg.m_Rows) = count.value();
                }
                else
                {
                    invalid_param(arg, param.value());
                }
            }
        }
        else if (arg == "--cut-indicator")
        {
            if (const auto param{ next_param(i, arg) })
            {
                if (const auto cut_indicator{ magic_enum::enum_cast<CutIndicator>(param.value(), magic_enum::case_insensitive) })
                {
                    g_Cfg.m_CutIndicator = cut_indicator.value();
                }
                else
                {
                    invalid_param(arg, param.value());
                }
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

int RunProxySheet(const CommandLineOptions& cli, std::stop_token stop_token)
{
    Log::RegisterThreadName("SheetThread");

    try
    {
        const ProxySheetOptions options{
            .m_ManifestPath{ cli.m_Positional[0] },
            .m_SelectionPath{ cli.m_Positional[1] },
            .m_OutputPath{ cli.m_Positional[2] },
            .m_LocalOverlayPath{ ResolveLocalOverlayPath(cli.m_LocalOverlay) },
            .m_Profile{ MakeGeometryProfile(g_Cfg) },
            .m_ImageRoot{ cli.m_ImageRoot.value_or(g_Cfg.m_ImageUrlRoot) },
        };

        const SheetReport report{ RenderProxySheets(options, stop_token) };
        if (!report.m_PlaceholderSlots.empty())
        {
            LogWarning("Sheet is complete but {} cards are placeholders", report.m_PlaceholderSlots.size());
        }
    }
    catch (const LoadError& e)
    {
        LogError("{}", e.what());
        return ExitCode::LoadFailure;
    }
    catch (const LayoutError& e)
    {
        LogError("{}", e.what());
        return ExitCode::LayoutFailure;
    }
    catch (const GenerationCancelled& e)
    {
        LogError("{}", e.what());
        return ExitCode::Cancelled;
    }
    catch (const SerializationError& e)
    {
        LogError("{}", e.what());
        return ExitCode::WriteFailure;
    }

    return ExitCode::Success;
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

    QCoreApplication app{ argc, argv };
    QThreadPool::globalInstance()->setMaxThreadCount(static_cast<int>(g_Cfg.m_MaxWorkerThreads));

    std::signal(SIGINT, OnInterrupt);

    int exit_code{ ExitCode::Success };
    std::jthread sheet_thread{
        [&](std::stop_token stop_token)
        {
            exit_code = RunProxySheet(cli, stop_token);
            QMetaObject::invokeMethod(&app, &QCoreApplication::quit, Qt::QueuedConnection);
        }
    };

    QTimer interrupt_poll;
    QObject::connect(&interrupt_poll,
                     &QTimer::timeout,
                     &app,
                     [&]()
                     {
                         if (g_Interrupted.load() && !sheet_thread.get_stop_token().stop_requested())
                         {
                             LogInfo("Interrupted, cancelling...");
                             sheet_thread.request_stop();
                         }
                     });
    interrupt_poll.start(std::chrono::milliseconds{ 50 });

    app.exec();
    sheet_thread.join();

    return exit_code;
}
