#include <nrp/util/log_impl.hpp>

#include <algorithm>
#include <cstdlib>
#include <cstring>
#include <filesystem>
#include <map>
#include <sstream>
#include <stdexcept>

#include <QDebug>
#include <QString>

#include <fmt/chrono.h>
#include <fmt/ranges.h>

Log::LogImpl::LogImpl(LogFlags log_flags, std::string_view log_name)
    : m_LogName{ log_name }
    , m_LogFlags{ log_flags }
{
    if (IsSet(m_LogFlags, LogFlags::File))
    {
        CreateLogFile();
    }
}

Log::LogImpl::~LogImpl()
{
    UnregisterInstance();
}

Log* Log::LogImpl::GetInstance(std::string_view log_name)
{
    std::shared_lock read_lock{ g_InstanceListMutex };

    auto it{ g_Instances.find(std::string{ log_name }) };
    if (it != g_Instances.end())
    {
        return it->second->m_ParentLog;
    }
    return nullptr;
}

void Log::LogImpl::RegisterInstance(Log* parent_log)
{
    UnregisterInstance();

    m_ParentLog = parent_log;

    std::unique_lock write_lock{ g_InstanceListMutex };
    if (g_Instances.contains(m_LogName))
    {
        throw std::logic_error{ fmt::format("Log-Name Redefinition: {}", m_LogName) };
    }
    g_Instances[m_LogName] = this;
}

void Log::LogImpl::UnregisterInstance()
{
    m_ParentLog = nullptr;

    std::unique_lock write_lock{ g_InstanceListMutex };
    auto it{ g_Instances.find(m_LogName) };
    if (it != g_Instances.end() && it->second == this)
    {
        g_Instances.erase(it);
    }
}

bool Log::LogImpl::RegisterThreadName(std::string_view thread_name)
{
    std::unique_lock write_lock{ g_ThreadListMutex };

    const std::thread::id thread_id{ std::this_thread::get_id() };
    if (g_ThreadList.contains(thread_id))
    {
        return false;
    }

    g_ThreadList[thread_id] = thread_name;
    return true;
}

std::string_view Log::LogImpl::GetThreadName(const std::thread::id& thread_id)
{
    std::shared_lock read_lock{ g_ThreadListMutex };

    auto it{ g_ThreadList.find(thread_id) };
    if (it != g_ThreadList.end())
    {
        return it->second;
    }

    return "Unregistered";
}

uint32_t Log::LogImpl::InstallHook(Log::LogHook hook)
{
    std::lock_guard lock{ m_Mutex };
    const uint32_t hook_id{ m_NextHookId++ };
    m_LogHooks.push_back({ hook_id, std::move(hook) });
    return hook_id;
}

void Log::LogImpl::UninstallHook(uint32_t hook_id)
{
    std::lock_guard lock{ m_Mutex };
    std::erase_if(m_LogHooks,
                  [hook_id](const InstalledLogHook& hook)
                  { return hook.m_HookId == hook_id; });
}

bool Log::LogImpl::GetLevelEnabled(Log::LogLevel level) const
{
    return level != LogLevel::Debug || IsSet(m_LogFlags, LogFlags::Verbose);
}

bool Log::LogImpl::GetStacktraceEnabled(Log::LogLevel level) const
{
    return (level == LogLevel::Error && IsSet(m_LogFlags, LogFlags::DetailErrorStacktrace)) ||
           (level == LogLevel::Fatal && IsSet(m_LogFlags, LogFlags::DetailFatalStacktrace));
}

void Log::LogImpl::Print(const Log::DetailInformation& detail_info, Log::LogLevel level, std::string_view message)
{
    const std::string full_message{ Format(detail_info, level, message) };

    {
        std::lock_guard lock{ m_Mutex };

        if (IsSet(m_LogFlags, LogFlags::Console))
        {
            qDebug().noquote() << QString::fromStdString(full_message);
        }
        if (m_FileStream.is_open())
        {
            m_FileStream << full_message << '\n'
                         << std::flush;
        }

        for (const InstalledLogHook& hook : m_LogHooks)
        {
            hook.m_Hook(detail_info, level, message);
        }
    }

    if (IsSet(m_LogFlags, LogFlags::FatalQuit) && level == LogLevel::Fatal)
    {
        std::exit(-1);
    }
}

std::string Log::LogImpl::Format(const Log::DetailInformation& detail_info, Log::LogLevel level, std::string_view message) const
{
    std::stringstream stream;

    switch (level)
    {
    case LogLevel::Information:
        stream << " [INFO]";
        break;
    case LogLevel::Debug:
        stream << "[DEBUG]";
        break;
    case LogLevel::Warning:
        stream << " [WARN]";
        break;
    case LogLevel::Error:
        stream << "[ERROR]";
        break;
    case LogLevel::Fatal:
        stream << "[FATAL]";
        break;
    }

    std::vector<std::string> details;
    if (IsSet(m_LogFlags, LogFlags::DetailTime))
    {
        details.push_back(fmt::format("{:%H:%M:%S}", fmt::localtime(detail_info.m_Time)));
    }
    if (IsSet(m_LogFlags, LogFlags::DetailFile))
    {
        std::string_view file{ detail_info.m_File };
        if (file.starts_with(NRP_SOURCE_ROOT))
        {
            file.remove_prefix(std::strlen(NRP_SOURCE_ROOT));
        }
        details.emplace_back(file);
    }
    if (IsSet(m_LogFlags, LogFlags::DetailColumn))
    {
        details.push_back(fmt::format("{}:{}", detail_info.m_Line, detail_info.m_Column));
    }
    else if (IsSet(m_LogFlags, LogFlags::DetailLine))
    {
        details.push_back(fmt::format("{}", detail_info.m_Line));
    }
    if (IsSet(m_LogFlags, LogFlags::DetailFunction))
    {
        details.emplace_back(detail_info.m_Function);
    }
    if (IsSet(m_LogFlags, LogFlags::DetailThread))
    {
        details.emplace_back(detail_info.m_Thread);
    }

    if (!details.empty())
    {
        stream << "<" << fmt::format("{}", fmt::join(details, "; ")) << ">";
    }

    stream << ": " << message;

    if (GetStacktraceEnabled(level))
    {
        if (!detail_info.m_StackTrace.empty())
        {
            stream << "\nStacktrace:";
            for (std::string_view stack_element : detail_info.m_StackTrace)
            {
                stream << "\n"
                       << stack_element;
            }
        }
        else
        {
            stream << "\n[[Stacktrace not available]]";
        }
    }

    return stream.str();
}

void Log::LogImpl::CreateLogFile()
{
    namespace fs = std::filesystem;

    const fs::path logs_directory{ fs::absolute("logs") };
    if (!fs::is_directory(logs_directory))
    {
        if (fs::exists(logs_directory))
        {
            fs::remove_all(logs_directory);
        }
        fs::create_directories(logs_directory);
    }

    std::multimap<fs::file_time_type, fs::path> files_sorted_by_modify_time;
    for (const auto& entry : fs::directory_iterator{ logs_directory })
    {
        if (entry.is_regular_file())
        {
            files_sorted_by_modify_time.insert({ entry.last_write_time(), entry.path() });
        }
    }

    static constexpr std::size_t c_MaxNumLogFiles{ 256 };
    while (files_sorted_by_modify_time.size() >= c_MaxNumLogFiles)
    {
        fs::remove(files_sorted_by_modify_time.begin()->second);
        files_sorted_by_modify_time.erase(files_sorted_by_modify_time.begin());
    }

    const std::string file_name{
        fmt::format("{:%Y-%m-%d_%H-%M-%S}_{}.log", fmt::localtime(std::time(nullptr)), m_LogName),
    };

    std::lock_guard lock{ m_Mutex };
    m_FileStream.open(logs_directory / file_name);
}
