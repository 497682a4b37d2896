/**
 * @file debug_info.cpp
 * @brief Cross-platform stack trace printing for syncdesk::debug::print_stack_trace().
 *
 * Everything here runs on the way to std::abort(), so output goes through a fixed stack buffer
 * and every failure is reported as text rather than propagated.
 */
#include "sd_base.hpp"

#if defined(SYNCDESK_PLATFORM_WIN64)

#include <dbghelp.h>
#include <cstring>
#include <memory>
#pragma comment(lib, "dbghelp.lib")

#elif defined(SYNCDESK_IS_POSIX)

#include <cstdlib>
#include <cxxabi.h>   // __cxa_demangle
#include <dlfcn.h>    // dladdr
#include <execinfo.h> // backtrace, backtrace_symbols

#endif

namespace syncdesk::debug
{

namespace
{

#if defined(SYNCDESK_PLATFORM_WIN64)
class DbgHelpInitializer
{
  public:
    DbgHelpInitializer()
    {
        SymSetOptions(SYMOPT_LOAD_LINES | SYMOPT_DEFERRED_LOADS | SYMOPT_UNDNAME);
        // Best effort; a trace without symbols is still useful.
        (void)SymInitialize(GetCurrentProcess(), nullptr, TRUE);
    }

    ~DbgHelpInitializer() { SymCleanup(GetCurrentProcess()); }
};

DbgHelpInitializer g_dbghelp_initializer;
#endif

// Formats into a fixed stack buffer (no allocation); longer output is truncated.
template <typename... Args>
bool safe_format_to_stderr(fmt::format_string<Args...> fmt_str, Args &&...args) noexcept
{
    try
    {
        constexpr std::size_t STACK_BUF_SZ = 2048;
        char stack_buf[STACK_BUF_SZ];
        auto result =
            fmt::format_to_n(stack_buf, STACK_BUF_SZ, fmt_str, std::forward<Args>(args)...);
        const std::size_t have = result.size < STACK_BUF_SZ ? result.size : STACK_BUF_SZ;
        if (have > 0)
        {
            std::fwrite(stack_buf, 1, have, stderr);
        }
        return true;
    }
    catch (const std::exception &)
    {
        return false;
    }
}

} // namespace

void print_stack_trace() noexcept
{
    try
    {
        safe_format_to_stderr("Stack Trace (most recent call first):\n");
#if defined(SYNCDESK_PLATFORM_WIN64)
        constexpr int kMaxFrames = 62;
        void *frames[kMaxFrames] = {nullptr};
        USHORT captured = CaptureStackBackTrace(0, kMaxFrames, frames, nullptr);
        HANDLE process = GetCurrentProcess();

        constexpr size_t kNameBuf = 1024;
        std::unique_ptr<uint8_t[]> symbol_area(
            new (std::nothrow) uint8_t[sizeof(SYMBOL_INFO) + kNameBuf]);
        SYMBOL_INFO *symbol = nullptr;
        if (symbol_area)
        {
            symbol = reinterpret_cast<SYMBOL_INFO *>(symbol_area.get());
            std::memset(symbol, 0, sizeof(SYMBOL_INFO));
            symbol->SizeOfStruct = sizeof(SYMBOL_INFO);
            symbol->MaxNameLen = static_cast<ULONG>(kNameBuf - 1);
        }

        IMAGEHLP_LINE64 line_info;
        std::memset(&line_info, 0, sizeof(line_info));
        line_info.SizeOfStruct = sizeof(line_info);

        for (USHORT i = 0; i < captured; ++i)
        {
            auto addr = reinterpret_cast<uintptr_t>(frames[i]);
            safe_format_to_stderr("  #{:02}  {:#018x}  ", i, static_cast<unsigned long long>(addr));
            DWORD64 displacement = 0;
            if (symbol && SymFromAddr(process, static_cast<DWORD64>(addr), &displacement, symbol))
            {
                safe_format_to_stderr("{} + {:#x}", symbol->Name,
                                      static_cast<unsigned long long>(displacement));
            }
            else
            {
                safe_format_to_stderr("[symbol unknown]");
            }
            DWORD line_displacement = 0;
            if (SymGetLineFromAddr64(process, static_cast<DWORD64>(addr), &line_displacement,
                                     &line_info))
            {
                safe_format_to_stderr(" -- {}:{}",
                                      line_info.FileName ? line_info.FileName : "(unknown)",
                                      line_info.LineNumber);
            }
            safe_format_to_stderr("\n");
        }

#elif defined(SYNCDESK_IS_POSIX)
        constexpr int kMaxFrames = 128;
        void *callstack[kMaxFrames];
        int nframes = backtrace(callstack, kMaxFrames);
        if (nframes <= 0)
        {
            safe_format_to_stderr("  [No stack frames available]\n");
            return;
        }
        char **symbols = backtrace_symbols(callstack, nframes);
        auto free_symbols = basics::make_scope_guard([&]() { std::free(symbols); });

        for (int i = 0; i < nframes; ++i)
        {
            auto addr = reinterpret_cast<uintptr_t>(callstack[i]);
            safe_format_to_stderr("  #{:02}  {:#018x}  ", i, static_cast<unsigned long long>(addr));

            Dl_info dlinfo;
            if (dladdr(callstack[i], &dlinfo) && dlinfo.dli_sname)
            {
                int status = 0;
                char *dem = abi::__cxa_demangle(dlinfo.dli_sname, nullptr, nullptr, &status);
                const char *name = (status == 0 && dem) ? dem : dlinfo.dli_sname;
                auto saddr = reinterpret_cast<uintptr_t>(dlinfo.dli_saddr);
                safe_format_to_stderr("{} + {:#x}", name,
                                      static_cast<unsigned long long>(saddr ? addr - saddr : 0));
                std::free(dem);
            }
            else if (symbols && symbols[i])
            {
                safe_format_to_stderr("{}", symbols[i]);
            }
            else
            {
                safe_format_to_stderr("[unknown]");
            }
            safe_format_to_stderr("\n");
        }
#else
        safe_format_to_stderr("  [Stack trace not available on this platform]\n");
#endif
        std::fflush(stderr);
    }
    catch (const std::exception &e)
    {
        std::fputs("Error: Stack trace generation failed: ", stderr);
        std::fputs(e.what(), stderr);
        std::fputs("\n", stderr);
        std::fflush(stderr);
    }
}

} // namespace syncdesk::debug
