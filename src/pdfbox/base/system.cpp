#include <pdfbox/base/checks.h>
#include <pdfbox/base/messages.h>
#include <pdfbox/base/system.h>
#include <pdfbox/base/system.debug.h>

#include <stdlib.h>
#include <unistd.h>

namespace pdfbox
{
    std::atomic<bool> Debug::g_debugging(false);

    Optional<std::string> get_environment_variable(ZStringView varname) noexcept
    {
        auto v = getenv(varname.c_str());
        if (!v) return nullopt;
        return std::string(v);
    }

    void set_environment_variable(ZStringView varname, Optional<ZStringView> value) noexcept
    {
        if (auto v = value.get())
        {
            Checks::check_exit(PDFBOX_LINE_INFO, setenv(varname.c_str(), v->c_str(), 1) == 0);
        }
        else
        {
            Checks::check_exit(PDFBOX_LINE_INFO, unsetenv(varname.c_str()) == 0);
        }
    }

    ExpectedL<Path> get_home_dir()
    {
        static constexpr StringLiteral HOMEVAR = "HOME";
        auto maybe_home = get_environment_variable(HOMEVAR);
        if (!maybe_home.has_value() || maybe_home.get()->empty())
        {
            return msg::format(msgUnableToReadEnvironmentVariable, msg::env_var = format_environment_variable(HOMEVAR));
        }

        Path p = std::move(*maybe_home.get());
        if (!p.is_absolute())
        {
            return msg::format(
                msgEnvVarMustBeAbsolutePath, msg::path = p, msg::env_var = format_environment_variable(HOMEVAR));
        }

        return p;
    }

    ExpectedL<Path> get_platform_cache_root()
    {
#if defined(__APPLE__)
        return get_home_dir().map([](Path home) {
            home /= "Library/Caches";
            return home;
        });
#else
        auto maybe_cache_home = get_environment_variable("XDG_CACHE_HOME");
        if (auto p = maybe_cache_home.get())
        {
            if (!p->empty())
            {
                Path cache_home = std::move(*p);
                if (!cache_home.is_absolute())
                {
                    return msg::format(msgEnvVarMustBeAbsolutePath,
                                       msg::path = cache_home,
                                       msg::env_var = format_environment_variable("XDG_CACHE_HOME"));
                }

                return cache_home;
            }
        }

        return get_home_dir().map([](Path home) {
            home /= ".cache";
            return home;
        });
#endif
    }

    long get_process_id() { return ::getpid(); }
}
