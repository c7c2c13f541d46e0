#include <pdfbox/base/system.h>

#include <pdfbox/catalog.h>
#include <pdfbox/settings.h>

namespace
{
    using namespace pdfbox;

    Optional<std::string> get_nonempty_environment_variable(ZStringView varname)
    {
        auto maybe_value = get_environment_variable(varname);
        if (auto value = maybe_value.get())
        {
            if (!value->empty())
            {
                return std::move(*value);
            }
        }

        return nullopt;
    }
}

namespace pdfbox
{
    PdfBoxSettings::PdfBoxSettings() : archive_url(default_archive_url.to_string()) { }

    PdfBoxSettings PdfBoxSettings::from_environment()
    {
        PdfBoxSettings result;
        result.jar_path = get_nonempty_environment_variable(EnvironmentVariableJar);
        result.java_path = get_nonempty_environment_variable(EnvironmentVariableJava);
        result.cache_dir = get_nonempty_environment_variable(EnvironmentVariableCacheDir);
        auto maybe_archive_url = get_nonempty_environment_variable(EnvironmentVariableArchiveUrl);
        if (auto archive_url = maybe_archive_url.get())
        {
            result.archive_url = std::move(*archive_url);
        }

        result.pinned_version = get_nonempty_environment_variable(EnvironmentVariableVersion);
        result.debug = get_nonempty_environment_variable(EnvironmentVariableDebug).value_or("0") == "1";
        return result;
    }
}
