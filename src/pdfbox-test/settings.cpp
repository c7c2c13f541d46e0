#include <pdfbox-test/util.h>

#include <pdfbox/base/system.h>

#include <pdfbox/catalog.h>
#include <pdfbox/settings.h>

using namespace pdfbox;

namespace
{
    // Sets an environment variable for the lifetime of this object, then restores it.
    struct ScopedEnvironmentVariable
    {
        ScopedEnvironmentVariable(ZStringView name, Optional<ZStringView> value)
            : m_name(name.to_string()), m_previous(get_environment_variable(name))
        {
            set_environment_variable(name, value);
        }

        ScopedEnvironmentVariable(const ScopedEnvironmentVariable&) = delete;
        ScopedEnvironmentVariable& operator=(const ScopedEnvironmentVariable&) = delete;

        ~ScopedEnvironmentVariable()
        {
            if (auto previous = m_previous.get())
            {
                set_environment_variable(m_name, ZStringView{*previous});
            }
            else
            {
                set_environment_variable(m_name, nullopt);
            }
        }

    private:
        std::string m_name;
        Optional<std::string> m_previous;
    };
}

TEST_CASE ("settings defaults", "[settings]")
{
    const PdfBoxSettings settings;
    CHECK(!settings.jar_path.has_value());
    CHECK(!settings.java_path.has_value());
    CHECK(!settings.cache_dir.has_value());
    CHECK(!settings.pinned_version.has_value());
    CHECK(settings.archive_url == default_archive_url.to_string());
    CHECK(!settings.debug);
}

TEST_CASE ("settings from the environment", "[settings]")
{
    ScopedEnvironmentVariable jar{EnvironmentVariableJar, ZStringView{"/opt/pdfbox-app-3.0.3.jar"}};
    ScopedEnvironmentVariable java{EnvironmentVariableJava, nullopt};
    ScopedEnvironmentVariable cache_dir{EnvironmentVariableCacheDir, ZStringView{""}};
    ScopedEnvironmentVariable archive_url{EnvironmentVariableArchiveUrl, ZStringView{"https://mirror.example/pdfbox/"}};
    ScopedEnvironmentVariable version{EnvironmentVariableVersion, ZStringView{"2.0.27"}};
    ScopedEnvironmentVariable debug{EnvironmentVariableDebug, ZStringView{"1"}};

    const auto settings = PdfBoxSettings::from_environment();
    CHECK(settings.jar_path.value_or("") == "/opt/pdfbox-app-3.0.3.jar");
    CHECK(!settings.java_path.has_value());
    // empty values count as unset
    CHECK(!settings.cache_dir.has_value());
    CHECK(settings.archive_url == "https://mirror.example/pdfbox/");
    CHECK(settings.pinned_version.value_or("") == "2.0.27");
    CHECK(settings.debug);
}
