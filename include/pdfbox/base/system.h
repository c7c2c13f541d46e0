#pragma once

#include <pdfbox/base/fwd/expected.h>
#include <pdfbox/base/fwd/files.h>
#include <pdfbox/base/fwd/optional.h>
#include <pdfbox/base/fwd/stringview.h>

#include <pdfbox/base/expected.h>
#include <pdfbox/base/optional.h>
#include <pdfbox/base/path.h>

#include <string>

namespace pdfbox
{
    Optional<std::string> get_environment_variable(ZStringView varname) noexcept;
    void set_environment_variable(ZStringView varname, Optional<ZStringView> value) noexcept;

    ExpectedL<Path> get_home_dir();

    // $XDG_CACHE_HOME, else $HOME/.cache; $HOME/Library/Caches on macOS.
    ExpectedL<Path> get_platform_cache_root();

    long get_process_id();
}
