#pragma once

#include <pdfbox/base/fwd/messages.h>

#include <pdfbox/base/strings.h>

#include <atomic>

namespace pdfbox::Debug
{
    // Set by --debug (or PDFBOX_DEBUG=1 in the tests).
    extern std::atomic<bool> g_debugging;

    template<class... Args>
    void print(const Args&... args)
    {
        if (!g_debugging) return;
        msg::write_unlocalized_text_to_stderr(Color::none, Strings::concat("[DEBUG] ", args...));
    }

    template<class... Args>
    void println(const Args&... args)
    {
        print(args..., '\n');
    }
}
