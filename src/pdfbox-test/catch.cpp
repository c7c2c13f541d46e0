#define CATCH_CONFIG_RUNNER
#include <catch2/catch.hpp>

#include <pdfbox/base/system.debug.h>
#include <pdfbox/base/system.h>

int main(int argc, char** argv)
{
    if (pdfbox::get_environment_variable("PDFBOX_DEBUG").value_or("") == "1") pdfbox::Debug::g_debugging = true;

    return Catch::Session().run(argc, argv);
}
