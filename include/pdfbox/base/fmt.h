#pragma once

#include <pdfbox/base/fwd/fmt.h>

#include <fmt/format.h>
