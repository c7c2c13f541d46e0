#pragma once

namespace fmt
{
    inline namespace v9
    {
        template<typename T, typename Char, typename Enable>
        struct formatter;
    }
}

// Formats Type by converting it to Base, which must already be formattable.
#define PDFBOX_FORMAT_AS(Type, Base)                                                                                   \
    template<typename CharT>                                                                                           \
    struct fmt::formatter<Type, CharT, void> : fmt::formatter<Base, CharT, void>                                       \
    {                                                                                                                  \
        template<typename Context>                                                                                     \
        auto format(const Type& value, Context& ctx) const -> decltype(ctx.out())                                      \
        {                                                                                                              \
            return fmt::formatter<Base, CharT, void>::format(static_cast<Base>(value), ctx);                           \
        }                                                                                                              \
    }

// Formats Type through its `std::string to_string() const` member.
#define PDFBOX_FORMAT_WITH_TO_STRING(Type)                                                                             \
    template<typename CharT>                                                                                           \
    struct fmt::formatter<Type, CharT, void> : fmt::formatter<std::string, CharT, void>                                \
    {                                                                                                                  \
        template<typename Context>                                                                                     \
        auto format(const Type& value, Context& ctx) const -> decltype(ctx.out())                                      \
        {                                                                                                              \
            return fmt::formatter<std::string, CharT, void>::format(value.to_string(), ctx);                           \
        }                                                                                                              \
    }
