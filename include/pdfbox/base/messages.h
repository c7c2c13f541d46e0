#pragma once

#include <pdfbox/base/fwd/messages.h>

#include <pdfbox/base/fmt.h>
#include <pdfbox/base/stringview.h>

#include <fmt/args.h>

#include <stddef.h>

#include <string>
#include <utility>

// Every function that takes a message template with its arguments is declared with these three macros, so that
// the argument list is checked against the tags the message was declared with.
#define PDFBOX_DECL_MSG_TEMPLATE class... MessageTags
#define PDFBOX_DECL_MSG_ARGS                                                                                           \
    ::pdfbox::msg::MessageT<MessageTags...> message_template, ::pdfbox::msg::Arg<MessageTags>... message_args
#define PDFBOX_EXPAND_MSG_ARGS message_template, message_args...

namespace pdfbox::msg
{
    // Identifies one entry of the message table; Tags are the named arguments its text refers to.
    template<class... Tags>
    struct MessageT
    {
        size_t index;
    };

    // The value of one named argument, already rendered to text.
    template<class Tag>
    struct Arg
    {
        std::string text;
    };

    namespace detail
    {
        template<class... Tags>
        MessageT<Tags...> make_message_base(Tags...);

        std::string format_message(size_t index, fmt::format_args args);
    }

    template<PDFBOX_DECL_MSG_TEMPLATE>
    LocalizedString format(PDFBOX_DECL_MSG_ARGS);
}

namespace pdfbox
{
    // Text meant for the user. Only the message table and from_raw produce one.
    struct LocalizedString
    {
        LocalizedString() = default;

        static LocalizedString from_raw(std::string&& text) noexcept;
        static LocalizedString from_raw(StringView text);

        operator StringView() const noexcept { return m_text; }
        const std::string& data() const noexcept { return m_text; }
        const std::string& to_string() const noexcept { return m_text; }
        bool empty() const noexcept { return m_text.empty(); }
        void clear() noexcept { m_text.clear(); }

        LocalizedString& append_raw(char ch) &;
        LocalizedString&& append_raw(char ch) && { return std::move(append_raw(ch)); }
        LocalizedString& append_raw(StringView text) &;
        LocalizedString&& append_raw(StringView text) && { return std::move(append_raw(text)); }

        LocalizedString& append(const LocalizedString& other) &;
        LocalizedString&& append(const LocalizedString& other) && { return std::move(append(other)); }

        template<PDFBOX_DECL_MSG_TEMPLATE>
        LocalizedString& append(PDFBOX_DECL_MSG_ARGS) &
        {
            return append(msg::format(PDFBOX_EXPAND_MSG_ARGS));
        }

        template<PDFBOX_DECL_MSG_TEMPLATE>
        LocalizedString&& append(PDFBOX_DECL_MSG_ARGS) &&
        {
            return std::move(append(msg::format(PDFBOX_EXPAND_MSG_ARGS)));
        }

        // Two spaces per level.
        LocalizedString& append_indent(size_t levels = 1) &;
        LocalizedString&& append_indent(size_t levels = 1) && { return std::move(append_indent(levels)); }

        friend bool operator==(const LocalizedString& lhs, const LocalizedString& rhs) noexcept
        {
            return lhs.m_text == rhs.m_text;
        }

        friend bool operator!=(const LocalizedString& lhs, const LocalizedString& rhs) noexcept
        {
            return lhs.m_text != rhs.m_text;
        }

    private:
        explicit LocalizedString(std::string&& text) noexcept : m_text(std::move(text)) { }

        std::string m_text;
    };

    // "$NAME", the way the shell spells a reference to an environment variable.
    LocalizedString format_environment_variable(StringView variable_name);

    // <origin>: <prefix><content>
    inline constexpr StringLiteral ErrorPrefix = "error: ";
    inline constexpr StringLiteral InternalErrorPrefix = "internal error: ";
    inline constexpr StringLiteral WarningPrefix = "warning: ";

    LocalizedString error_prefix();
    LocalizedString warning_prefix();
}

PDFBOX_FORMAT_AS(pdfbox::LocalizedString, pdfbox::StringView);

namespace pdfbox::msg
{
    template<class T>
    std::string render_arg(const T& value)
    {
        return fmt::format("{}", value);
    }

    template<class... Tags>
    LocalizedString format(MessageT<Tags...> message_template, Arg<Tags>... message_args)
    {
        fmt::dynamic_format_arg_store<fmt::format_context> store;
        (store.push_back(fmt::arg(Tags::name.c_str(), message_args.text)), ...);
        return LocalizedString::from_raw(detail::format_message(message_template.index, store));
    }

    [[nodiscard]] LocalizedString format_error(const LocalizedString& s);
    template<PDFBOX_DECL_MSG_TEMPLATE>
    [[nodiscard]] LocalizedString format_error(PDFBOX_DECL_MSG_ARGS)
    {
        return format_error(msg::format(PDFBOX_EXPAND_MSG_ARGS));
    }

    [[nodiscard]] LocalizedString format_warning(const LocalizedString& s);
    template<PDFBOX_DECL_MSG_TEMPLATE>
    [[nodiscard]] LocalizedString format_warning(PDFBOX_DECL_MSG_ARGS)
    {
        return format_warning(msg::format(PDFBOX_EXPAND_MSG_ARGS));
    }

    // Writes s and a newline to stdout.
    void println(const LocalizedString& s);
    template<PDFBOX_DECL_MSG_TEMPLATE>
    void println(PDFBOX_DECL_MSG_ARGS)
    {
        println(msg::format(PDFBOX_EXPAND_MSG_ARGS));
    }

    // Writes "warning: " and s to stderr.
    void println_warning(const LocalizedString& s);

#define DECLARE_MSG_ARG(NAME, EXAMPLE)                                                                                 \
    inline constexpr struct NAME##_t                                                                                   \
    {                                                                                                                  \
        static constexpr StringLiteral name = #NAME;                                                                   \
        template<class T>                                                                                              \
        Arg<NAME##_t> operator=(const T& value) const                                                                  \
        {                                                                                                              \
            return Arg<NAME##_t>{render_arg(value)};                                                                   \
        }                                                                                                              \
    } NAME = {};
#include <pdfbox/base/message-args.inc.h>
#undef DECLARE_MSG_ARG
}

namespace pdfbox
{
#define DECLARE_MESSAGE(NAME, ARGS, COMMENT, ...)                                                                      \
    extern const decltype(::pdfbox::msg::detail::make_message_base ARGS) msg##NAME;
#include <pdfbox/base/message-data.inc.h>
#undef DECLARE_MESSAGE
}
