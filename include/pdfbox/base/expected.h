#pragma once

#include <pdfbox/base/fwd/expected.h>
#include <pdfbox/base/fwd/messages.h>

#include <pdfbox/base/checks.h>
#include <pdfbox/base/lineinfo.h>
#include <pdfbox/base/messages.h>

#include <type_traits>
#include <utility>
#include <variant>

namespace pdfbox
{
    namespace details
    {
        struct ExpectedValueTag
        {
        };

        struct ExpectedErrorTag
        {
        };
    }

    // Error types other than LocalizedString provide an overload of this, found by ADL, to support value_or_exit.
    inline const LocalizedString& expected_error_message(const LocalizedString& error) noexcept { return error; }

    // Either a T or an Error. Both constructors are implicit so that functions can `return value;` or
    // `return error;` directly.
    template<class T, class Error>
    struct ExpectedT
    {
        template<class U,
                 std::enable_if_t<std::is_convertible_v<U, T> && !std::is_same_v<std::decay_t<U>, Error> &&
                                      !std::is_same_v<std::decay_t<U>, ExpectedT>,
                                  int> = 0>
        ExpectedT(U&& value) : m_storage(std::in_place_index<0>, std::forward<U>(value))
        {
        }

        template<class E,
                 std::enable_if_t<std::is_convertible_v<E, Error> && !std::is_convertible_v<E, T> &&
                                      !std::is_same_v<std::decay_t<E>, ExpectedT>,
                                  int> = 0,
                 int = 1>
        ExpectedT(E&& error) : m_storage(std::in_place_index<1>, std::forward<E>(error))
        {
        }

        ExpectedT(const ExpectedT&) = default;
        ExpectedT(ExpectedT&&) = default;
        ExpectedT& operator=(const ExpectedT&) = delete;
        ExpectedT& operator=(ExpectedT&&) = default;

        bool has_value() const noexcept { return m_storage.index() == 0; }
        explicit operator bool() const noexcept { return has_value(); }

        T* get() noexcept { return std::get_if<0>(&m_storage); }
        const T* get() const noexcept { return std::get_if<0>(&m_storage); }

        Error& error() & noexcept { return *error_or_unreachable(); }
        const Error& error() const& noexcept { return *error_or_unreachable(); }
        Error&& error() && noexcept { return std::move(*error_or_unreachable()); }

        T& value_or_exit(const LineInfo& li) &
        {
            exit_if_error(li);
            return *get();
        }

        const T& value_or_exit(const LineInfo& li) const&
        {
            exit_if_error(li);
            return *get();
        }

        T&& value_or_exit(const LineInfo& li) &&
        {
            exit_if_error(li);
            return std::move(*get());
        }

        // Applies f to the value, or passes the error through unchanged.
        template<class F>
        ExpectedT<std::decay_t<std::invoke_result_t<F&, const T&>>, Error> map(F f) const&
        {
            if (auto value = get())
            {
                return {details::ExpectedValueTag{}, f(*value)};
            }

            return {details::ExpectedErrorTag{}, error()};
        }

        template<class F>
        ExpectedT<std::decay_t<std::invoke_result_t<F&, T&&>>, Error> map(F f) &&
        {
            if (auto value = get())
            {
                return {details::ExpectedValueTag{}, f(std::move(*value))};
            }

            return {details::ExpectedErrorTag{}, std::move(*this).error()};
        }

    private:
        template<class, class>
        friend struct ExpectedT;

        template<class U>
        ExpectedT(details::ExpectedValueTag, U&& value) : m_storage(std::in_place_index<0>, std::forward<U>(value))
        {
        }

        template<class E>
        ExpectedT(details::ExpectedErrorTag, E&& error) : m_storage(std::in_place_index<1>, std::forward<E>(error))
        {
        }

        const Error* error_or_unreachable() const noexcept
        {
            auto error = std::get_if<1>(&m_storage);
            if (!error) Checks::unreachable(PDFBOX_LINE_INFO);
            return error;
        }

        Error* error_or_unreachable() noexcept
        {
            auto error = std::get_if<1>(&m_storage);
            if (!error) Checks::unreachable(PDFBOX_LINE_INFO);
            return error;
        }

        void exit_if_error(const LineInfo& li) const
        {
            if (auto error = std::get_if<1>(&m_storage))
            {
                Checks::msg_exit_with_message(li, expected_error_message(*error));
            }
        }

        std::variant<T, Error> m_storage;
    };
}
