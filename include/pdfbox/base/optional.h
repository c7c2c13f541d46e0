#pragma once

#include <pdfbox/base/fwd/optional.h>

#include <pdfbox/base/checks.h>
#include <pdfbox/base/lineinfo.h>

#include <optional>
#include <type_traits>
#include <utility>

namespace pdfbox
{
    struct NullOpt
    {
        explicit constexpr NullOpt(int) { }
    };

    inline constexpr NullOpt nullopt{0};

    // A maybe-value whose accessors hand out pointers, so that `if (auto x = opt.get())` is the usual test.
    template<class T>
    struct Optional
    {
        constexpr Optional() noexcept = default;
        constexpr Optional(NullOpt) noexcept { }

        template<class U,
                 std::enable_if_t<!std::is_same_v<std::decay_t<U>, Optional> &&
                                      !std::is_same_v<std::decay_t<U>, NullOpt> && std::is_constructible_v<T, U&&>,
                                  int> = 0>
        constexpr Optional(U&& value) : m_value(std::in_place, std::forward<U>(value))
        {
        }

        constexpr bool has_value() const noexcept { return m_value.has_value(); }
        constexpr explicit operator bool() const noexcept { return m_value.has_value(); }

        T* get() & noexcept { return m_value ? &*m_value : nullptr; }
        const T* get() const& noexcept { return m_value ? &*m_value : nullptr; }
        T* get() && = delete;

        template<class... Args>
        T& emplace(Args&&... args)
        {
            return m_value.emplace(std::forward<Args>(args)...);
        }

        T& value_or_exit(const LineInfo& li) &
        {
            Checks::check_exit(li, has_value(), "Value was null");
            return *m_value;
        }

        const T& value_or_exit(const LineInfo& li) const&
        {
            Checks::check_exit(li, has_value(), "Value was null");
            return *m_value;
        }

        T&& value_or_exit(const LineInfo& li) &&
        {
            Checks::check_exit(li, has_value(), "Value was null");
            return std::move(*m_value);
        }

        template<class U>
        T value_or(U&& fallback) const&
        {
            return m_value.value_or(std::forward<U>(fallback));
        }

        template<class U>
        T value_or(U&& fallback) &&
        {
            return std::move(m_value).value_or(std::forward<U>(fallback));
        }

        friend bool operator==(const Optional& lhs, const Optional& rhs) { return lhs.m_value == rhs.m_value; }
        friend bool operator!=(const Optional& lhs, const Optional& rhs) { return !(lhs == rhs); }

    private:
        std::optional<T> m_value;
    };
}
