#pragma once

#include "vmk/status.h"

#include "vmk/std/static_string.hpp"

#include <algorithm>
#include <array>
#include <concepts>
#include <limits>
#include <span>
#include <type_traits>
#include <utility>

namespace vmk {
    template<typename T>
    struct Format;

    template<typename T>
    concept IsFormatSize = requires {
        { Format<T>::kStringSize } -> std::convertible_to<size_t>;
    };

    template<typename T>
    concept IsFormat = IsFormatSize<T> && requires(T it) {
        { Format<T>::toString(std::declval<char*>(), it) } -> std::same_as<stdx::StringView>;
    };

    template<typename T>
    concept IsStreamFormat = requires(T it) {
        { Format<T>::format(std::declval<class IOutStream&>(), it) };
    };

    namespace detail {
        template<std::integral T>
        inline constexpr size_t kMaxDigits10 = std::numeric_limits<T>::digits10 + 2;

        template<std::integral T>
        inline constexpr size_t kMaxDigits16 = sizeof(T) * 2;
    }

    class IOutStream {
    public:
        virtual ~IOutStream() = default;

        virtual void write(stdx::StringView message) = 0;
        virtual void write(char c) {
            char buffer[1] = { c };
            write(stdx::StringView(buffer, buffer + 1));
        }

        template<size_t N>
        void write(const char (&str)[N]) {
            write(stdx::StringView(str));
        }

        template<typename T> requires (!std::convertible_to<T, stdx::StringView>)
        void write(const T& value);

        template<typename... T>
        void format(T&&... args) {
            (write(std::forward<T>(args)), ...);
        }
    };

    template<std::integral T>
    struct Int {
        T value;
        int width = 0;
        char fill = '\0';

        Int(T value) noexcept : value(value) {}

        Int pad(size_t width, char fill = '0') const {
            Int copy = *this;
            copy.width = width;
            copy.fill = fill;
            return copy;
        }
    };

    template<std::integral T>
    struct Hex {
        T value;
        int width = 0;
        char fill = '\0';
        bool prefix = true;

        Hex(T value) noexcept : value(value) {}

        Hex pad(size_t width, char fill = '0', bool prefix = true) const {
            Hex copy = *this;
            copy.width = width;
            copy.fill = fill;
            copy.prefix = prefix;
            return copy;
        }
    };

    /// @brief Write @p input right aligned into the end of @p buffer.
    ///
    /// @return The view of the written digits, including fill and sign.
    template<std::integral T>
    stdx::StringView FormatInt(std::span<char> buffer, T input, int base, int width = 0, char fill = '\0') {
        static constexpr char kHex[] = "0123456789ABCDEF";
        bool negative = input < 0;

        char *ptr = buffer.data() + buffer.size() - 1;
        char *last = ptr;
        if (input != 0) {
            std::make_unsigned_t<T> value;

            if (negative) {
                value = -(std::make_unsigned_t<T>)input;
            } else {
                value = input;
            }

            while (value != 0) {
                *ptr-- = kHex[value % base];
                value /= base;
            }
        } else {
            *ptr-- = '0';
        }

        if (fill != '\0') {
            if (negative) {
                width--;
            }

            int remaining = width - (last - ptr);
            while (remaining-- > 0 && ptr >= buffer.data()) {
                *ptr-- = fill;
            }
        }

        if (negative) {
            *ptr-- = '-';
        }

        return stdx::StringView(ptr + 1, last + 1);
    }

    template<>
    struct Format<char> {
        static constexpr size_t kStringSize = 1;
        static constexpr stdx::StringView toString(char *buffer, char value) {
            buffer[0] = value;
            return stdx::StringView(buffer, buffer + 1);
        }
    };

    template<std::integral T>
    struct Format<T> {
        static constexpr size_t kStringSize = detail::kMaxDigits10<T> + 32;
        static stdx::StringView toString(char *buffer, T value) {
            return FormatInt(std::span(buffer, kStringSize), value, 10);
        }
    };

    template<std::integral T>
    struct Format<Hex<T>> {
        static constexpr size_t kStringSize = detail::kMaxDigits16<T> + 2 + 32;
        static stdx::StringView toString(char *buffer, Hex<T> value) {
            char temp[kStringSize];
            stdx::StringView result = FormatInt(std::span(temp), std::make_unsigned_t<T>(value.value), 16, value.width, value.fill);

            int offset = 0;
            if (value.prefix) {
                buffer[offset++] = '0';
                buffer[offset++] = 'x';
            }

            std::copy(result.begin(), result.end(), buffer + offset);
            return stdx::StringView(buffer, buffer + offset + result.count());
        }
    };

    template<std::integral T>
    struct Format<Int<T>> {
        static constexpr size_t kStringSize = detail::kMaxDigits10<T> + 32;
        static stdx::StringView toString(char *buffer, Int<T> value) {
            return FormatInt(std::span(buffer, kStringSize), value.value, 10, value.width, value.fill);
        }
    };

    template<IsFormatSize T>
    inline constexpr size_t kFormatSize = Format<T>::kStringSize;

    template<IsStreamFormat T>
    inline void format(IOutStream& out, const T& value) noexcept {
        Format<T>::format(out, value);
    }

    inline void format(IOutStream& out, stdx::StringView value) noexcept {
        out.write(value);
    }

    template<IsFormat T> requires (!IsStreamFormat<T>)
    inline void format(IOutStream& out, const T& value) {
        char buffer[kFormatSize<T>];
        out.write(Format<T>::toString(buffer, value));
    }

    template<typename T> requires (!std::convertible_to<T, stdx::StringView>)
    void IOutStream::write(const T& value) {
        vmk::format(*this, value);
    }

    /// @brief Format all @p args into a fixed size string, truncating at @p N.
    template<size_t N, typename... T>
    inline stdx::StaticString<N> concat(T&&... args) noexcept {
        struct OutStream final : public IOutStream {
            stdx::StaticString<N> result;

            void write(stdx::StringView message) noexcept override {
                result.add(message);
            }
        };

        OutStream out;
        (out.format(args), ...);

        return out.result;
    }

    template<IsStreamFormat T>
    inline auto format(const T& value) {
        return concat<kFormatSize<T>>(value);
    }

    template<>
    struct Format<OsStatusId> {
        static constexpr size_t kStringSize = detail::kMaxDigits16<OsStatus> + 2 + 24;

        static void format(IOutStream& out, OsStatusId value);
    };
}
