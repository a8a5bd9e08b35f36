#pragma once

#include "vmk/std/string_view.hpp"

#include <algorithm>
#include <initializer_list>

namespace stdx {
    template<typename T, size_t N>
    class StaticStringBase {
        size_t mSize;
        T mStorage[N];

        constexpr void init(const T *front, const T *back) {
            mSize = std::clamp<size_t>(back - front, 0, N);
            std::copy_n(front, mSize, mStorage);
        }

    public:
        constexpr StaticStringBase()
            : mSize(0)
        { }

        template<size_t S> requires (S <= N + 1)
        constexpr StaticStringBase(const T (&str)[S])
            : StaticStringBase(str, str + S - 1)
        { }

        constexpr StaticStringBase(StringViewBase<T> view)
            : StaticStringBase(view.begin(), view.end())
        { }

        constexpr StaticStringBase(const T *front [[gnu::nonnull]], const T *back [[gnu::nonnull]]) {
            init(front, back);
        }

        constexpr size_t count() const { return mSize; }
        constexpr size_t capacity() const { return N; }

        constexpr bool isEmpty() const { return mSize == 0; }
        constexpr bool isFull() const { return mSize == N; }

        constexpr T *begin() { return mStorage; }
        constexpr T *end() { return mStorage + mSize; }

        constexpr const T *begin() const { return mStorage; }
        constexpr const T *end() const { return mStorage + mSize; }

        constexpr void clear() {
            mSize = 0;
        }

        constexpr void add(T elem) {
            if (mSize < N) {
                mStorage[mSize++] = elem;
            }
        }

        constexpr void add(StringViewBase<T> view) {
            size_t size = std::min(view.count(), N - mSize);
            std::copy_n(view.begin(), size, mStorage + mSize);
            mSize += size;
        }

        constexpr operator std::basic_string_view<T>() const {
            return std::basic_string_view<T>(begin(), mSize);
        }

        constexpr const T& operator[](size_t index) const {
            return mStorage[index];
        }

        constexpr bool operator==(StringViewBase<T> other) const {
            return std::equal(begin(), end(), other.begin(), other.end());
        }
    };

    template<size_t N>
    using StaticString = StaticStringBase<char, N>;
}
