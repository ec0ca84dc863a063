#pragma once

#include "chars.h"

#include <algorithm>
#include <iterator>
#include <memory>
#include <stdexcept>
#include <string_view>

namespace rdx {

template<typename Ty>
class basic_membuffer {
 private:
    static_assert(std::is_trivially_copyable<Ty>::value && std::is_trivially_destructible<Ty>::value,
                  "rdx::basic_membuffer<> must have trivially copyable and destructible value type");

 public:
    using value_type = Ty;
    using pointer = Ty*;
    using const_pointer = const Ty*;
    using size_type = std::size_t;
    using difference_type = std::ptrdiff_t;

    explicit basic_membuffer(Ty* first, Ty* last = reinterpret_cast<Ty*>(0)) noexcept : curr_(first), last_(last) {}
    virtual ~basic_membuffer() = default;
    basic_membuffer(const basic_membuffer&) = delete;
    basic_membuffer& operator=(const basic_membuffer&) = delete;

    size_type avail() const noexcept { return last_ - curr_; }
    const_pointer curr() const noexcept { return curr_; }
    pointer curr() noexcept { return curr_; }
    const_pointer last() const noexcept { return last_; }
    pointer last() noexcept { return last_; }

    basic_membuffer& advance(size_type n) noexcept {
        assert(n <= avail());
        curr_ += n;
        return *this;
    }

    basic_membuffer& append(const value_type* first, const value_type* last) {
        assert(first <= last);
        size_type count = static_cast<size_type>(last - first), n_avail = avail();
        while (count > n_avail) {
            curr_ = std::copy_n(first, n_avail, curr_);
            first += n_avail, count -= n_avail;
            if (!(n_avail = try_grow(count))) { return *this; }
        }
        curr_ = std::copy(first, last, curr_);
        return *this;
    }

    void push_back(value_type val) {
        if (curr_ != last_ || try_grow(1)) { *curr_++ = val; }
    }

    template<typename CharT = value_type>
    std::enable_if_t<is_character<CharT>::value, basic_membuffer&> append(const value_type* s, size_type count) {
        return append(s, s + count);
    }
    template<typename CharT = value_type>
    std::enable_if_t<is_character<CharT>::value, basic_membuffer&> operator+=(std::basic_string_view<value_type> s) {
        return append(s.data(), s.size());
    }
    template<typename CharT = value_type>
    std::enable_if_t<is_character<CharT>::value, basic_membuffer&> operator+=(value_type ch) {
        push_back(ch);
        return *this;
    }

 protected:
    void set(Ty* curr) noexcept { curr_ = curr; }
    void set(Ty* curr, Ty* last) noexcept { curr_ = curr, last_ = last; }
    virtual size_type try_grow(size_type /*extra*/) { return 0; }

 private:
    Ty* curr_;
    Ty* last_;
};

using membuffer = basic_membuffer<char>;
using wmembuffer = basic_membuffer<wchar_t>;

template<typename Ty, typename Alloc>
class basic_dynbuffer : protected std::allocator_traits<Alloc>::template rebind_alloc<Ty>, public basic_membuffer<Ty> {
 private:
    using alloc_type = typename std::allocator_traits<Alloc>::template rebind_alloc<Ty>;

 public:
    using value_type = typename basic_membuffer<Ty>::value_type;
    using pointer = typename basic_membuffer<Ty>::pointer;
    using const_pointer = typename basic_membuffer<Ty>::const_pointer;
    using size_type = typename basic_membuffer<Ty>::size_type;
    using difference_type = typename basic_membuffer<Ty>::difference_type;

    ~basic_dynbuffer() override {
        if (is_allocated_) { this->deallocate(first_, capacity()); }
    }

    bool empty() const noexcept { return first_ == this->curr(); }
    size_type size() const noexcept { return this->curr() - first_; }
    size_type capacity() const noexcept { return this->last() - first_; }
    const_pointer data() const noexcept { return first_; }
    pointer data() noexcept { return first_; }
    void clear() noexcept { this->set(first_); }

    void reserve(size_type extra) {
        if (extra > this->avail()) { try_grow(extra); }
    }

 protected:
    basic_dynbuffer(Ty* first, Ty* last) noexcept
        : basic_membuffer<Ty>(first, last), first_(first), is_allocated_(false) {}

    size_type try_grow(size_type extra) override {
        size_type sz = size(), cap = capacity(), delta_sz = std::max(extra, sz >> 1);
        const size_type max_avail = std::allocator_traits<alloc_type>::max_size(*this) - sz;
        if (delta_sz > max_avail) {
            if (extra > max_avail) { throw std::length_error("too much to reserve"); }
            delta_sz = std::max(extra, max_avail >> 1);
        }
        sz += delta_sz;
        Ty* first = this->allocate(sz);
        this->set(std::copy(first_, this->curr(), first), first + sz);
        if (is_allocated_) { this->deallocate(first_, cap); }
        first_ = first, is_allocated_ = true;
        return this->avail();
    }

 private:
    Ty* first_;
    bool is_allocated_;
};

template<typename Ty, std::size_t InlineBufSize = 0, typename Alloc = std::allocator<Ty>>
class inline_basic_dynbuffer final : public basic_dynbuffer<Ty, Alloc> {
 public:
    inline_basic_dynbuffer() noexcept
        : basic_dynbuffer<Ty, Alloc>(reinterpret_cast<Ty*>(buf_), reinterpret_cast<Ty*>(buf_) + inline_buf_size) {}

 private:
    enum : unsigned {
#if defined(NDEBUG) || !defined(_DEBUG_REDUCED_BUFFERS)
        inline_buf_size = InlineBufSize != 0 ? InlineBufSize : 256 / sizeof(Ty)
#else   // defined(NDEBUG) || !defined(_DEBUG_REDUCED_BUFFERS)
        inline_buf_size = 7
#endif  // defined(NDEBUG) || !defined(_DEBUG_REDUCED_BUFFERS)
    };
    alignas(std::alignment_of<Ty>::value) std::uint8_t buf_[inline_buf_size * sizeof(Ty)];
};

using inline_dynbuffer = inline_basic_dynbuffer<char>;
using inline_wdynbuffer = inline_basic_dynbuffer<wchar_t>;

}  // namespace rdx
