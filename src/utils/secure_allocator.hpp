/* SPDX-License-Identifier: MPL-2.0 */

#ifndef __S3WIRE_SECURE_ALLOCATOR_HPP_INCLUDED__
#define __S3WIRE_SECURE_ALLOCATOR_HPP_INCLUDED__

#include "utils/macros.hpp"

#include <openssl/crypto.h>

#include <memory>
#include <string>

namespace s3wire
{
//  Allocator that wipes memory before returning it to the heap. Used for
//  containers holding credentials.
template <typename T> struct secure_allocator_t : std::allocator<T>
{
    typedef T value_type;
    typedef T *pointer;
    typedef size_t size_type;

    secure_allocator_t () S3WIRE_DEFAULT

    template <class U>
    secure_allocator_t (const secure_allocator_t<U> &) S3WIRE_NOEXCEPT
    {
    }

    void deallocate (T *p_, size_t n_)
    {
        if (p_)
            OPENSSL_cleanse (p_, n_ * sizeof (T));
        std::allocator<T>::deallocate (p_, n_);
    }

    template <class U> struct rebind
    {
        typedef secure_allocator_t<U> other;
    };
};

template <typename T, typename U>
bool operator== (const secure_allocator_t<T> &, const secure_allocator_t<U> &)
{
    return true;
}

template <typename T, typename U>
bool operator!= (const secure_allocator_t<T> &, const secure_allocator_t<U> &)
{
    return false;
}

typedef std::basic_string<char, std::char_traits<char>, secure_allocator_t<char> >
  secure_string_t;
}

#endif
