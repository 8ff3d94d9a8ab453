/*
 * Copyright (C) 2026 Canonical Ltd.
 *
 * This program is free software: you can redistribute it and/or modify
 * it under the terms of the GNU General Public License version 3 as
 * published by the Free Software Foundation.
 *
 * This program is distributed in the hope that it will be useful,
 * but WITHOUT ANY WARRANTY; without even the implied warranty of
 * MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
 * GNU General Public License for more details.
 *
 * You should have received a copy of the GNU General Public License
 * along with this program.  If not, see <http://www.gnu.org/licenses/>.
 */

#pragma once

#pragma GCC diagnostic push
#pragma GCC diagnostic ignored "-Wold-style-cast"
#include <glib-object.h>
#pragma GCC diagnostic pop

#include <cstddef>
#include <stdexcept>

namespace appicons
{

namespace internal
{

/**
 * Owning pointer for GObject-derived C objects, modelled on unique_ptr.
 * The deleter is always g_object_unref().
 *
 * The pointer takes over a reference the caller already holds; it never
 * increments the reference count itself. For functions that return a
 * borrowed reference, call g_object_ref() before handing the object over.
 *
 * Floating references are rejected with invalid_argument (the object
 * is unreffed in that case to avoid a leak).
 */
template <typename T>
class gobj_ptr final
{
public:
    typedef T element_type;
    typedef T* pointer;

    constexpr gobj_ptr() noexcept
        : u_(nullptr)
    {
    }

    explicit gobj_ptr(T* t)
        : u_(t)
    {
        validate_float(t);
    }

    constexpr gobj_ptr(std::nullptr_t) noexcept
        : u_(nullptr)
    {
    }

    gobj_ptr(gobj_ptr&& o) noexcept
        : u_(o.u_)
    {
        o.u_ = nullptr;
    }

    gobj_ptr(gobj_ptr const&) = delete;
    gobj_ptr& operator=(gobj_ptr const&) = delete;

    ~gobj_ptr()
    {
        reset();
    }

    gobj_ptr& operator=(gobj_ptr&& o) noexcept
    {
        if (this != &o)
        {
            unref();
            u_ = o.u_;
            o.u_ = nullptr;
        }
        return *this;
    }

    gobj_ptr& operator=(std::nullptr_t) noexcept
    {
        unref();
        return *this;
    }

    void swap(gobj_ptr& o) noexcept
    {
        T* tmp = u_;
        u_ = o.u_;
        o.u_ = tmp;
    }

    void reset(pointer p = pointer())
    {
        unref();
        u_ = p;
        validate_float(p);
    }

    T* release() noexcept
    {
        T* r = u_;
        u_ = nullptr;
        return r;
    }

    T* get() const noexcept
    {
        return u_;
    }

    T& operator*() const
    {
        return *u_;
    }

    T* operator->() const noexcept
    {
        return u_;
    }

    explicit operator bool() const noexcept
    {
        return u_ != nullptr;
    }

    bool operator==(gobj_ptr const& o) const noexcept
    {
        return u_ == o.u_;
    }

    bool operator!=(gobj_ptr const& o) const noexcept
    {
        return u_ != o.u_;
    }

private:
    void unref() noexcept
    {
        if (u_ != nullptr)
        {
            g_object_unref(G_OBJECT(u_));
            u_ = nullptr;
        }
    }

    void validate_float(T* t)
    {
        if (t != nullptr && g_object_is_floating(G_OBJECT(t)))
        {
            g_object_unref(G_OBJECT(t));
            u_ = nullptr;
            throw std::invalid_argument("gobj_ptr: cannot manage a floating gobject");
        }
    }

    T* u_;
};

}  // namespace internal

}  // namespace appicons
