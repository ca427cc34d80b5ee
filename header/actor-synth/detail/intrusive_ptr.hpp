#pragma once

#include <cassert>
#include <cstddef>
#include <utility>

#include <actor-synth/detail/ref_counted.hpp>

namespace actor_synth { namespace detail {

    template<class T>
    class intrusive_ptr final {
    public:
        using pointer = T*;

        constexpr intrusive_ptr() noexcept
            : ptr_(nullptr) {}

        constexpr intrusive_ptr(std::nullptr_t) noexcept
            : intrusive_ptr() {}

        /// @param add_ref false adopts the initial reference of a fresh object
        intrusive_ptr(pointer raw_ptr, bool add_ref = true) noexcept
            : ptr_(raw_ptr) {
            if (ptr_ && add_ref) {
                intrusive_ptr_add_ref(ptr_);
            }
        }

        intrusive_ptr(const intrusive_ptr& other) noexcept
            : intrusive_ptr(other.ptr_, true) {}

        intrusive_ptr(intrusive_ptr&& other) noexcept
            : ptr_(other.detach()) {}

        intrusive_ptr& operator=(intrusive_ptr other) noexcept {
            swap(other);
            return *this;
        }

        ~intrusive_ptr() {
            if (ptr_) {
                intrusive_ptr_release(ptr_);
            }
        }

        void swap(intrusive_ptr& other) noexcept {
            std::swap(ptr_, other.ptr_);
        }

        pointer detach() noexcept {
            auto result = ptr_;
            ptr_ = nullptr;
            return result;
        }

        void reset() noexcept {
            intrusive_ptr().swap(*this);
        }

        pointer get() const noexcept {
            return ptr_;
        }

        pointer operator->() const noexcept {
            assert(ptr_ != nullptr && "operator->(): dereferencing null intrusive_ptr!");
            return ptr_;
        }

        T& operator*() const noexcept {
            assert(ptr_ != nullptr && "operator*(): dereferencing null intrusive_ptr!");
            return *ptr_;
        }

        explicit operator bool() const noexcept {
            return ptr_ != nullptr;
        }

    private:
        pointer ptr_;
    };

    template<class T, class... Args>
    intrusive_ptr<T> make_counted(Args&&... args) {
        return intrusive_ptr<T>(new T(std::forward<Args>(args)...), false);
    }

}} // namespace actor_synth::detail
