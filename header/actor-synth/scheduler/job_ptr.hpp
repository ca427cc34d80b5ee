#pragma once

#include <cassert>
#include <concepts>
#include <cstddef>

#include <actor-synth/scheduler/forwards.hpp>
#include <actor-synth/scheduler/resumable.hpp>

namespace actor_synth { namespace scheduler {

    namespace detail {

        template<typename T>
        concept resumable_type = requires(T* t, std::size_t n) {
            { t->resume(n) } -> std::same_as<resume_info>;
        };

        template<resumable_type T>
        resume_info resume_impl(void* ptr, std::size_t max_throughput) {
            assert(ptr != nullptr);
            return static_cast<T*>(ptr)->resume(max_throughput);
        }

    } // namespace detail

    /// @brief Non-owning, type-erased handle to anything with resume(size_t)
    struct job_ptr {
        void* ptr;
        resume_info (*resume_fn)(void*, std::size_t);

        job_ptr() noexcept
            : ptr(nullptr)
            , resume_fn(nullptr) {}

        job_ptr(void* p, resume_info (*fn)(void*, std::size_t)) noexcept
            : ptr(p)
            , resume_fn(fn) {
            assert((p != nullptr) == (fn != nullptr) && "pointer and function must be set together");
        }

        template<detail::resumable_type T>
        static job_ptr make(T* resumable) noexcept {
            return job_ptr(resumable, &detail::resume_impl<T>);
        }

        resume_info resume(std::size_t max_throughput) const {
            assert(ptr != nullptr && "Cannot resume null job");
            return resume_fn(ptr, max_throughput);
        }

        explicit operator bool() const noexcept {
            return ptr != nullptr;
        }

        void* raw_ptr() const noexcept {
            return ptr;
        }
    };

}} // namespace actor_synth::scheduler
