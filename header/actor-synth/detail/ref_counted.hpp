#pragma once

#include <atomic>
#include <cassert>
#include <cstddef>

namespace actor_synth { namespace detail {

    /// @brief Intrusive reference count shared by reply states and mailboxes
    class ref_counted {
    public:
        virtual ~ref_counted() = default;

        ref_counted() noexcept
            : rc_(1) {}

        ref_counted(const ref_counted&) = delete;
        ref_counted& operator=(const ref_counted&) = delete;

        void ref() const noexcept {
#ifndef NDEBUG
            auto old_rc = rc_.load(std::memory_order_acquire);
            assert(old_rc > 0 && "ref(): use-after-free - refcount is 0, object deleted!");
#endif
            rc_.fetch_add(1, std::memory_order_relaxed);
        }

        void deref() const noexcept {
            if (rc_.fetch_sub(1, std::memory_order_acq_rel) == 1) {
                delete this;
            }
        }

    private:
        mutable std::atomic<std::size_t> rc_;
    };

    inline void intrusive_ptr_add_ref(const ref_counted* p) noexcept {
        p->ref();
    }

    inline void intrusive_ptr_release(const ref_counted* p) noexcept {
        p->deref();
    }

}} // namespace actor_synth::detail
