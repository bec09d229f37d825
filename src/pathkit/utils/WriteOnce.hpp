#pragma once
#include "core/Error.hpp"

#include <atomic>

namespace PK {

/**
 * Pointer cell that transitions exactly once from unset to set.
 * Readers observe either nullptr or the final value.
 */
template <typename T>
class WriteOnce {
public:
    WriteOnce() = default;

    WriteOnce(WriteOnce const&)            = delete;
    WriteOnce& operator=(WriteOnce const&) = delete;

    auto set(T* value) -> Expected<void> {
        T* expected = nullptr;
        if (value == nullptr) {
            return std::unexpected(Error{Error::Code::InvalidError, "cannot bind a null reference"});
        }
        if (!this->value_.compare_exchange_strong(expected, value, std::memory_order_acq_rel, std::memory_order_acquire)) {
            return std::unexpected(Error{Error::Code::AlreadyBound, "reference is already bound"});
        }
        return {};
    }

    auto get() const noexcept -> T* {
        return this->value_.load(std::memory_order_acquire);
    }

    auto isSet() const noexcept -> bool {
        return this->get() != nullptr;
    }

private:
    std::atomic<T*> value_{nullptr};
};

} // namespace PK
