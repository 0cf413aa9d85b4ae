// -*- c++ -*-
//
// HandleBase: Generic base class template for Handle pattern
// Provides common functionality for std::shared_ptr wrappers

#ifndef BN_HANDLE__H
#define BN_HANDLE__H

#include <boolnet/exception.hpp>
#include <memory>
#include <type_traits>

namespace Bn {

// HandleBase: Base template for Handle pattern classes
//
// Ownership semantics:
// - Copying a Handle is lightweight: it shares ownership via std::shared_ptr
// - Passing by const reference is a non-owning reference
// - Handles compare by pointer identity
//
// Usage:
//   class MyHandle : public HandleBase<MyImpl> {
//   public:
//       using HandleBase<MyImpl>::HandleBase;
//   };
//
template <typename T>
class HandleBase {
   public:
    using element_type = T;

    HandleBase() = default;

    HandleBase(std::nullptr_t)
        : body_(nullptr) {}

    explicit HandleBase(std::shared_ptr<T> body)
        : body_(std::move(body)) {}

    template <class Derived, class = std::enable_if_t<std::is_base_of_v<T, Derived>>>
    explicit HandleBase(const std::shared_ptr<Derived>& body)
        : body_(std::static_pointer_cast<T>(body)) {}

    T* operator->() const {
        if (!body_) {
            throw Bn::RuntimeException("Handle: null dereference");
        }
        return body_.get();
    }

    T& operator*() const {
        return *operator->();
    }

    [[nodiscard]] T* get() const {
        return body_.get();
    }

    [[nodiscard]] std::shared_ptr<T> shared() const {
        return body_;
    }

    explicit operator bool() const {
        return static_cast<bool>(body_);
    }

    bool operator==(const HandleBase& rhs) const {
        return body_.get() == rhs.body_.get();
    }

    bool operator!=(const HandleBase& rhs) const {
        return !(*this == rhs);
    }

   protected:
    std::shared_ptr<T> body_ = nullptr;
};

}  // namespace Bn

#endif  // BN_HANDLE__H
