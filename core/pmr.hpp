#pragma once

#include <memory>
#include <memory_resource>
#include <new>

namespace core::pmr {

    template<class Target>
    void deallocate_ptr(std::pmr::memory_resource* ptr, Target* target);

    class deleter_t final {
    public:
        explicit deleter_t(std::pmr::memory_resource* ptr)
            : ptr_(ptr) {}

        template<class T>
        void operator()(T* target) {
            deallocate_ptr(ptr_, target);
        }

    private:
        std::pmr::memory_resource* ptr_;
    };

    // note: deleter_t releases sizeof(T) bytes, so it must not own objects through a base class pointer
    template<class T>
    using unique_ptr = std::unique_ptr<T, deleter_t>;

    template<class Target, class... Args>
    unique_ptr<Target> make_unique(std::pmr::memory_resource* ptr, Args&&... args) {
        auto size = sizeof(Target);
        auto align = alignof(Target);
        auto* buffer = ptr->allocate(size, align);
        try {
            auto* target_ptr = new (buffer) Target(ptr, std::forward<Args>(args)...);
            return {target_ptr, deleter_t(ptr)};
        } catch (...) {
            ptr->deallocate(buffer, size, align);
            throw;
        }
    }

    template<class Target>
    void deallocate_ptr(std::pmr::memory_resource* ptr, Target* target) {
        auto align = alignof(Target);
        target->~Target();
        ptr->deallocate(target, sizeof(Target), align);
    }

} // namespace core::pmr
