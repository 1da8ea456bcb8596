#pragma once

#include <memory>
#include <type_traits>
#include <slate/result.hpp>

namespace slate {
namespace base {

// Marker passed to createImpl overloads that want to be reachable only
// through create().
struct ObjectFactoryContext {};

namespace detail {

template<typename Void, typename T, typename... Args>
struct CreateImplTakes : std::false_type {};

template<typename T, typename... Args>
struct CreateImplTakes<std::void_t<decltype(T::createImpl(std::declval<Args>()...))>, T, Args...>
    : std::true_type {};

} // namespace detail

// ObjectFactory gives a type the create() entry point:
//
//   class Pool : public ObjectFactory<Pool> {
//   public:
//       static Result<Ptr> createImpl(Device::Ptr device, Config config = {}) noexcept;
//   };
//   auto pool = Pool::create(device);
//
// createImpl builds the private Impl, runs its init() and returns the
// Result. An overload taking ContextType& first is preferred when present.
template<typename T, typename ContextT = ObjectFactoryContext>
class ObjectFactory {
public:
    using ContextType = ContextT;
    using Ptr = std::shared_ptr<T>;

    template<typename... Args>
    static Result<Ptr> create(Args&&... args) {
        if constexpr (detail::CreateImplTakes<void, T, ContextType&, Args...>::value) {
            ContextType context;
            return T::createImpl(context, std::forward<Args>(args)...);
        } else {
            static_assert(detail::CreateImplTakes<void, T, Args...>::value,
                          "ObjectFactory: T needs static Result<Ptr> createImpl(...) for these arguments");
            return T::createImpl(std::forward<Args>(args)...);
        }
    }
};

// One instance per thread, built lazily by T::createImpl(). A failed
// creation is remembered for the thread.
template<typename T>
class ThreadSingleton {
public:
    using Ptr = std::shared_ptr<T>;

    static Result<Ptr> instance() {
        static thread_local Result<Ptr> _instance = []() -> Result<Ptr> {
            auto result = T::createImpl();
            if (!result) {
                return Err<Ptr>("ThreadSingleton creation failed", result);
            }
            return result;
        }();
        return _instance;
    }

protected:
    ThreadSingleton() = default;
};

} // namespace base
} // namespace slate
