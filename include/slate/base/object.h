#pragma once

#include "types.h"
#include <atomic>
#include <memory>
#include <type_traits>

namespace slate {
namespace base {

// Base of loop-registered objects. Always owned by shared_ptr: listeners are
// held weakly by the event loop and hand out weak references to themselves
// for asynchronous completions.
class Object : public std::enable_shared_from_this<Object> {
public:
    using Ptr = std::shared_ptr<Object>;

    virtual ~Object() = default;

    ObjectId id() const { return _id; }

    virtual const char* typeName() const { return "Object"; }

    template<typename T>
    std::shared_ptr<T> sharedAs() {
        static_assert(std::is_base_of_v<Object, T>, "T must derive from Object");
        return std::dynamic_pointer_cast<T>(shared_from_this());
    }

    template<typename T>
    std::weak_ptr<T> weakAs() {
        return sharedAs<T>();
    }

    Object(const Object&) = delete;
    Object& operator=(const Object&) = delete;

protected:
    Object() : _id(nextId()) {}

private:
    static ObjectId nextId() {
        static std::atomic<ObjectId> counter{1};
        return counter++;
    }

    ObjectId _id;
};

} // namespace base
} // namespace slate
