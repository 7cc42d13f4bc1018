#pragma once

#include "types.h"
#include <sdfvm/result.hpp>
#include <atomic>
#include <memory>

namespace sdfvm {
namespace base {

// Root of every long-lived host-side object (atlases, renderer, config).
// Non-copyable; always owned through shared_ptr.
class Object : public std::enable_shared_from_this<Object> {
public:
    using Ptr = std::shared_ptr<Object>;

    virtual ~Object() = default;

    // Runs onShutdown() once; later calls are no-ops.
    Result<void> shutdown() {
        if (_shutdownCalled) return Ok();
        _shutdownCalled = true;
        return onShutdown();
    }

    ObjectId id() const { return _id; }

    virtual const char* typeName() const { return "Object"; }

    Object(const Object&) = delete;
    Object& operator=(const Object&) = delete;
    Object(Object&&) = delete;
    Object& operator=(Object&&) = delete;

protected:
    Object() : _id(nextId()) {}

    virtual Result<void> onShutdown() { return Ok(); }

private:
    static ObjectId nextId() {
        static std::atomic<ObjectId> counter{1};
        return counter++;
    }

    bool _shutdownCalled = false;
    ObjectId _id;
};

} // namespace base
} // namespace sdfvm
