#pragma once

#include <sdfvm/result.hpp>
#include <memory>
#include <utility>

namespace sdfvm {
namespace base {

// Marker passed to createImpl so that only ObjectFactory::create can call it.
struct ObjectFactoryContext {};

// ObjectFactory - the create protocol for shared_ptr objects
//
//   1. Header declares the abstract interface (e.g. TextureAtlas)
//   2. Cpp defines a private subclass (TextureAtlasImpl) with init()
//   3. createImpl() builds the Impl, runs init(), returns Result<Ptr>
//
// T must provide either
//   static Result<Ptr> createImpl(ContextType&, Args...)
// or
//   static Result<Ptr> createImpl(Args...)
//
template<typename T, typename ContextT = ObjectFactoryContext>
class ObjectFactory {
public:
    using ContextType = ContextT;
    using Type = T;
    using Ptr = std::shared_ptr<T>;

    template<typename... Args>
    static Result<Ptr> create(Args&&... args) {
        ContextType context;
        if constexpr (requires { Type::createImpl(context, std::forward<Args>(args)...); }) {
            return Type::createImpl(context, std::forward<Args>(args)...);
        } else {
            static_assert(requires { Type::createImpl(std::forward<Args>(args)...); },
                          "ObjectFactory: T must implement static createImpl(ContextType&, Args...) "
                          "or static createImpl(Args...) returning Result<Ptr>");
            return Type::createImpl(std::forward<Args>(args)...);
        }
    }
};

} // namespace base
} // namespace sdfvm
