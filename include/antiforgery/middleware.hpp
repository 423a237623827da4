#pragma once

#include <functional>
#include <map>
#include <memory>
#include <typeindex>
#include <utility>

#include <vix/http/RequestHandler.hpp>
#include <antiforgery/core/context.hpp>
#include <antiforgery/core/next.hpp>
#include <antiforgery/core/result.hpp>

namespace antiforgery
{
    // Host provided collaborators, one instance per type. The antiforgery
    // layer only asks for basics::ILogger.
    class Services final
    {
    public:
        template <typename T>
        void provide(std::shared_ptr<T> svc)
        {
            by_type_[typeid(T)] = std::move(svc);
        }

        template <typename T>
        std::shared_ptr<T> get() const
        {
            const auto found = by_type_.find(typeid(T));
            return found == by_type_.end() ? nullptr : std::static_pointer_cast<T>(found->second);
        }

    private:
        std::map<std::type_index, std::shared_ptr<void>> by_type_{};
    };

    using MiddlewareFn = std::function<void(Context &, Next)>;

} // namespace antiforgery
