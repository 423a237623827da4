#pragma once

#include <utility>

#include <vix/http/RequestHandler.hpp>
#include <antiforgery/core/result.hpp>

namespace antiforgery
{
    class Services;

    using Request = vix::vhttp::Request;
    using Response = vix::vhttp::ResponseWrapper;

    // The exchange every antiforgery operation works on. Request scoped data
    // (identity, parsed form, issued tokens) lives in the request state.
    class Context final
    {
    public:
        Context(Request &req, Response &res, Services &services) noexcept
            : req_(req), res_(res), services_(services)
        {
        }

        Context(const Context &) = delete;
        Context &operator=(const Context &) = delete;

        Request &req() noexcept { return req_; }
        const Request &req() const noexcept { return req_; }
        Response &res() noexcept { return res_; }
        Services &services() noexcept { return services_; }
        const Services &services() const noexcept { return services_; }

        template <class T>
        const T *try_state() const noexcept
        {
            return req_.template try_state<T>();
        }

        template <class T>
        void set_state(T value)
        {
            req_.template set_state<T>(std::move(value));
        }

        // Writes err as the JSON response body with its status.
        void reject(const Error &err)
        {
            res_.status(err.status).json(to_json(err));
        }

    private:
        Request &req_;
        Response &res_;
        Services &services_;
    };

} // namespace antiforgery
