#pragma once

#include <functional>
#include <utility>

namespace antiforgery
{
    // Continuation a middleware receives. The rest of the chain runs on the
    // first call only; later calls do nothing.
    class Next final
    {
    public:
        Next() = default;
        explicit Next(std::function<void()> rest) : rest_(std::move(rest)) {}

        void operator()()
        {
            if (used_)
                return;
            used_ = true;
            if (rest_)
                rest_();
        }

        bool used() const noexcept { return used_; }

    private:
        std::function<void()> rest_{};
        bool used_{false};
    };

} // namespace antiforgery
