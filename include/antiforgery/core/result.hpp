#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <utility>

#include <nlohmann/json.hpp>

namespace antiforgery
{
    inline constexpr std::string_view validation_failed_code = "antiforgery_validation_failed";

    // Expected failure of a protocol step, rendered to the client as JSON.
    struct Error final
    {
        int status{400};
        std::string code{validation_failed_code};
        std::string message{};
    };

    inline nlohmann::json to_json(const Error &e)
    {
        return nlohmann::json{{"status", e.status}, {"code", e.code}, {"message", e.message}};
    }

    template <class T>
    class Result;

    // Outcome of a validation: nothing on success, the rejection otherwise.
    template <>
    class Result<void> final
    {
    public:
        static Result ok() { return Result(std::nullopt); }
        static Result fail(Error err) { return Result(std::move(err)); }

        bool is_ok() const noexcept { return !error_.has_value(); }
        bool is_err() const noexcept { return error_.has_value(); }
        explicit operator bool() const noexcept { return is_ok(); }

        // Only meaningful when is_err().
        const Error &error() const { return error_.value(); }

    private:
        explicit Result(std::optional<Error> err) : error_(std::move(err)) {}

        std::optional<Error> error_;
    };

    inline Result<void> ok()
    {
        return Result<void>::ok();
    }

    inline Result<void> fail(Error e)
    {
        return Result<void>::fail(std::move(e));
    }

    // Missing token, mismatched pair, identity mismatch, undeserializable
    // token. Always a 400.
    inline Error validation_failed(std::string message)
    {
        Error e;
        e.message = std::move(message);
        return e;
    }

    inline bool is_validation_failure(const Error &e) noexcept
    {
        return e.status == 400 && e.code == validation_failed_code;
    }

} // namespace antiforgery
