/**
 *
 *  @file antiforgery_middleware.hpp
 *  @author Gaspard Kirira
 *
 *  Copyright 2025, Gaspard Kirira.  All rights reserved.
 *  https://github.com/vixcpp/vix
 *  Use of this source code is governed by a MIT license
 *  that can be found in the License file.
 *
 *  Vix.cpp
 */
#ifndef ANTIFORGERY_SECURITY_ANTIFORGERY_MIDDLEWARE_HPP
#define ANTIFORGERY_SECURITY_ANTIFORGERY_MIDDLEWARE_HPP

#include <memory>
#include <string_view>
#include <utility>

#include <antiforgery/antiforgery.hpp>
#include <antiforgery/middleware.hpp>

namespace antiforgery::security
{
  struct ValidateOptions
  {
    /** @brief Also enforce tokens on GET. */
    bool protect_get{false};
  };

  inline bool iequals(std::string_view a, std::string_view b)
  {
    if (a.size() != b.size())
      return false;
    for (std::size_t i = 0; i < a.size(); ++i)
    {
      unsigned char ca = static_cast<unsigned char>(a[i]);
      unsigned char cb = static_cast<unsigned char>(b[i]);
      if (ca >= 'A' && ca <= 'Z')
        ca = static_cast<unsigned char>(ca - 'A' + 'a');
      if (cb >= 'A' && cb <= 'Z')
        cb = static_cast<unsigned char>(cb - 'A' + 'a');
      if (ca != cb)
        return false;
    }
    return true;
  }

  inline bool is_unsafe_method(std::string_view m, bool protect_get)
  {
    if (protect_get && iequals(m, "GET"))
      return true;

    return iequals(m, "POST") || iequals(m, "PUT") || iequals(m, "PATCH") || iequals(m, "DELETE");
  }

  /**
   * @brief Reject state changing requests without a valid token pair.
   *
   * Safe methods pass through. On failure the response is the validation
   * error as JSON (400) and the chain stops.
   *
   * ConfigurationError (require_ssl on a plain HTTP exchange) is not caught:
   * it reports a deployment problem, not a forged request.
   */
  inline MiddlewareFn validate(std::shared_ptr<const Antiforgery> af, ValidateOptions opt = {})
  {
    return [af = std::move(af), opt](Context &ctx, Next next) mutable
    {
      if (!is_unsafe_method(ctx.req().method(), opt.protect_get))
      {
        next();
        return;
      }

      auto r = af->validate_request(ctx);
      if (r.is_err())
      {
        ctx.reject(r.error());
        return;
      }

      next();
    };
  }

  /**
   * @brief Issue a token pair for the handler.
   *
   * Persists a new cookie token when needed and publishes the TokenSet in
   * request state (ctx.try_state<tokens::TokenSet>()).
   */
  inline MiddlewareFn issue(std::shared_ptr<const Antiforgery> af)
  {
    return [af = std::move(af)](Context &ctx, Next next) mutable
    {
      ctx.set_state<tokens::TokenSet>(af->get_and_store_tokens(ctx));
      next();
    };
  }

} // namespace antiforgery::security

#endif // ANTIFORGERY_SECURITY_ANTIFORGERY_MIDDLEWARE_HPP
