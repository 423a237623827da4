/**
 *
 *  @file token_store.hpp
 *  @author Gaspard Kirira
 *
 *  Copyright 2025, Gaspard Kirira.  All rights reserved.
 *  https://github.com/vixcpp/vix
 *  Use of this source code is governed by a MIT license
 *  that can be found in the License file.
 *
 *  Vix.cpp
 */
#ifndef ANTIFORGERY_STORE_TOKEN_STORE_HPP
#define ANTIFORGERY_STORE_TOKEN_STORE_HPP

#include <memory>
#include <optional>
#include <string>

#include <antiforgery/middleware.hpp>
#include <antiforgery/options.hpp>
#include <antiforgery/tokens/token.hpp>
#include <antiforgery/tokens/token_serializer.hpp>

namespace antiforgery::store
{
  /**
   * @brief Raw token strings found on an incoming request.
   */
  struct RequestTokens
  {
    std::optional<std::string> cookie_token{};
    std::optional<std::string> request_token{};
  };

  /**
   * @brief Where tokens live on the wire.
   */
  class ITokenStore
  {
  public:
    virtual ~ITokenStore() = default;

    /**
     * @brief Cookie token sent by the client, if any.
     *
     * May throw when the stored value is unreadable (for example
     * MalformedTokenError); callers on the issuance path recover from that.
     */
    virtual std::optional<tokens::AntiforgeryToken> get_cookie_token(Context &ctx) const = 0;

    /** @brief Cookie and request token strings, without deserializing them. */
    virtual RequestTokens get_request_tokens(Context &ctx) const = 0;

    /** @brief Write @p token to the outgoing response. */
    virtual void save_cookie_token(Context &ctx, const tokens::AntiforgeryToken &token) const = 0;
  };

  /**
   * @brief Cookie jar, form field and header backed store.
   *
   * - the cookie token travels in the cookie named by the options;
   * - the request token is read from the header first (when a header name
   *   is configured), then from the form field of urlencoded bodies;
   * - saving appends one Set-Cookie (HttpOnly, SameSite=Strict, Secure when
   *   require_ssl is on).
   */
  class DefaultTokenStore final : public ITokenStore
  {
  public:
    DefaultTokenStore(AntiforgeryOptions options,
                      std::shared_ptr<const tokens::ITokenSerializer> serializer);

    std::optional<tokens::AntiforgeryToken> get_cookie_token(Context &ctx) const override;
    RequestTokens get_request_tokens(Context &ctx) const override;
    void save_cookie_token(Context &ctx, const tokens::AntiforgeryToken &token) const override;

  private:
    AntiforgeryOptions options_;
    std::shared_ptr<const tokens::ITokenSerializer> serializer_;
  };

} // namespace antiforgery::store

#endif // ANTIFORGERY_STORE_TOKEN_STORE_HPP
