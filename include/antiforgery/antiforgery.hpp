/**
 *
 *  @file antiforgery.hpp
 *  @author Gaspard Kirira
 *
 *  Copyright 2025, Gaspard Kirira.  All rights reserved.
 *  https://github.com/vixcpp/vix
 *  Use of this source code is governed by a MIT license
 *  that can be found in the License file.
 *
 *  Vix.cpp
 */
#ifndef ANTIFORGERY_ANTIFORGERY_HPP
#define ANTIFORGERY_ANTIFORGERY_HPP

#include <memory>
#include <optional>
#include <string>
#include <string_view>

#include <antiforgery/middleware.hpp>
#include <antiforgery/options.hpp>
#include <antiforgery/store/token_store.hpp>
#include <antiforgery/tokens/additional_data.hpp>
#include <antiforgery/tokens/token.hpp>
#include <antiforgery/tokens/token_generator.hpp>
#include <antiforgery/tokens/token_serializer.hpp>
#include <antiforgery/tokens/token_set.hpp>

namespace antiforgery
{
  namespace messages
  {
    std::string cookie_token_required(const std::string &cookie_name);
    std::string form_field_required(const std::string &form_field_name);
    std::string header_required(const std::string &header_name);
    std::string field_or_header_required(const std::string &form_field_name, const std::string &header_name);

    inline constexpr const char *cookie_token_must_be_provided =
        "The required antiforgery cookie token must be provided.";
    inline constexpr const char *request_token_must_be_provided =
        "The required antiforgery request token must be provided.";
  } // namespace messages

  /**
   * @brief Result of reading the cookie token on the issuance path.
   *
   * recovered is true when the store failed to read the cookie and the
   * failure was turned into "no token" so a fresh one gets minted.
   */
  struct CookieLookup
  {
    std::optional<tokens::AntiforgeryToken> token{};
    bool recovered{false};
  };

  /**
   * @brief Antiforgery protocol surface.
   *
   * Holds only immutable configuration and collaborators; every call is a
   * function of one exchange, so a single instance is shared by all requests.
   *
   * Each operation first applies the transport gate: with require_ssl on and a
   * non HTTPS exchange it throws ConfigurationError before touching the store.
   */
  class Antiforgery
  {
  public:
    Antiforgery(AntiforgeryOptions options,
                std::shared_ptr<const tokens::ITokenGenerator> generator,
                std::shared_ptr<const tokens::ITokenSerializer> serializer,
                std::shared_ptr<const store::ITokenStore> store);

    /**
     * @brief Issue a token pair and persist the cookie token if it is new.
     *
     * A newly minted cookie token is written with "X-Frame-Options: SAMEORIGIN"
     * (unless suppressed). A reused cookie token leaves the response untouched.
     */
    tokens::TokenSet get_and_store_tokens(Context &ctx) const;

    /**
     * @brief Issue a token pair without touching the response.
     */
    tokens::TokenSet get_tokens(Context &ctx) const;

    /**
     * @brief Probe the incoming request.
     *
     * Missing, malformed or mismatched tokens all yield false.
     */
    bool is_request_valid(Context &ctx) const;

    /**
     * @brief Validate the incoming request.
     *
     * @return ok, or a validation failure whose message names what is missing
     * or why the pair was rejected.
     */
    Result<void> validate_request(Context &ctx) const;

    /**
     * @brief Validate a caller supplied pair against the current exchange.
     *
     * @throws std::invalid_argument if either string is empty.
     */
    Result<void> validate_tokens(Context &ctx,
                                 std::string_view cookie_token,
                                 std::string_view request_token) const;

    Result<void> validate_tokens(Context &ctx, const tokens::TokenSet &token_set) const;

    /**
     * @brief Make sure the client holds a valid cookie token, without issuing
     * a request token.
     *
     * The frame header is applied on every call, whether or not a cookie is
     * written.
     */
    void set_cookie_token_and_header(Context &ctx) const;

    /**
     * @brief Read the cookie token, turning read failures into "absent".
     */
    CookieLookup lookup_cookie_token(Context &ctx) const;

    const AntiforgeryOptions &options() const noexcept { return options_; }

  private:
    struct IssuedTokens
    {
      tokens::AntiforgeryToken cookie_token;
      tokens::AntiforgeryToken request_token;
      bool is_new_cookie_token{false};
    };

    void check_ssl(const Context &ctx) const;
    IssuedTokens issue(Context &ctx) const;
    std::optional<tokens::AntiforgeryToken> new_cookie_token_if_invalid(
        const std::optional<tokens::AntiforgeryToken> &cookie_token) const;
    void save_cookie_token_and_header(Context &ctx,
                                      const std::optional<tokens::AntiforgeryToken> &new_cookie_token) const;
    Result<void> validate_deserialized(Context &ctx,
                                       std::string_view cookie_token,
                                       std::string_view request_token) const;
    tokens::TokenSet serialize(const IssuedTokens &issued) const;

    AntiforgeryOptions options_;
    std::shared_ptr<const tokens::ITokenGenerator> generator_;
    std::shared_ptr<const tokens::ITokenSerializer> serializer_;
    std::shared_ptr<const store::ITokenStore> store_;
  };

  /**
   * @brief Wire an Antiforgery with the default generator, serializer and store.
   *
   * @param options validated with validate_options().
   * @param signing_key HMAC key for the serializer, at least 16 bytes.
   * @param additional_data optional provider embedded into request tokens.
   */
  std::shared_ptr<Antiforgery> make_antiforgery(
      AntiforgeryOptions options,
      std::string signing_key,
      std::shared_ptr<const tokens::IAdditionalDataProvider> additional_data = {});

} // namespace antiforgery

#endif // ANTIFORGERY_ANTIFORGERY_HPP
