/**
 *
 *  @file token_generator.hpp
 *  @author Gaspard Kirira
 *
 *  Copyright 2025, Gaspard Kirira.  All rights reserved.
 *  https://github.com/vixcpp/vix
 *  Use of this source code is governed by a MIT license
 *  that can be found in the License file.
 *
 *  Vix.cpp
 */
#ifndef ANTIFORGERY_TOKENS_TOKEN_GENERATOR_HPP
#define ANTIFORGERY_TOKENS_TOKEN_GENERATOR_HPP

#include <memory>
#include <optional>
#include <string>

#include <antiforgery/middleware.hpp>
#include <antiforgery/tokens/additional_data.hpp>
#include <antiforgery/tokens/token.hpp>

namespace antiforgery::tokens
{
  namespace messages
  {
    inline constexpr const char *tokens_swapped =
        "Validation of the provided antiforgery token failed. "
        "The cookie token and the request token were swapped.";
    inline constexpr const char *security_token_mismatch =
        "The antiforgery cookie token and request token do not match.";
    inline constexpr const char *claim_uid_mismatch =
        "The provided antiforgery token was meant for a different claims-based user than the current user.";
    inline constexpr const char *additional_data_check_failed =
        "The provided antiforgery token failed a custom data check.";

    std::string username_mismatch(const std::string &token_user, const std::string &current_user);
  } // namespace messages

  /**
   * @brief Mints and checks tokens.
   */
  class ITokenGenerator
  {
  public:
    virtual ~ITokenGenerator() = default;

    /** @brief Fresh, unpredictable cookie token. Always passes is_cookie_token_valid. */
    virtual AntiforgeryToken generate_cookie_token() const = 0;

    /**
     * @brief Structural check of an existing cookie token.
     *
     * std::nullopt is invalid and simply means a new token must be minted.
     */
    virtual bool is_cookie_token_valid(const std::optional<AntiforgeryToken> &cookie_token) const = 0;

    /**
     * @brief Request token derived from @p cookie_token and the caller identity.
     *
     * @throws std::invalid_argument if @p cookie_token is not a cookie token.
     */
    virtual AntiforgeryToken generate_request_token(const Context &ctx,
                                                    const AntiforgeryToken &cookie_token) const = 0;

    /**
     * @brief Check that the pair was issued together for the current caller.
     *
     * @return ok, or a validation failure carrying the diagnostic message.
     */
    virtual Result<void> validate_token_set(const Context &ctx,
                                            const AntiforgeryToken &cookie_token,
                                            const AntiforgeryToken &request_token) const = 0;
  };

  /**
   * @brief Default generator.
   *
   * Request tokens share the cookie token's random security token. With
   * identity binding on, a request token issued to an authenticated caller
   * also carries the caller's claim digest, or the user name when there are
   * no claims, and only validates for the same caller.
   */
  class DefaultTokenGenerator final : public ITokenGenerator
  {
  public:
    DefaultTokenGenerator(bool identity_binding,
                          bool suppress_identity_heuristic_checks,
                          std::shared_ptr<const IAdditionalDataProvider> additional_data = {});

    AntiforgeryToken generate_cookie_token() const override;

    bool is_cookie_token_valid(const std::optional<AntiforgeryToken> &cookie_token) const override;

    /**
     * @throws ConfigurationError for an authenticated identity without claims
     * or name, unless heuristic checks are suppressed.
     */
    AntiforgeryToken generate_request_token(const Context &ctx,
                                            const AntiforgeryToken &cookie_token) const override;

    Result<void> validate_token_set(const Context &ctx,
                                    const AntiforgeryToken &cookie_token,
                                    const AntiforgeryToken &request_token) const override;

  private:
    bool identity_binding_;
    bool suppress_identity_heuristic_checks_;
    std::shared_ptr<const IAdditionalDataProvider> additional_data_;
  };

} // namespace antiforgery::tokens

#endif // ANTIFORGERY_TOKENS_TOKEN_GENERATOR_HPP
