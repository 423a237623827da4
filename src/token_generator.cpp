#include <antiforgery/tokens/token_generator.hpp>
#include <antiforgery/tokens/identity.hpp>
#include <antiforgery/core/errors.hpp>

#include <cctype>
#include <stdexcept>
#include <string_view>
#include <utility>

namespace antiforgery::tokens
{
  namespace messages
  {
    std::string username_mismatch(const std::string &token_user, const std::string &current_user)
    {
      return "The provided antiforgery token was meant for user \"" + token_user +
             "\", but the current user is \"" + current_user + "\".";
    }
  } // namespace messages

  namespace
  {
    bool iequals(std::string_view a, std::string_view b)
    {
      if (a.size() != b.size())
        return false;
      for (std::size_t i = 0; i < a.size(); ++i)
      {
        if (std::tolower(static_cast<unsigned char>(a[i])) != std::tolower(static_cast<unsigned char>(b[i])))
          return false;
      }
      return true;
    }

    bool starts_with(std::string_view s, std::string_view prefix)
    {
      return s.size() >= prefix.size() && s.substr(0, prefix.size()) == prefix;
    }

    // OpenID style user names are URIs and compare case sensitively.
    bool same_username(const std::string &token_user, const std::string &current_user)
    {
      if (starts_with(current_user, "http://") || starts_with(current_user, "https://"))
        return token_user == current_user;
      return iequals(token_user, current_user);
    }

    bool same_claim_uid(const std::optional<BinaryBlob> &a, const std::optional<BinaryBlob> &b)
    {
      if (!a || !b)
        return !a && !b;
      return *a == *b;
    }
  } // namespace

  DefaultTokenGenerator::DefaultTokenGenerator(bool identity_binding,
                                               bool suppress_identity_heuristic_checks,
                                               std::shared_ptr<const IAdditionalDataProvider> additional_data)
      : identity_binding_(identity_binding),
        suppress_identity_heuristic_checks_(suppress_identity_heuristic_checks),
        additional_data_(std::move(additional_data))
  {
  }

  AntiforgeryToken DefaultTokenGenerator::generate_cookie_token() const
  {
    AntiforgeryToken token{BinaryBlob::random(security_token_bits)};
    token.is_cookie_token = true;
    return token;
  }

  bool DefaultTokenGenerator::is_cookie_token_valid(const std::optional<AntiforgeryToken> &cookie_token) const
  {
    return cookie_token.has_value() &&
           cookie_token->is_cookie_token &&
           cookie_token->security_token.bit_length() == security_token_bits;
  }

  AntiforgeryToken DefaultTokenGenerator::generate_request_token(const Context &ctx,
                                                                 const AntiforgeryToken &cookie_token) const
  {
    if (!is_cookie_token_valid(cookie_token))
      throw std::invalid_argument("generate_request_token requires a valid cookie token");

    AntiforgeryToken token{cookie_token.security_token};
    token.is_cookie_token = false;

    if (identity_binding_)
    {
      if (const Identity *id = current_identity(ctx))
      {
        token.claim_uid = extract_claim_uid(*id);
        if (!token.claim_uid)
        {
          token.username = id->name;

          if (token.username.empty() && !additional_data_ && !suppress_identity_heuristic_checks_)
          {
            throw ConfigurationError(
                "AntiforgeryOptions.suppress_identity_heuristic_checks",
                "The provided identity of type '" + id->authentication_type +
                    "' is marked authenticated but has neither a name nor identifying claims. "
                    "Provide a unique name or claim, register an additional data provider, or set "
                    "AntiforgeryOptions.suppress_identity_heuristic_checks to true.");
          }
        }
      }
    }

    if (additional_data_)
      token.additional_data = additional_data_->get_additional_data(ctx);

    return token;
  }

  Result<void> DefaultTokenGenerator::validate_token_set(const Context &ctx,
                                                         const AntiforgeryToken &cookie_token,
                                                         const AntiforgeryToken &request_token) const
  {
    if (!cookie_token.is_cookie_token || request_token.is_cookie_token)
      return fail(validation_failed(messages::tokens_swapped));

    if (cookie_token.security_token != request_token.security_token)
      return fail(validation_failed(messages::security_token_mismatch));

    if (identity_binding_)
    {
      std::string current_username;
      std::optional<BinaryBlob> current_claim_uid;

      if (const Identity *id = current_identity(ctx))
      {
        current_claim_uid = extract_claim_uid(*id);
        if (!current_claim_uid)
          current_username = id->name;
      }

      if (!same_username(request_token.username, current_username))
        return fail(validation_failed(messages::username_mismatch(request_token.username, current_username)));

      if (!same_claim_uid(request_token.claim_uid, current_claim_uid))
        return fail(validation_failed(messages::claim_uid_mismatch));
    }

    if (additional_data_ && !additional_data_->validate_additional_data(ctx, request_token.additional_data))
      return fail(validation_failed(messages::additional_data_check_failed));

    return ok();
  }

} // namespace antiforgery::tokens
