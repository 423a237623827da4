#include <antiforgery/antiforgery.hpp>
#include <antiforgery/basics/logger.hpp>
#include <antiforgery/core/errors.hpp>
#include <antiforgery/http/form.hpp>
#include <antiforgery/http/transport.hpp>

#include <stdexcept>
#include <utility>

namespace antiforgery
{
  namespace messages
  {
    std::string cookie_token_required(const std::string &cookie_name)
    {
      return "The required antiforgery cookie \"" + cookie_name + "\" is not present.";
    }

    std::string form_field_required(const std::string &form_field_name)
    {
      return "The required antiforgery form field \"" + form_field_name + "\" is not present.";
    }

    std::string header_required(const std::string &header_name)
    {
      return "The required antiforgery header value \"" + header_name + "\" is not present.";
    }

    std::string field_or_header_required(const std::string &form_field_name, const std::string &header_name)
    {
      return "The required antiforgery request token was not provided in either form field \"" +
             form_field_name + "\" or header value \"" + header_name + "\".";
    }
  } // namespace messages

  using basics::LogLevel;

  Antiforgery::Antiforgery(AntiforgeryOptions options,
                           std::shared_ptr<const tokens::ITokenGenerator> generator,
                           std::shared_ptr<const tokens::ITokenSerializer> serializer,
                           std::shared_ptr<const store::ITokenStore> store)
      : options_(std::move(options)),
        generator_(std::move(generator)),
        serializer_(std::move(serializer)),
        store_(std::move(store))
  {
    if (!generator_ || !serializer_ || !store_)
      throw std::invalid_argument("Antiforgery requires a token generator, serializer and store");

    validate_options(options_);
  }

  void Antiforgery::check_ssl(const Context &ctx) const
  {
    if (!options_.require_ssl)
      return;

    const bool secure = options_.is_secure ? options_.is_secure(ctx.req()) : http::is_https(ctx.req());
    if (secure)
      return;

    const std::string msg =
        "The antiforgery system has the configuration value AntiforgeryOptions.require_ssl = true, "
        "but the current request is not an SSL request.";
    basics::log(ctx, LogLevel::Error, msg);
    throw ConfigurationError("AntiforgeryOptions.require_ssl", msg);
  }

  CookieLookup Antiforgery::lookup_cookie_token(Context &ctx) const
  {
    // An unreadable cookie must never block issuance: minting a fresh
    // token is always possible, so every read failure counts as "absent".
    try
    {
      return CookieLookup{store_->get_cookie_token(ctx), false};
    }
    catch (const std::exception &e)
    {
      basics::log(ctx, LogLevel::Warn,
                  std::string("unreadable cookie token, a new one will be issued: ") + e.what());
      return CookieLookup{std::nullopt, true};
    }
  }

  std::optional<tokens::AntiforgeryToken> Antiforgery::new_cookie_token_if_invalid(
      const std::optional<tokens::AntiforgeryToken> &cookie_token) const
  {
    if (generator_->is_cookie_token_valid(cookie_token))
      return std::nullopt;

    tokens::AntiforgeryToken fresh = generator_->generate_cookie_token();
    if (!generator_->is_cookie_token_valid(fresh))
      throw std::logic_error("token generator produced a cookie token it does not accept");
    return fresh;
  }

  Antiforgery::IssuedTokens Antiforgery::issue(Context &ctx) const
  {
    CookieLookup existing = lookup_cookie_token(ctx);
    std::optional<tokens::AntiforgeryToken> fresh = new_cookie_token_if_invalid(existing.token);

    if (!fresh && !existing.token)
      throw std::logic_error("token generator accepted an absent cookie token");

    const bool is_new = fresh.has_value();
    tokens::AntiforgeryToken cookie_token = is_new ? std::move(*fresh) : std::move(*existing.token);
    tokens::AntiforgeryToken request_token = generator_->generate_request_token(ctx, cookie_token);

    return IssuedTokens{std::move(cookie_token), std::move(request_token), is_new};
  }

  void Antiforgery::save_cookie_token_and_header(
      Context &ctx,
      const std::optional<tokens::AntiforgeryToken> &new_cookie_token) const
  {
    if (new_cookie_token)
    {
      store_->save_cookie_token(ctx, *new_cookie_token);
      basics::log(ctx, LogLevel::Info, "issued a new cookie token");
    }

    // Clickjacking: forms carrying tokens must not be framed by other origins.
    if (!options_.suppress_x_frame_options_header)
      ctx.res().header("X-Frame-Options", "SAMEORIGIN");
  }

  tokens::TokenSet Antiforgery::serialize(const IssuedTokens &issued) const
  {
    tokens::TokenSet set;
    set.request_token = serializer_->serialize(issued.request_token);
    set.cookie_token = serializer_->serialize(issued.cookie_token);
    set.form_field_name = options_.form_field_name;
    set.header_name = options_.header_name;
    return set;
  }

  tokens::TokenSet Antiforgery::get_and_store_tokens(Context &ctx) const
  {
    check_ssl(ctx);

    IssuedTokens issued = issue(ctx);
    if (issued.is_new_cookie_token)
      save_cookie_token_and_header(ctx, issued.cookie_token);

    return serialize(issued);
  }

  tokens::TokenSet Antiforgery::get_tokens(Context &ctx) const
  {
    check_ssl(ctx);
    return serialize(issue(ctx));
  }

  void Antiforgery::set_cookie_token_and_header(Context &ctx) const
  {
    check_ssl(ctx);

    CookieLookup existing = lookup_cookie_token(ctx);
    save_cookie_token_and_header(ctx, new_cookie_token_if_invalid(existing.token));
  }

  Result<void> Antiforgery::validate_deserialized(Context &ctx,
                                                  std::string_view cookie_token,
                                                  std::string_view request_token) const
  {
    std::optional<tokens::AntiforgeryToken> cookie;
    std::optional<tokens::AntiforgeryToken> request;
    try
    {
      cookie = serializer_->deserialize(cookie_token);
      request = serializer_->deserialize(request_token);
    }
    catch (const MalformedTokenError &e)
    {
      return fail(validation_failed(e.what()));
    }

    return generator_->validate_token_set(ctx, *cookie, *request);
  }

  bool Antiforgery::is_request_valid(Context &ctx) const
  {
    check_ssl(ctx);

    const store::RequestTokens found = store_->get_request_tokens(ctx);
    if (!found.cookie_token || !found.request_token)
      return false;

    return validate_deserialized(ctx, *found.cookie_token, *found.request_token).is_ok();
  }

  Result<void> Antiforgery::validate_request(Context &ctx) const
  {
    check_ssl(ctx);

    const store::RequestTokens found = store_->get_request_tokens(ctx);

    Result<void> r = ok();
    if (!found.cookie_token)
    {
      r = fail(validation_failed(messages::cookie_token_required(options_.cookie_name)));
    }
    else if (!found.request_token)
    {
      if (!options_.header_name)
        r = fail(validation_failed(messages::form_field_required(options_.form_field_name)));
      else if (!http::has_form_content_type(ctx.req()))
        r = fail(validation_failed(messages::header_required(*options_.header_name)));
      else
        r = fail(validation_failed(messages::field_or_header_required(options_.form_field_name,
                                                                      *options_.header_name)));
    }
    else
    {
      r = validate_deserialized(ctx, *found.cookie_token, *found.request_token);
    }

    if (r.is_err())
      basics::log(ctx, LogLevel::Warn, "request rejected: " + r.error().message);
    return r;
  }

  Result<void> Antiforgery::validate_tokens(Context &ctx,
                                            std::string_view cookie_token,
                                            std::string_view request_token) const
  {
    check_ssl(ctx);

    if (cookie_token.empty())
      throw std::invalid_argument(messages::cookie_token_must_be_provided);
    if (request_token.empty())
      throw std::invalid_argument(messages::request_token_must_be_provided);

    return validate_deserialized(ctx, cookie_token, request_token);
  }

  Result<void> Antiforgery::validate_tokens(Context &ctx, const tokens::TokenSet &token_set) const
  {
    return validate_tokens(ctx, token_set.cookie_token, token_set.request_token);
  }

  std::shared_ptr<Antiforgery> make_antiforgery(
      AntiforgeryOptions options,
      std::string signing_key,
      std::shared_ptr<const tokens::IAdditionalDataProvider> additional_data)
  {
    validate_options(options);

    auto serializer = std::make_shared<tokens::DefaultTokenSerializer>(std::move(signing_key));
    auto generator = std::make_shared<tokens::DefaultTokenGenerator>(
        options.identity_binding,
        options.suppress_identity_heuristic_checks,
        std::move(additional_data));
    auto token_store = std::make_shared<store::DefaultTokenStore>(options, serializer);

    return std::make_shared<Antiforgery>(std::move(options),
                                         std::move(generator),
                                         std::move(serializer),
                                         std::move(token_store));
  }

} // namespace antiforgery
