#include <antiforgery/store/token_store.hpp>
#include <antiforgery/http/cookies.hpp>
#include <antiforgery/http/form.hpp>

#include <stdexcept>
#include <utility>

namespace antiforgery::store
{
  static std::optional<std::string> non_empty(std::optional<std::string> v)
  {
    if (v && v->empty())
      return std::nullopt;
    return v;
  }

  DefaultTokenStore::DefaultTokenStore(AntiforgeryOptions options,
                                       std::shared_ptr<const tokens::ITokenSerializer> serializer)
      : options_(std::move(options)), serializer_(std::move(serializer))
  {
    if (!serializer_)
      throw std::invalid_argument("DefaultTokenStore requires a token serializer");
  }

  std::optional<tokens::AntiforgeryToken> DefaultTokenStore::get_cookie_token(Context &ctx) const
  {
    auto raw = non_empty(http::read_cookie(ctx.req(), options_.cookie_name));
    if (!raw)
      return std::nullopt;

    return serializer_->deserialize(*raw);
  }

  RequestTokens DefaultTokenStore::get_request_tokens(Context &ctx) const
  {
    RequestTokens out;
    out.cookie_token = non_empty(http::read_cookie(ctx.req(), options_.cookie_name));

    if (options_.header_name)
    {
      std::string h = ctx.req().header(*options_.header_name);
      if (!h.empty())
        out.request_token = std::move(h);
    }

    if (!out.request_token)
      out.request_token = non_empty(http::form_field(ctx, options_.form_field_name));

    return out;
  }

  void DefaultTokenStore::save_cookie_token(Context &ctx, const tokens::AntiforgeryToken &token) const
  {
    http::SetCookie c;
    c.name = options_.cookie_name;
    c.value = serializer_->serialize(token);
    c.path = options_.cookie_path.empty() ? std::string("/") : options_.cookie_path;
    c.domain = options_.cookie_domain;
    c.http_only = true;
    c.secure = options_.require_ssl;
    c.same_site = "Strict";
    http::append_set_cookie(ctx.res(), c);
  }

} // namespace antiforgery::store
