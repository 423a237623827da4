#include <cassert>
#include <iostream>
#include <memory>
#include <stdexcept>
#include <string>

#include <boost/beast/http.hpp>

#include <antiforgery/core/errors.hpp>
#include <antiforgery/middleware.hpp>
#include <antiforgery/tokens/identity.hpp>
#include <antiforgery/tokens/token_generator.hpp>

using namespace antiforgery;
using namespace antiforgery::tokens;

namespace bhttp = boost::beast::http;

// Owns everything a Context points to.
struct Exchange
{
  Exchange()
      : raw(bhttp::verb::post, "/submit", 11), req(raw, {}), w(res), ctx(req, w, services)
  {
  }

  vix::vhttp::RawRequest raw;
  bhttp::response<bhttp::string_body> res;
  vix::vhttp::Request req;
  vix::vhttp::ResponseWrapper w;
  Services services;
  Context ctx;

  void sign_in(Identity id)
  {
    ctx.set_state<Identity>(std::move(id));
  }
};

static Identity claims_user(const std::string &sub)
{
  Identity id;
  id.authenticated = true;
  id.authentication_type = "Bearer";
  id.name = sub;
  id.claims = {{"sub", sub}};
  return id;
}

static Identity named_user(const std::string &name)
{
  Identity id;
  id.authenticated = true;
  id.authentication_type = "Cookies";
  id.name = name;
  return id;
}

class TenantData final : public IAdditionalDataProvider
{
public:
  std::string get_additional_data(const Context &) const override { return "tenant=7"; }
  bool validate_additional_data(const Context &, std::string_view data) const override { return data == "tenant=7"; }
};

static void test_cookie_tokens()
{
  DefaultTokenGenerator gen(true, false);

  AntiforgeryToken a = gen.generate_cookie_token();
  AntiforgeryToken b = gen.generate_cookie_token();
  assert(gen.is_cookie_token_valid(a));
  assert(a.is_cookie_token);
  assert(a.security_token.bit_length() == security_token_bits);
  assert(a.security_token != b.security_token);

  assert(!gen.is_cookie_token_valid(std::nullopt));

  Exchange ex;
  AntiforgeryToken request = gen.generate_request_token(ex.ctx, a);
  assert(!gen.is_cookie_token_valid(request));

  std::cout << "[OK] cookie tokens\n";
}

static void test_anonymous_pair()
{
  DefaultTokenGenerator gen(true, false);
  Exchange ex;

  AntiforgeryToken cookie = gen.generate_cookie_token();
  AntiforgeryToken request = gen.generate_request_token(ex.ctx, cookie);
  assert(!request.is_cookie_token);
  assert(request.security_token == cookie.security_token);
  assert(!request.claim_uid && request.username.empty());

  assert(gen.validate_token_set(ex.ctx, cookie, request).is_ok());

  // request tokens are reusable while the cookie token lives
  assert(gen.validate_token_set(ex.ctx, cookie, gen.generate_request_token(ex.ctx, cookie)).is_ok());

  bool thrown = false;
  try
  {
    (void)gen.generate_request_token(ex.ctx, request);
  }
  catch (const std::invalid_argument &)
  {
    thrown = true;
  }
  assert(thrown);

  std::cout << "[OK] anonymous pair\n";
}

static void test_rejections_in_order()
{
  DefaultTokenGenerator gen(true, false);
  Exchange ex;

  AntiforgeryToken cookie = gen.generate_cookie_token();
  AntiforgeryToken request = gen.generate_request_token(ex.ctx, cookie);

  auto swapped = gen.validate_token_set(ex.ctx, request, cookie);
  assert(swapped.is_err());
  assert(swapped.error().message == messages::tokens_swapped);
  assert(is_validation_failure(swapped.error()));

  AntiforgeryToken other_cookie = gen.generate_cookie_token();
  auto mismatch = gen.validate_token_set(ex.ctx, other_cookie, request);
  assert(mismatch.is_err());
  assert(mismatch.error().message == messages::security_token_mismatch);

  std::cout << "[OK] swapped / mismatch\n";
}

static void test_claims_identity_binding()
{
  DefaultTokenGenerator gen(true, false);

  Exchange issued_to_a;
  issued_to_a.sign_in(claims_user("a"));

  AntiforgeryToken cookie = gen.generate_cookie_token();
  AntiforgeryToken request = gen.generate_request_token(issued_to_a.ctx, cookie);
  assert(request.claim_uid.has_value());
  assert(request.username.empty());

  assert(gen.validate_token_set(issued_to_a.ctx, cookie, request).is_ok());

  Exchange as_b;
  as_b.sign_in(claims_user("b"));
  auto r = gen.validate_token_set(as_b.ctx, cookie, request);
  assert(r.is_err());
  assert(r.error().message == messages::claim_uid_mismatch);

  // signed out: the claims bound token no longer applies
  Exchange anonymous;
  r = gen.validate_token_set(anonymous.ctx, cookie, request);
  assert(r.is_err());
  assert(r.error().message == messages::claim_uid_mismatch);

  std::cout << "[OK] claims identity binding\n";
}

static void test_username_binding()
{
  DefaultTokenGenerator gen(true, false);

  Exchange as_alice;
  as_alice.sign_in(named_user("Alice"));

  AntiforgeryToken cookie = gen.generate_cookie_token();
  AntiforgeryToken request = gen.generate_request_token(as_alice.ctx, cookie);
  assert(!request.claim_uid);
  assert(request.username == "Alice");

  Exchange as_alice_lower;
  as_alice_lower.sign_in(named_user("alice"));
  assert(gen.validate_token_set(as_alice_lower.ctx, cookie, request).is_ok());

  Exchange as_bob;
  as_bob.sign_in(named_user("bob"));
  auto r = gen.validate_token_set(as_bob.ctx, cookie, request);
  assert(r.is_err());
  assert(r.error().message == messages::username_mismatch("Alice", "bob"));

  // token minted before login must not be accepted after it
  Exchange anonymous;
  AntiforgeryToken pre_login = gen.generate_request_token(anonymous.ctx, cookie);
  r = gen.validate_token_set(as_bob.ctx, cookie, pre_login);
  assert(r.is_err());
  assert(r.error().message == messages::username_mismatch("", "bob"));

  // URI user names compare case sensitively
  Exchange as_uri;
  as_uri.sign_in(named_user("https://id.example.com/Alice"));
  AntiforgeryToken uri_bound = gen.generate_request_token(as_uri.ctx, cookie);
  Exchange as_uri_lower;
  as_uri_lower.sign_in(named_user("https://id.example.com/alice"));
  assert(gen.validate_token_set(as_uri_lower.ctx, cookie, uri_bound).is_err());

  Exchange as_http_upper;
  as_http_upper.sign_in(named_user("http://Example/alice"));
  AntiforgeryToken http_bound = gen.generate_request_token(as_http_upper.ctx, cookie);
  assert(gen.validate_token_set(as_http_upper.ctx, cookie, http_bound).is_ok());

  Exchange as_http_lower;
  as_http_lower.sign_in(named_user("http://example/alice"));
  r = gen.validate_token_set(as_http_lower.ctx, cookie, http_bound);
  assert(r.is_err());
  assert(r.error().message == messages::username_mismatch("http://Example/alice", "http://example/alice"));

  // plain names keep comparing case insensitively
  assert(gen.validate_token_set(as_alice_lower.ctx, cookie, request).is_ok());

  std::cout << "[OK] username binding\n";
}

static void test_binding_disabled()
{
  DefaultTokenGenerator gen(false, false);

  Exchange as_a;
  as_a.sign_in(claims_user("a"));

  AntiforgeryToken cookie = gen.generate_cookie_token();
  AntiforgeryToken request = gen.generate_request_token(as_a.ctx, cookie);
  assert(!request.claim_uid);
  assert(request.username.empty());

  Exchange as_b;
  as_b.sign_in(claims_user("b"));
  assert(gen.validate_token_set(as_b.ctx, cookie, request).is_ok());

  std::cout << "[OK] identity binding disabled\n";
}

static void test_nameless_identity()
{
  Identity ghost;
  ghost.authenticated = true;
  ghost.authentication_type = "Custom";

  Exchange ex;
  ex.sign_in(ghost);

  DefaultTokenGenerator strict(true, false);
  AntiforgeryToken cookie = strict.generate_cookie_token();

  bool thrown = false;
  try
  {
    (void)strict.generate_request_token(ex.ctx, cookie);
  }
  catch (const ConfigurationError &e)
  {
    thrown = true;
    assert(e.setting() == "AntiforgeryOptions.suppress_identity_heuristic_checks");
    assert(std::string(e.what()).find("Custom") != std::string::npos);
  }
  assert(thrown);

  DefaultTokenGenerator relaxed(true, true);
  AntiforgeryToken request = relaxed.generate_request_token(ex.ctx, cookie);
  assert(relaxed.validate_token_set(ex.ctx, cookie, request).is_ok());

  std::cout << "[OK] nameless identity heuristic\n";
}

static void test_additional_data()
{
  auto provider = std::make_shared<TenantData>();
  DefaultTokenGenerator gen(true, false, provider);
  Exchange ex;

  AntiforgeryToken cookie = gen.generate_cookie_token();
  AntiforgeryToken request = gen.generate_request_token(ex.ctx, cookie);
  assert(request.additional_data == "tenant=7");
  assert(gen.validate_token_set(ex.ctx, cookie, request).is_ok());

  request.additional_data = "tenant=8";
  auto r = gen.validate_token_set(ex.ctx, cookie, request);
  assert(r.is_err());
  assert(r.error().message == messages::additional_data_check_failed);

  std::cout << "[OK] additional data\n";
}

int main()
{
  test_cookie_tokens();
  test_anonymous_pair();
  test_rejections_in_order();
  test_claims_identity_binding();
  test_username_binding();
  test_binding_disabled();
  test_nameless_identity();
  test_additional_data();

  std::cout << "OK: token generator smoke tests passed\n";
  return 0;
}
