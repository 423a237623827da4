#include <cassert>
#include <iostream>

#include <antiforgery/tokens/identity.hpp>
#include <antiforgery/tokens/token.hpp>

using namespace antiforgery::tokens;

static Identity make_identity(std::vector<Claim> claims)
{
  Identity id;
  id.authenticated = true;
  id.authentication_type = "Bearer";
  id.claims = std::move(claims);
  return id;
}

int main()
{
  // no claims -> no uid
  {
    Identity id = make_identity({});
    id.name = "alice";
    assert(!extract_claim_uid(id).has_value());
  }

  // digest is 256 bits and deterministic
  {
    auto a = extract_claim_uid(make_identity({{"sub", "42"}}));
    auto b = extract_claim_uid(make_identity({{"sub", "42"}}));
    assert(a && b);
    assert(a->bit_length() == claim_uid_bits);
    assert(*a == *b);
    assert(a->to_hex().size() == 64);
  }

  // "sub" decides on its own, other claims are ignored
  {
    auto a = extract_claim_uid(make_identity({{"role", "admin"}, {"sub", "42"}}));
    auto b = extract_claim_uid(make_identity({{"sub", "42"}, {"email", "x@example.com"}}));
    assert(*a == *b);

    auto other = extract_claim_uid(make_identity({{"sub", "43"}}));
    assert(*a != *other);
  }

  // without a preferred claim, order does not matter but content does
  {
    auto a = extract_claim_uid(make_identity({{"email", "x@example.com"}, {"tenant", "t1"}}));
    auto b = extract_claim_uid(make_identity({{"tenant", "t1"}, {"email", "x@example.com"}}));
    auto c = extract_claim_uid(make_identity({{"tenant", "t2"}, {"email", "x@example.com"}}));
    assert(*a == *b);
    assert(*a != *c);
  }

  // field boundaries are length prefixed: ("ab","c") != ("a","bc")
  {
    auto a = extract_claim_uid(make_identity({{"ab", "c"}}));
    auto b = extract_claim_uid(make_identity({{"a", "bc"}}));
    assert(*a != *b);
  }

  std::cout << "[OK] claim uid\n";
  return 0;
}
