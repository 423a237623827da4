#ifndef ANTIFORGERY_TOKENS_TOKEN_SET_HPP
#define ANTIFORGERY_TOKENS_TOKEN_SET_HPP

#include <optional>
#include <string>
#include <string_view>

namespace antiforgery::tokens
{
  /**
   * @brief Serialized token pair handed to the application.
   *
   * The request token goes into the form field or header named here; the
   * cookie token is what the cookie carries.
   */
  struct TokenSet
  {
    std::string request_token;
    std::string cookie_token;
    std::string form_field_name;
    std::optional<std::string> header_name{};
  };

  inline std::string html_attribute_escape(std::string_view s)
  {
    std::string out;
    out.reserve(s.size() + 8);
    for (char c : s)
    {
      switch (c)
      {
      case '&':
        out += "&amp;";
        break;
      case '"':
        out += "&quot;";
        break;
      case '\'':
        out += "&#39;";
        break;
      case '<':
        out += "&lt;";
        break;
      case '>':
        out += "&gt;";
        break;
      default:
        out += c;
        break;
      }
    }
    return out;
  }

  // <input name="__RequestVerificationToken" type="hidden" value="..." />
  inline std::string hidden_input_html(const TokenSet &tokens)
  {
    std::string s;
    s.reserve(64 + tokens.form_field_name.size() + tokens.request_token.size());
    s += "<input name=\"";
    s += html_attribute_escape(tokens.form_field_name);
    s += "\" type=\"hidden\" value=\"";
    s += html_attribute_escape(tokens.request_token);
    s += "\" />";
    return s;
  }

} // namespace antiforgery::tokens

#endif // ANTIFORGERY_TOKENS_TOKEN_SET_HPP
