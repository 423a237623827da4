/**
 *
 *  @file cookies.hpp
 *  @author Gaspard Kirira
 *
 *  Copyright 2025, Gaspard Kirira.  All rights reserved.
 *  https://github.com/vixcpp/vix
 *  Use of this source code is governed by a MIT license
 *  that can be found in the License file.
 *
 *  Vix.cpp
 */
#ifndef ANTIFORGERY_HTTP_COOKIES_HPP
#define ANTIFORGERY_HTTP_COOKIES_HPP

#include <optional>
#include <string>
#include <string_view>

#include <boost/beast/core/string.hpp>
#include <boost/beast/http/field.hpp>

#include <antiforgery/middleware.hpp>

namespace antiforgery::http
{
  /**
   * @brief Attributes of the cookie the token store writes. Always a session
   * cookie.
   */
  struct SetCookie
  {
    std::string name;
    std::string value;
    std::string path{"/"};
    std::string domain{};
    bool http_only{true};
    bool secure{false};
    std::string same_site{"Strict"};
  };

  inline std::string_view trim_ows(std::string_view s)
  {
    while (!s.empty() && (s.front() == ' ' || s.front() == '\t'))
      s.remove_prefix(1);
    while (!s.empty() && (s.back() == ' ' || s.back() == '\t'))
      s.remove_suffix(1);
    return s;
  }

  /**
   * @brief Value of `name` in a Cookie header ("a=1; b=2").
   *
   * Browsers send the cookie with the most specific path first, so the first
   * pair with that name wins. Pairs without '=' are ignored.
   */
  inline std::optional<std::string> find_cookie(std::string_view header, std::string_view name)
  {
    while (!header.empty())
    {
      const auto semi = header.find(';');
      const std::string_view pair = header.substr(0, semi);
      header = semi == std::string_view::npos ? std::string_view{} : header.substr(semi + 1);

      const auto eq = pair.find('=');
      if (eq == std::string_view::npos)
        continue;
      if (trim_ows(pair.substr(0, eq)) == name)
        return std::string(trim_ows(pair.substr(eq + 1)));
    }
    return std::nullopt;
  }

  inline std::optional<std::string> read_cookie(const Request &req, std::string_view name)
  {
    const std::string header = req.header("cookie");
    if (header.empty())
      return std::nullopt;
    return find_cookie(header, name);
  }

  inline std::string format_set_cookie(const SetCookie &c)
  {
    std::string out = c.name + "=" + c.value;
    if (!c.path.empty())
      out += "; Path=" + c.path;
    if (!c.domain.empty())
      out += "; Domain=" + c.domain;
    if (c.http_only)
      out += "; HttpOnly";
    if (c.secure)
      out += "; Secure";
    if (!c.same_site.empty())
      out += "; SameSite=" + c.same_site;
    return out;
  }

  // Set-Cookie may repeat, so the header is appended rather than replaced.
  inline void append_set_cookie(Response &res, const SetCookie &c)
  {
    const std::string line = format_set_cookie(c);
    res.res.insert(boost::beast::http::field::set_cookie,
                   boost::beast::string_view{line.data(), line.size()});
  }

} // namespace antiforgery::http

#endif // ANTIFORGERY_HTTP_COOKIES_HPP
