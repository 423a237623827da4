/**
 *
 *  @file transport.hpp
 *  @author Gaspard Kirira
 *
 *  Copyright 2025, Gaspard Kirira.  All rights reserved.
 *  https://github.com/vixcpp/vix
 *  Use of this source code is governed by a MIT license
 *  that can be found in the License file.
 *
 *  Vix.cpp
 */
#ifndef ANTIFORGERY_HTTP_TRANSPORT_HPP
#define ANTIFORGERY_HTTP_TRANSPORT_HPP

#include <cctype>
#include <string>
#include <string_view>

#include <antiforgery/middleware.hpp>

namespace antiforgery::http
{
  /**
   * @brief Lowercase copy (ASCII only).
   */
  inline std::string to_lower(std::string s)
  {
    for (char &c : s)
      c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    return s;
  }

  /**
   * @brief Extract the first comma separated token, trimmed.
   *
   * Proxies append to X-Forwarded-Proto; the first entry describes the hop
   * closest to the client.
   */
  inline std::string first_token(std::string_view v)
  {
    auto comma = v.find(',');
    if (comma != std::string_view::npos)
      v = v.substr(0, comma);
    while (!v.empty() && (v.front() == ' ' || v.front() == '\t'))
      v.remove_prefix(1);
    while (!v.empty() && (v.back() == ' ' || v.back() == '\t'))
      v.remove_suffix(1);
    return std::string(v);
  }

  /**
   * @brief Whether the exchange arrived over HTTPS.
   *
   * TLS is terminated in front of the application, so the scheme is taken
   * from "X-Forwarded-Proto" or the RFC 7239 "Forwarded: proto=" parameter.
   *
   * @param req Incoming request.
   * @return true when a proxy reported https.
   */
  inline bool is_https(const Request &req)
  {
    const std::string xfp = req.header("x-forwarded-proto");
    if (!xfp.empty())
      return to_lower(first_token(xfp)) == "https";

    // for=192.0.2.60;proto=https;by=203.0.113.43
    const std::string hop = to_lower(first_token(req.header("forwarded")));
    std::string_view rest(hop);
    while (!rest.empty())
    {
      const auto semi = rest.find(';');
      std::string_view pair = rest.substr(0, semi);
      rest = semi == std::string_view::npos ? std::string_view{} : rest.substr(semi + 1);

      const auto eq = pair.find('=');
      if (eq == std::string_view::npos || first_token(pair.substr(0, eq)) != "proto")
        continue;

      std::string value = first_token(pair.substr(eq + 1));
      if (value.size() >= 2 && value.front() == '"' && value.back() == '"')
        value = value.substr(1, value.size() - 2);
      return value == "https";
    }
    return false;
  }

} // namespace antiforgery::http

#endif // ANTIFORGERY_HTTP_TRANSPORT_HPP
