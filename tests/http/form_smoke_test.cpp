#include <cassert>
#include <iostream>
#include <string>

#include <boost/beast/http.hpp>

#include <antiforgery/http/form.hpp>
#include <antiforgery/http/transport.hpp>
#include <antiforgery/middleware.hpp>

using namespace antiforgery;

static vix::vhttp::RawRequest make_req(std::string body, std::string ct)
{
    namespace http = boost::beast::http;
    vix::vhttp::RawRequest req{http::verb::post, "/form", 11};
    req.set(http::field::host, "localhost");
    if (!ct.empty())
        req.set(http::field::content_type, ct);
    req.body() = std::move(body);
    req.prepare_payload();
    return req;
}

static void test_decoding()
{
    assert(http::percent_decode("a+b%20c") == "a b c");
    assert(http::percent_decode("bad%zz") == "bad%zz");
    assert(http::percent_decode("%41%42") == "AB");
    assert(http::percent_decode("tail%4") == "tail%4");

    http::FormBody form;
    http::decode_urlencoded("a=1&b=hello+world&&flag&a=2", form);
    assert(form.fields["a"] == "1");
    assert(form.fields["b"] == "hello world");
    assert(form.fields.count("flag") == 1 && form.fields["flag"].empty());

    std::cout << "[OK] percent_decode / decode_urlencoded\n";
}

static void test_header_param()
{
    assert(http::header_param("multipart/form-data; boundary=----abc", "boundary") == std::string("----abc"));
    assert(http::header_param("multipart/form-data; Boundary=\"q x\"", "boundary") == std::string("q x"));
    assert(http::header_param("form-data; filename=\"a.png\"; name=\"f\"", "name") == std::string("f"));
    assert(!http::header_param("multipart/form-data", "boundary").has_value());

    std::cout << "[OK] header_param\n";
}

static void test_multipart_fields()
{
    std::string body;
    body += "preamble\r\n";
    body += "--B\r\n";
    body += "Content-Disposition: form-data; name=\"upload\"; filename=\"token.txt\"\r\n";
    body += "Content-Type: text/plain\r\n\r\n";
    body += "from-file\r\n";
    body += "--B\r\n";
    body += "content-disposition: form-data; name=\"__RequestVerificationToken\"\r\n\r\n";
    body += "abc-_123\r\n";
    body += "--B\r\n";
    body += "Content-Disposition: form-data; name=\"__RequestVerificationToken\"\r\n\r\n";
    body += "second\r\n";
    body += "--B--\r\n";

    http::FormBody form;
    http::decode_multipart(body, "B", form);
    assert(form.fields.size() == 1);
    assert(form.fields["__RequestVerificationToken"] == "abc-_123");
    assert(form.fields.count("upload") == 0);

    http::FormBody truncated;
    http::decode_multipart("--B\r\nContent-Disposition: form-data; name=\"x\"\r\n\r\n1", "B", truncated);
    assert(truncated.fields.empty());

    std::cout << "[OK] decode_multipart\n";
}

static void test_multipart_form_field()
{
    namespace bhttp = boost::beast::http;

    std::string body;
    body += "--zz\r\n";
    body += "Content-Disposition: form-data; name=\"__RequestVerificationToken\"\r\n\r\n";
    body += "tok\r\n";
    body += "--zz--\r\n";

    auto raw = make_req(body, "multipart/form-data; boundary=zz");
    bhttp::response<bhttp::string_body> res;
    vix::vhttp::Request req(raw, {});
    vix::vhttp::ResponseWrapper w(res);
    Services services;
    Context ctx(req, w, services);

    assert(http::form_encoding(req) == http::FormEncoding::multipart);
    assert(http::has_form_content_type(req));

    auto tok = http::form_field(ctx, "__RequestVerificationToken");
    assert(tok && *tok == "tok");

    std::cout << "[OK] multipart form_field\n";
}

static void test_form_field()
{
    namespace bhttp = boost::beast::http;

    auto raw = make_req("name=x&__RequestVerificationToken=abc-_123", "application/x-www-form-urlencoded; charset=utf-8");
    bhttp::response<bhttp::string_body> res;
    vix::vhttp::Request req(raw, {});
    vix::vhttp::ResponseWrapper w(res);
    Services services;
    Context ctx(req, w, services);

    assert(http::has_form_content_type(req));

    auto tok = http::form_field(ctx, "__RequestVerificationToken");
    assert(tok && *tok == "abc-_123");

    // parsed body is cached in request state
    assert(ctx.try_state<http::FormBody>() != nullptr);
    assert(!http::form_field(ctx, "missing").has_value());

    std::cout << "[OK] form_field\n";
}

static void test_non_form_body_has_no_fields()
{
    namespace bhttp = boost::beast::http;

    auto raw = make_req(R"({"__RequestVerificationToken":"abc"})", "application/json");
    bhttp::response<bhttp::string_body> res;
    vix::vhttp::Request req(raw, {});
    vix::vhttp::ResponseWrapper w(res);
    Services services;
    Context ctx(req, w, services);

    assert(!http::has_form_content_type(req));
    assert(!http::form_field(ctx, "__RequestVerificationToken").has_value());

    std::cout << "[OK] non form body\n";
}

static void test_is_https()
{
    {
        auto raw = make_req("", "");
        raw.set("X-Forwarded-Proto", "https, http");
        vix::vhttp::Request req(raw, {});
        assert(http::is_https(req));
    }
    {
        auto raw = make_req("", "");
        raw.set("X-Forwarded-Proto", "http");
        vix::vhttp::Request req(raw, {});
        assert(!http::is_https(req));
    }
    {
        auto raw = make_req("", "");
        raw.set("Forwarded", "for=192.0.2.60;proto=https;by=203.0.113.43");
        vix::vhttp::Request req(raw, {});
        assert(http::is_https(req));
    }
    {
        auto raw = make_req("", "");
        vix::vhttp::Request req(raw, {});
        assert(!http::is_https(req));
    }
    {
        auto raw = make_req("", "");
        raw.set("Forwarded", "for=192.0.2.60; Proto=\"https\"");
        vix::vhttp::Request req(raw, {});
        assert(http::is_https(req));
    }
    {
        // the whole value must match, not a prefix of it
        auto raw = make_req("", "");
        raw.set("Forwarded", "proto=httpsfoo;for=192.0.2.60");
        vix::vhttp::Request req(raw, {});
        assert(!http::is_https(req));
    }
    {
        // only the hop closest to the client counts
        auto raw = make_req("", "");
        raw.set("Forwarded", "for=192.0.2.60;proto=http, for=10.0.0.1;proto=https");
        vix::vhttp::Request req(raw, {});
        assert(!http::is_https(req));
    }

    std::cout << "[OK] is_https\n";
}

int main()
{
    test_decoding();
    test_header_param();
    test_multipart_fields();
    test_multipart_form_field();
    test_form_field();
    test_non_form_body_has_no_fields();
    test_is_https();

    std::cout << "OK: http form smoke tests passed\n";
    return 0;
}
