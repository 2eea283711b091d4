#include "verifier.hpp"

#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>

#include <vector>

namespace mh {

namespace beast = boost::beast;
namespace http = beast::http;
namespace net = boost::asio;
using tcp = net::ip::tcp;

VerificationResult verify_endpoint(const ServiceAddress& address,
                                   const std::string& scheme,
                                   const std::string& path,
                                   std::chrono::milliseconds timeout) {
  VerificationResult result;
  result.url = address.url(scheme, path);

  if (scheme != "http") {
    result.error_message = "unsupported scheme '" + scheme + "'";
    return result;
  }

  net::io_context ioc;
  tcp::resolver resolver(ioc);
  beast::tcp_stream stream(ioc);

  // A literal address needs no lookup. A hostname goes through the system
  // resolver, which runs on its own timeouts (resolv.conf), not this one.
  std::vector<tcp::endpoint> endpoints;
  beast::error_code ec;
  auto literal = net::ip::make_address(address.host, ec);
  if (!ec) {
    endpoints.emplace_back(literal, address.port);
  } else {
    ec.clear();
    auto results = resolver.resolve(address.host, std::to_string(address.port), ec);
    if (ec) {
      result.error_message = "GET " + result.url + ": resolve failed: " + ec.message();
      return result;
    }
    for (const auto& entry : results) {
      endpoints.push_back(entry.endpoint());
    }
  }

  http::request<http::empty_body> req{http::verb::get, path, 11};
  req.set(http::field::host, address.authority());
  req.set(http::field::user_agent, "midi-harness");
  req.set(http::field::connection, "close");

  beast::flat_buffer buffer;
  http::response<http::string_body> res;
  beast::error_code failure;
  const char* stage = "connect";
  bool done = false;

  // Sync operations ignore tcp_stream timeouts, so the exchange runs as a
  // chain of async steps, each with its own expiry.
  stream.expires_after(timeout);
  stream.async_connect(endpoints, [&](beast::error_code connect_ec, const tcp::endpoint&) {
    if (connect_ec) {
      failure = connect_ec;
      return;
    }
    stage = "write";
    stream.expires_after(timeout);
    http::async_write(stream, req, [&](beast::error_code write_ec, std::size_t) {
      if (write_ec) {
        failure = write_ec;
        return;
      }
      stage = "read";
      stream.expires_after(timeout);
      http::async_read(stream, buffer, res, [&](beast::error_code read_ec, std::size_t) {
        if (read_ec) {
          failure = read_ec;
          return;
        }
        done = true;
      });
    });
  });
  ioc.run();

  beast::error_code ignored;
  stream.socket().shutdown(tcp::socket::shutdown_both, ignored);

  if (!done) {
    result.error_message = "GET " + result.url + ": " + stage + " failed: " + failure.message();
    return result;
  }

  result.transport_ok = true;
  result.status = res.result_int();
  result.body = res.body();
  if (result.status != 200) {
    result.error_message = "GET " + result.url + " returned " + std::to_string(result.status) +
                           " (expected 200)";
  }
  return result;
}

} // namespace mh
