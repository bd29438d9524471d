#include "server.hpp"

#include <boost/asio/dispatch.hpp>
#include <boost/asio/strand.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <boost/beast/version.hpp>

#include <array>
#include <chrono>
#include <memory>
#include <optional>
#include <stdexcept>

#include "internal/observability/logging.hpp"
#include "internal/util/text.hpp"

namespace chatrelay::http {

namespace beast = boost::beast;
namespace bhttp = beast::http;
namespace net   = boost::asio;
using tcp       = net::ip::tcp;

namespace {

constexpr auto kReadTimeout  = std::chrono::seconds(30);
constexpr auto kDrainTimeout = std::chrono::seconds(2);

std::pair<std::string, std::string> SplitHostPort(const std::string& bind_address) {
  const auto colon = bind_address.rfind(':');
  if (colon == std::string::npos) {
    throw std::runtime_error("bind address must be host:port: " + bind_address);
  }
  std::string host = bind_address.substr(0, colon);
  if (host.empty()) host = "0.0.0.0";
  if (host.size() > 2 && host.front() == '[' && host.back() == ']') host = host.substr(1, host.size() - 2);
  return {host, bind_address.substr(colon + 1)};
}

class Session : public std::enable_shared_from_this<Session> {
 public:
  Session(tcp::socket&& socket, const Handler& handler, std::uint64_t body_limit)
      : stream_(std::move(socket)), handler_(handler), body_limit_(body_limit) {
  }

  void Run() {
    net::dispatch(stream_.get_executor(), beast::bind_front_handler(&Session::DoRead, shared_from_this()));
  }

 private:
  void DoRead() {
    parser_.emplace();
    parser_->body_limit(body_limit_);
    stream_.expires_after(kReadTimeout);
    bhttp::async_read_header(stream_, buffer_, *parser_, beast::bind_front_handler(&Session::OnHeader, shared_from_this()));
  }

  void OnHeader(beast::error_code ec, std::size_t) {
    if (ec == bhttp::error::end_of_stream) return DoClose();
    if (ec) return;

    const auto declared = parser_->content_length();
    if (declared && *declared > body_limit_) {
      unread_body_ = true;
      return Respond(BuildRequest(true), true);
    }
    bhttp::async_read(stream_, buffer_, *parser_, beast::bind_front_handler(&Session::OnBody, shared_from_this()));
  }

  void OnBody(beast::error_code ec, std::size_t) {
    if (ec == bhttp::error::body_limit) {
      unread_body_ = true;
      return Respond(BuildRequest(true), true);
    }
    if (ec) return;
    Respond(BuildRequest(false), !parser_->get().keep_alive());
  }

  Request BuildRequest(bool too_large) {
    const auto& msg = parser_->get();

    Request request;
    request.method = std::string(msg.method_string());
    request.target = std::string(msg.target());
    for (const auto& field : msg) {
      request.headers[util::ToLower(std::string(field.name_string()))] = std::string(field.value());
    }
    if (auto length = parser_->content_length()) request.content_length = *length;
    request.body_too_large = too_large;
    if (!too_large) request.body = msg.body();
    return request;
  }

  Response Invoke(const Request& request) {
    try {
      return handler_(request);
    } catch (const std::exception& e) {
      CHATRELAY_LOG_ERROR("http_handler_failed", {observability::StringField("path", request.Path()), observability::StringField("error", e.what())});
      return Response::Json(500, R"({"success":false,"message":"internal error"})");
    }
  }

  void Respond(const Request& request, bool close) {
    Response response = Invoke(request);

    auto msg = std::make_shared<bhttp::response<bhttp::string_body>>(static_cast<bhttp::status>(response.status), parser_->get().version());
    msg->set(bhttp::field::server, BOOST_BEAST_VERSION_STRING);
    msg->set(bhttp::field::content_type, response.content_type);
    for (const auto& [name, value] : response.headers) msg->set(name, value);
    msg->keep_alive(!close);
    msg->body() = std::move(response.body);
    msg->prepare_payload();

    bhttp::async_write(stream_, *msg, [self = shared_from_this(), msg, close](beast::error_code ec, std::size_t) {
      if (ec) return;
      if (close) return self->DoClose();
      self->DoRead();
    });
  }

  void DoClose() {
    beast::error_code ec;
    stream_.socket().shutdown(tcp::socket::shutdown_send, ec);
    if (unread_body_) DoDrain();
  }

  // Discards the rest of a rejected body until the peer closes, so the
  // close does not reset the connection before the response is read.
  void DoDrain() {
    stream_.expires_after(kDrainTimeout);
    stream_.async_read_some(net::buffer(drain_), [self = shared_from_this()](beast::error_code ec, std::size_t) {
      if (ec) return;
      self->DoDrain();
    });
  }

  beast::tcp_stream  stream_;
  beast::flat_buffer buffer_;
  const Handler&     handler_;
  std::uint64_t      body_limit_;

  std::optional<bhttp::request_parser<bhttp::string_body>> parser_;

  bool                   unread_body_ = false;
  std::array<char, 4096> drain_{};
};

} // namespace

Server::Server(std::string bind_address, Handler handler, ServerOptions options)
    : bind_address_(std::move(bind_address)), handler_(std::move(handler)), options_(options), acceptor_(net::make_strand(ioc_)) {
}

Server::~Server() {
  Stop();
}

void Server::Start() {
  auto [host, port] = SplitHostPort(bind_address_);

  beast::error_code ec;
  tcp::resolver     resolver(ioc_);
  auto              results = resolver.resolve(host, port, tcp::resolver::passive, ec);
  if (ec || results.empty()) {
    throw std::runtime_error("cannot resolve " + bind_address_ + ": " + ec.message());
  }
  const tcp::endpoint endpoint = results.begin()->endpoint();

  acceptor_.open(endpoint.protocol(), ec);
  if (!ec) acceptor_.set_option(net::socket_base::reuse_address(true), ec);
  if (!ec) acceptor_.bind(endpoint, ec);
  if (!ec) acceptor_.listen(net::socket_base::max_listen_connections, ec);
  if (ec) {
    throw std::runtime_error("cannot listen on " + bind_address_ + ": " + ec.message());
  }

  DoAccept();

  running_           = true;
  const auto threads = options_.threads == 0 ? 1u : options_.threads;
  threads_.reserve(threads);
  for (unsigned i = 0; i < threads; ++i) {
    threads_.emplace_back([this] { ioc_.run(); });
  }

  CHATRELAY_LOG_INFO("http_listening", {observability::StringField("addr", bind_address_), observability::IntField("port", Port())});
}

void Server::DoAccept() {
  acceptor_.async_accept(net::make_strand(ioc_), [this](beast::error_code ec, tcp::socket socket) {
    if (ec == net::error::operation_aborted) return;
    if (!ec) {
      std::make_shared<Session>(std::move(socket), handler_, options_.body_limit_bytes)->Run();
    }
    if (acceptor_.is_open()) DoAccept();
  });
}

void Server::Stop() {
  if (!running_) return;
  running_ = false;

  ioc_.stop();
  for (auto& t : threads_) {
    if (t.joinable()) t.join();
  }
  threads_.clear();

  beast::error_code ec;
  acceptor_.close(ec);
}

std::uint16_t Server::Port() const {
  beast::error_code ec;
  auto              endpoint = acceptor_.local_endpoint(ec);
  return ec ? 0 : endpoint.port();
}

} // namespace chatrelay::http
