#include "control/http_service.h"

#include <chrono>

#include "common/logging.h"

std::shared_ptr<HttpService> HttpService::Create(uint16_t port, std::shared_ptr<ControlApi> api) {
    return std::make_shared<HttpService>(port, api);
}

HttpService::HttpService(uint16_t port, std::shared_ptr<ControlApi> api)
    : acceptor_(ioc_, {asio::ip::address_v6::any(), port}),
      api_(api) {}

HttpService::~HttpService() {}

uint16_t HttpService::port() const { return acceptor_.local_endpoint().port(); }

asio::io_context &HttpService::io_context() { return ioc_; }

std::shared_ptr<ControlApi> HttpService::api() const { return api_; }

void HttpService::Connect() {
    INFO_PRINT("Control service is running on http://*:%d", port());
    AcceptConnection();
    ioc_.run();
}

void HttpService::Disconnect() {
    asio::post(ioc_, [self = shared_from_this()]() {
        beast::error_code ec;
        self->acceptor_.close(ec);
        self->ioc_.stop();
    });
}

void HttpService::AcceptConnection() {
    acceptor_.async_accept([self = shared_from_this()](beast::error_code ec, tcp::socket socket) {
        if (ec == asio::error::operation_aborted) {
            return;
        }
        if (!ec) {
            HttpSession::Create(std::move(socket), self)->Start();
        } else {
            ERROR_PRINT("Accept error: %s", ec.message().c_str());
        }
        self->AcceptConnection();
    });
}

std::shared_ptr<HttpSession> HttpSession::Create(tcp::socket socket,
                                                 std::shared_ptr<HttpService> http_service) {
    return std::make_shared<HttpSession>(std::move(socket), http_service);
}

HttpSession::HttpSession(tcp::socket socket, std::shared_ptr<HttpService> http_service)
    : stream_(std::move(socket)),
      http_service_(http_service) {}

HttpSession::~HttpSession() {}

void HttpSession::ReadRequest() {
    parser_ = std::make_unique<http::request_parser<http::string_body>>();
    parser_->body_limit(kBodyLimit);
    stream_.expires_after(std::chrono::seconds(30));

    auto self = shared_from_this();
    http::async_read(stream_, buffer_, *parser_,
                     [self](beast::error_code ec, std::size_t bytes_transferred) {
                         if (ec == http::error::end_of_stream) {
                             self->CloseConnection();
                             return;
                         }
                         if (ec) {
                             DEBUG_PRINT("Read error: %s", ec.message().c_str());
                             return;
                         }
                         auto req = self->parser_->release();
                         self->res_ = std::make_shared<ControlApi::Response>(
                             self->http_service_->api()->Handle(req));
                         self->WriteResponse(req.keep_alive());
                     });
}

void HttpSession::WriteResponse(bool keep_alive) {
    res_->keep_alive(keep_alive);

    auto self = shared_from_this();
    http::async_write(stream_, *res_,
                      [self, keep_alive](beast::error_code ec, std::size_t bytes_transferred) {
                          if (ec) {
                              ERROR_PRINT("Write error: %s", ec.message().c_str());
                              return;
                          }
                          if (keep_alive) {
                              self->ReadRequest();
                          } else {
                              self->CloseConnection();
                          }
                      });
}

void HttpSession::CloseConnection() {
    beast::error_code ec;
    stream_.socket().shutdown(tcp::socket::shutdown_send, ec);
    if (ec && ec != beast::errc::not_connected) {
        DEBUG_PRINT("Shutdown error: %s", ec.message().c_str());
    }
}
