#ifndef HTTP_SERVICE_H_
#define HTTP_SERVICE_H_

#include <memory>

#include <boost/asio.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>

#include "control/control_api.h"

namespace asio = boost::asio;
using tcp = asio::ip::tcp;

class HttpService : public std::enable_shared_from_this<HttpService> {
  public:
    // Throws boost::system::system_error when the port cannot be bound.
    static std::shared_ptr<HttpService> Create(uint16_t port, std::shared_ptr<ControlApi> api);

    HttpService(uint16_t port, std::shared_ptr<ControlApi> api);
    ~HttpService();

    // Blocks until Disconnect() is called.
    void Connect();
    void Disconnect();

    uint16_t port() const;
    asio::io_context &io_context();
    std::shared_ptr<ControlApi> api() const;

  private:
    asio::io_context ioc_;
    tcp::acceptor acceptor_;
    std::shared_ptr<ControlApi> api_;

    void AcceptConnection();
};

class HttpSession : public std::enable_shared_from_this<HttpSession> {
  public:
    static std::shared_ptr<HttpSession> Create(tcp::socket socket,
                                               std::shared_ptr<HttpService> http_service);

    HttpSession(tcp::socket socket, std::shared_ptr<HttpService> http_service);
    ~HttpSession();

    void Start() { ReadRequest(); }

  private:
    static const size_t kBodyLimit = 64 * 1024;

    beast::tcp_stream stream_;
    beast::flat_buffer buffer_;
    std::shared_ptr<HttpService> http_service_;
    std::unique_ptr<http::request_parser<http::string_body>> parser_;
    std::shared_ptr<ControlApi::Response> res_;

    void ReadRequest();
    void WriteResponse(bool keep_alive);
    void CloseConnection();
};

#endif // HTTP_SERVICE_H_
