/*

dialog.hpp
----------

Copyright (C) 2016, Tomislav Karastojkovic (http://www.alepho.com).

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

*/


#pragma once

#ifdef _MSC_VER
#pragma warning(push)
#pragma warning(disable:4251)
#endif

#include <chrono>
#include <cstddef>
#include <memory>
#include <stdexcept>
#include <string>
#include <boost/asio.hpp>
#include <boost/asio/ssl.hpp>
#include "export.hpp"


namespace uidbox
{


/**
Line oriented connection to a server, over plain TCP or upgraded to TLS.

All I/O goes through an own I/O context. A dialog is used by one thread at a time.
**/
class UIDBOX_EXPORT dialog
{
public:

    /**
    SSL options to set on a connection.
    **/
    struct ssl_options_t
    {
        boost::asio::ssl::context_base::method method;

        boost::asio::ssl::verify_mode verify_mode;
    };

    /**
    Storing the connection parameters, the connection itself is made by `connect()`.

    @param hostname Server hostname.
    @param port     Server port.
    @param timeout  Network timeout of each operation, zero for none.
    **/
    dialog(const std::string& hostname, unsigned port, std::chrono::milliseconds timeout);

    /**
    Closing the connection.
    **/
    ~dialog();

    dialog(const dialog&) = delete;

    dialog(dialog&&) = delete;

    void operator=(const dialog&) = delete;

    void operator=(dialog&&) = delete;

    /**
    Resolving the host and connecting to it.

    @throw dialog_error Resolving or connecting failure, or timeout.
    **/
    void connect();

    /**
    Doing the TLS handshake over the connected socket, all subsequent I/O is encrypted.

    @param options SSL options to use.
    @throw dialog_error Handshake failure, or timeout.
    **/
    void start_tls(const ssl_options_t& options);

    /**
    Sending a line, CRLF is appended.

    @param line Line to send.
    @throw dialog_error Sending failure, or timeout.
    **/
    void send(const std::string& line);

    /**
    Receiving a line without its CRLF.

    @return Line read from network.
    @throw dialog_error Receiving failure, or timeout.
    **/
    std::string receive();

    /**
    Receiving exactly the given number of bytes, as needed for the protocol literals.

    @param total_bytes Number of bytes to read.
    @return            Bytes read.
    @throw dialog_error Receiving failure, or timeout.
    **/
    std::string receive_bytes(std::size_t total_bytes);

    /**
    Closing the socket, ignoring errors.
    **/
    void close();

    /**
    Setting the label prepended to the trace log lines.

    @param name Label, empty clears it.
    **/
    void set_session_name(const std::string& name);

private:

    /**
    Starting an asynchronous operation and running the I/O context until it completes or the timeout expires.

    @param initiate Function starting the operation with the given completion handler.
    @param failure  Error message in case of the operation failure.
    @throw dialog_error Operation failed or timed out.
    **/
    template<typename Initiate>
    void run(Initiate initiate, const char* failure);

    /**
    Calling the function with the stream currently in use, the TLS one once it is started.
    **/
    template<typename Function>
    void with_stream(Function function);

    /**
    Writing a line to the trace log, hiding the credentials of a login command.

    @param direction Either `SEND` or `RECEIVE`.
    @param line      Line which is traced.
    **/
    void trace(const char* direction, const std::string& line) const;

    std::string hostname_;

    unsigned port_;

    std::chrono::milliseconds timeout_;

    std::string session_name_;

    boost::asio::io_context ios_;

    boost::asio::ip::tcp::socket socket_;

    boost::asio::steady_timer timer_;

    bool timer_expired_;

    /**
    Bytes received past the last line read.
    **/
    boost::asio::streambuf buffer_;

    std::unique_ptr<boost::asio::ssl::context> ssl_context_;

    std::unique_ptr<boost::asio::ssl::stream<boost::asio::ip::tcp::socket&>> ssl_stream_;
};


/**
Error thrown by the network dialog.
**/
class UIDBOX_EXPORT dialog_error : public std::runtime_error
{
public:

    /**
    @param msg     Error message.
    @param details Detailed message.
    **/
    dialog_error(const std::string& msg, const std::string& details);

    /**
    @param msg     Error message.
    @param details Detailed message.
    **/
    dialog_error(const char* msg, const std::string& details);

    dialog_error(const dialog_error&) = default;

    dialog_error(dialog_error&&) = default;

    ~dialog_error() = default;

    dialog_error& operator=(const dialog_error&) = default;

    dialog_error& operator=(dialog_error&&) = default;

    /**
    Getting the detailed message.

    @return Detailed message.
    **/
    std::string details() const;

protected:

    std::string details_;
};


} // namespace uidbox


#ifdef _MSC_VER
#pragma warning(pop)
#endif
