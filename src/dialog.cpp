/*

dialog.cpp
----------

Copyright (C) 2016, Tomislav Karastojkovic (http://www.alepho.com).

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

*/


#include <algorithm>
#include <istream>
#include <string>
#include <utility>
#include <openssl/ssl.h>
#include <boost/algorithm/string/classification.hpp>
#include <boost/algorithm/string/trim.hpp>
#include <boost/regex.hpp>
#include <uidbox/dialog.hpp>
#include <uidbox/log.hpp>


using std::istream;
using std::make_unique;
using std::string;
using std::to_string;
using std::chrono::milliseconds;
using boost::asio::buffer;
using boost::asio::ip::tcp;
using boost::system::error_code;
using boost::system::system_error;
using boost::algorithm::is_any_of;
using boost::algorithm::trim_right_if;
using boost::regex;
using boost::regex_replace;

namespace ssl = boost::asio::ssl;


namespace uidbox
{


dialog::dialog(const string& hostname, unsigned port, milliseconds timeout) : hostname_(hostname), port_(port), timeout_(timeout),
    socket_(ios_), timer_(ios_), timer_expired_(false)
{
}


dialog::~dialog()
{
    close();
}


void dialog::connect()
{
    tcp::resolver::results_type endpoints;
    try
    {
        tcp::resolver resolver(ios_);
        endpoints = resolver.resolve(hostname_, to_string(port_));
    }
    catch (const system_error& exc)
    {
        throw dialog_error("Resolving server failure.", exc.code().message());
    }

    run([this, &endpoints](auto handler) { boost::asio::async_connect(socket_, endpoints, std::move(handler)); }, "Server connecting failure.");
    if (session_name_.empty())
        logger()->debug("Connected to {}:{}.", hostname_, port_);
    else
        logger()->debug("[{}] Connected to {}:{}.", session_name_, hostname_, port_);
}


void dialog::start_tls(const ssl_options_t& options)
{
    try
    {
        ssl_context_ = make_unique<ssl::context>(options.method);
        ssl_stream_ = make_unique<ssl::stream<tcp::socket&>>(socket_, *ssl_context_);
        ssl_stream_->set_verify_mode(options.verify_mode);
    }
    catch (const system_error& exc)
    {
        throw dialog_error("Switching to TLS failure.", exc.code().message());
    }
    // Servers hosting several domains pick the certificate by the name.
    SSL_set_tlsext_host_name(ssl_stream_->native_handle(), hostname_.c_str());

    run([this](auto handler) { ssl_stream_->async_handshake(ssl::stream_base::client, std::move(handler)); }, "Switching to TLS failure.");
}


void dialog::send(const string& line)
{
    trace("SEND", line);
    const string data = line + "\r\n";
    run([this, &data](auto handler)
        {
            with_stream([&data, &handler](auto& stream) { boost::asio::async_write(stream, buffer(data), std::move(handler)); });
        }, "Network sending failure.");
}


string dialog::receive()
{
    run([this](auto handler)
        {
            with_stream([this, &handler](auto& stream) { boost::asio::async_read_until(stream, buffer_, '\n', std::move(handler)); });
        }, "Network receiving failure.");

    istream input(&buffer_);
    string line;
    std::getline(input, line);
    trim_right_if(line, is_any_of("\r\n"));
    trace("RECEIVE", line);
    return line;
}


string dialog::receive_bytes(std::size_t total_bytes)
{
    string bytes(total_bytes, '\0');
    std::size_t buffered = std::min(total_bytes, buffer_.size());
    if (buffered > 0)
    {
        istream input(&buffer_);
        input.read(&bytes[0], static_cast<std::streamsize>(buffered));
    }

    if (buffered < total_bytes)
    {
        auto rest = buffer(&bytes[buffered], total_bytes - buffered);
        run([this, &rest](auto handler)
            {
                with_stream([&rest, &handler](auto& stream) { boost::asio::async_read(stream, rest, std::move(handler)); });
            }, "Network receiving failure.");
    }
    if (logger()->should_log(spdlog::level::trace))
        trace("RECEIVE", "{" + to_string(total_bytes) + " bytes}");
    return bytes;
}


void dialog::close()
{
    error_code ignored;
    if (socket_.is_open())
    {
        socket_.shutdown(tcp::socket::shutdown_both, ignored);
        socket_.close(ignored);
    }
    ssl_stream_.reset();
}


void dialog::set_session_name(const string& name)
{
    session_name_ = name;
}


/*
Cancelling the socket on the timer expiry makes the pending operation complete with an error, so the loop ends either way. The canceled
timer handler is drained before returning, so no handler outlives the call.
*/
template<typename Initiate>
void dialog::run(Initiate initiate, const char* failure)
{
    error_code result = boost::asio::error::would_block;
    initiate([&result](const error_code& error, auto&&...) { result = error; });

    timer_expired_ = false;
    if (timeout_.count() > 0)
    {
        timer_.expires_after(timeout_);
        timer_.async_wait([this](const error_code& error)
            {
                if (error)
                    return;
                timer_expired_ = true;
                error_code ignored;
                socket_.cancel(ignored);
            });
    }

    ios_.restart();
    while (result == boost::asio::error::would_block)
        ios_.run_one();
    timer_.cancel();
    ios_.restart();
    ios_.poll();

    if (timer_expired_)
        throw dialog_error(failure, "Network timeout of " + to_string(timeout_.count()) + " ms expired.");
    if (result)
        throw dialog_error(failure, result.message());
}


template<typename Function>
void dialog::with_stream(Function function)
{
    if (ssl_stream_)
        function(*ssl_stream_);
    else
        function(socket_);
}


void dialog::trace(const char* direction, const string& line) const
{
    auto log = logger();
    if (!log->should_log(spdlog::level::trace))
        return;

    static const regex LOGIN_REGEX{R"(^(\S+ LOGIN) .*$)", regex::icase};
    string shown = regex_replace(line, LOGIN_REGEX, "$1 ***");
    if (session_name_.empty())
        log->trace("{}: {}", direction, shown);
    else
        log->trace("[{}] {}: {}", session_name_, direction, shown);
}


dialog_error::dialog_error(const string& msg, const string& details) : std::runtime_error(msg), details_(details)
{
}


dialog_error::dialog_error(const char* msg, const string& details) : std::runtime_error(msg), details_(details)
{
}


string dialog_error::details() const
{
    return details_;
}


} // namespace uidbox
