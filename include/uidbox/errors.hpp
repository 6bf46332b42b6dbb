/*

errors.hpp
----------

Copyright (C) 2016, Tomislav Karastojkovic (http://www.alepho.com).

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

*/


#pragma once

#include <stdexcept>
#include <string>
#include "export.hpp"


namespace uidbox
{


/**
Base of all errors raised by the mailbox layer.

Like the transport errors, it carries a short message and the details such as the server response which caused it.
**/
class UIDBOX_EXPORT mailbox_error : public std::runtime_error
{
public:

    /**
    Calling parent constructor and storing the details.

    @param msg     Error message.
    @param details Detailed message.
    **/
    mailbox_error(const std::string& msg, const std::string& details);

    /**
    Calling parent constructor and storing the details.

    @param msg     Error message.
    @param details Detailed message.
    **/
    mailbox_error(const char* msg, const std::string& details);

    mailbox_error(const mailbox_error&) = default;

    mailbox_error(mailbox_error&&) = default;

    ~mailbox_error() = default;

    mailbox_error& operator=(const mailbox_error&) = default;

    mailbox_error& operator=(mailbox_error&&) = default;

    /**
    Getting the detailed message.

    @return Detailed message.
    **/
    std::string details() const;

protected:

    /**
    Detailed message.
    **/
    std::string details_;
};


/**
The session reported a non-OK status for a request.
**/
class UIDBOX_EXPORT protocol_error : public mailbox_error
{
public:

    using mailbox_error::mailbox_error;
};


/**
One flag of a multi-flag store failed; the flags before it remain applied.
**/
class UIDBOX_EXPORT flag_error : public protocol_error
{
public:

    /**
    @param msg     Error message.
    @param details Detailed message.
    @param flag    Flag whose store request failed.
    **/
    flag_error(const std::string& msg, const std::string& details, const std::string& flag);

    /**
    Getting the flag which failed.

    @return Flag token.
    **/
    const std::string& flag() const;

private:

    std::string flag_;
};


/**
The requested UID does not exist at the time of the call.
**/
class UIDBOX_EXPORT no_such_message_error : public mailbox_error
{
public:

    using mailbox_error::mailbox_error;
};


/**
An OK response whose payload could not be parsed into the expected shape.
**/
class UIDBOX_EXPORT malformed_response_error : public mailbox_error
{
public:

    using mailbox_error::mailbox_error;
};


/**
Search response which is not a list of message numbers.
**/
class UIDBOX_EXPORT parse_error : public malformed_response_error
{
public:

    using malformed_response_error::malformed_response_error;
};


/**
The operation has no equivalent in the protocol.
**/
class UIDBOX_EXPORT unsupported_operation_error : public mailbox_error
{
public:

    using mailbox_error::mailbox_error;
};


/**
A copy or move target of a kind which cannot be interpreted.
**/
class UIDBOX_EXPORT unsupported_target_error : public mailbox_error
{
public:

    using mailbox_error::mailbox_error;
};


/**
Popping an item from a mailbox without messages.
**/
class UIDBOX_EXPORT empty_mailbox_error : public mailbox_error
{
public:

    using mailbox_error::mailbox_error;
};


/**
Selecting a folder which does not exist on the server.
**/
class UIDBOX_EXPORT no_such_folder_error : public mailbox_error
{
public:

    using mailbox_error::mailbox_error;
};


} // namespace uidbox
