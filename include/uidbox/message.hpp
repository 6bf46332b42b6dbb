/*

message.hpp
-----------

Copyright (C) 2016, Tomislav Karastojkovic (http://www.alepho.com).

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

*/


#pragma once

#ifdef _MSC_VER
#pragma warning(push)
#pragma warning(disable:4251)
#endif

#include <optional>
#include <set>
#include <string>
#include <utility>
#include <vector>
#include <boost/date_time/posix_time/posix_time.hpp>
#include "export.hpp"


namespace uidbox
{


/**
Flags of a message, system ones such as `\Seen` and keywords alike.
**/
using flag_set_t = std::set<std::string>;


/**
System flags defined by the protocol.
**/
UIDBOX_EXPORT extern const std::string FLAG_SEEN;
UIDBOX_EXPORT extern const std::string FLAG_ANSWERED;
UIDBOX_EXPORT extern const std::string FLAG_FLAGGED;
UIDBOX_EXPORT extern const std::string FLAG_DELETED;
UIDBOX_EXPORT extern const std::string FLAG_DRAFT;

/**
Set by the server only, clients cannot store or append it.
**/
UIDBOX_EXPORT extern const std::string FLAG_RECENT;


/**
Formatting flags as the parenthesized list used in the commands, as in `(\Flagged \Seen)`.

@param flags Flags to format.
@return      Flag list.
**/
UIDBOX_EXPORT std::string format_flag_list(const flag_set_t& flags);


/**
Message as the header fields and the body, without MIME decoding.
**/
class UIDBOX_EXPORT message
{
public:

    /**
    Header field as name and unfolded value.

    A header line without the colon is kept verbatim as the value of a field with the empty name, so that formatting reproduces it.
    **/
    using header_t = std::pair<std::string, std::string>;

    message() = default;

    /**
    Parsing the message from its wire format.

    @param raw Message with the header and body separated by an empty line.
    **/
    explicit message(const std::string& raw);

    /**
    Parsing the message from its wire format, replacing the current content.

    Folded header lines are joined. A message without the empty line is taken as the header only.

    @param raw Message to parse.
    **/
    void parse(const std::string& raw);

    /**
    Formatting the message to its wire format with CRLF line ends in the header.

    @return Formatted message.
    **/
    std::string format() const;

    /**
    Getting the first header field of the given name, case insensitive.

    @param name Header name.
    @return     Header value, empty if there is none.
    **/
    std::string header(const std::string& name) const;

    /**
    Checking whether a header field exists, case insensitive.

    @param name Header name.
    @return     True if at least one field exists.
    **/
    bool has_header(const std::string& name) const;

    /**
    Appending a header field.

    @param name  Header name.
    @param value Header value.
    **/
    void add_header(const std::string& name, const std::string& value);

    /**
    Removing all header fields of the given name, case insensitive.

    @param name Header name.
    **/
    void remove_header(const std::string& name);

    const std::vector<header_t>& headers() const;

    const std::string& body() const;

    void body(const std::string& content);

    std::string subject() const;

    std::string from() const;

private:

    std::vector<header_t> headers_;

    std::string body_;
};


/**
Message retrieved from a mailbox together with the server state at the time of the retrieval.
**/
struct UIDBOX_EXPORT message_view
{
    message_view() = default;

    /**
    Wrapping a message without the server state, as used for appending.

    @param msg Message content.
    **/
    explicit message_view(const message& msg);

    unsigned long uid = 0;

    message content;

    flag_set_t flags;

    /**
    Server assigned received time, in UTC.
    **/
    std::optional<boost::posix_time::ptime> internal_date;

    /**
    Size in bytes as reported by the server.
    **/
    unsigned long size = 0;

    /**
    True if only the header was fetched.
    **/
    bool header_only = false;

    /**
    Formatting the flags as the parenthesized list, as in `(\Seen \Flagged)`.

    @return Flag list.
    **/
    std::string flag_string() const;

    /**
    Formatting the internal date as in `17-Jul-1996 02:44:25 +0000`.

    @return Internal date, empty if unknown.
    **/
    std::string internal_date_string() const;
};


/**
Parsing the internal date in the `date-time` format, as in `17-Jul-1996 02:44:25 -0700`.

@param text Date to parse, without the quotes.
@return     Date converted to UTC.
@throw malformed_response_error Invalid date.
**/
UIDBOX_EXPORT boost::posix_time::ptime parse_internal_date(const std::string& text);


/**
Formatting a UTC time in the `date-time` format.

@param time Time to format.
@return     Formatted date.
**/
UIDBOX_EXPORT std::string format_internal_date(const boost::posix_time::ptime& time);


} // namespace uidbox


#ifdef _MSC_VER
#pragma warning(pop)
#endif
