/*

message_cache.hpp
-----------------

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
#include <string>
#include "session_port.hpp"
#include "export.hpp"


namespace uidbox
{


/**
Single slot cache of the last fully fetched message.

A header fetch followed by a full fetch of the same message is the usual pattern, so keeping only the last message avoids the second download.
The cache is not thread safe.
**/
class UIDBOX_EXPORT message_cache
{
public:

    /**
    @param session Session to fetch through, must outlive the cache.
    **/
    explicit message_cache(session_port& session);

    message_cache(const message_cache&) = delete;

    message_cache(message_cache&&) = delete;

    ~message_cache() = default;

    void operator=(const message_cache&) = delete;

    void operator=(message_cache&&) = delete;

    /**
    Getting the raw message, from the cache if the UID matches the cached one, otherwise from the server.

    @param uid Message to fetch.
    @return    Message in its wire format.
    @throw protocol_error           Fetch status is not OK.
    @throw no_such_message_error    Message does not exist.
    @throw malformed_response_error Message literal cannot be located in the response.
    @throw *                        `session_port::uid_command(const std::string&, const std::vector<std::string>&)`.
    **/
    const std::string& fetch(unsigned long uid);

    /**
    Dropping the cached message.
    **/
    void invalidate();

    /**
    Checking whether the given message is cached.

    @param uid Message to check.
    @return    True if the message is in the slot.
    **/
    bool holds(unsigned long uid) const;

private:

    session_port& session_;

    std::optional<unsigned long> uid_;

    std::string raw_;
};


} // namespace uidbox


#ifdef _MSC_VER
#pragma warning(pop)
#endif
