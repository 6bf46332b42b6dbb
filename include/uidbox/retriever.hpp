/*

retriever.hpp
-------------

Copyright (C) 2016, Tomislav Karastojkovic (http://www.alepho.com).

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

*/


#pragma once

#ifdef _MSC_VER
#pragma warning(push)
#pragma warning(disable:4251)
#endif

#include <functional>
#include <string>
#include "flag_controller.hpp"
#include "message.hpp"
#include "message_cache.hpp"
#include "session_port.hpp"
#include "export.hpp"


namespace uidbox
{


/**
Transformation applied to every retrieved message, such as converting it to the caller's own representation.
**/
using message_factory_t = std::function<message_view(message_view)>;


/**
Assembling the message views from the raw content, the flags, the internal date and the size.
**/
class UIDBOX_EXPORT retriever
{
public:

    /**
    @param session Session to fetch through.
    @param cache   Cache of the full messages.
    @param flags   Controller for the flags, size and date.
    @param factory Transformation of the assembled views, none if empty.
    **/
    retriever(session_port& session, message_cache& cache, flag_controller& flags, message_factory_t factory = nullptr);

    retriever(const retriever&) = delete;

    retriever(retriever&&) = delete;

    ~retriever() = default;

    void operator=(const retriever&) = delete;

    void operator=(retriever&&) = delete;

    /**
    Retrieving the full message; the raw content goes through the cache.

    @param uid Message to retrieve.
    @return    Message with its server state, transformed by the factory.
    @throw no_such_message_error Message does not exist.
    @throw *                     `message_cache::fetch(unsigned long)`, `flag_controller::get_flags(unsigned long)`,
                                 `flag_controller::internal_date(unsigned long)`, `flag_controller::size(unsigned long)`.
    **/
    message_view get_full(unsigned long uid);

    /**
    Retrieving the message header only, bypassing the cache.

    The message is not marked as seen.

    @param uid Message to retrieve.
    @return    Message without the body, transformed by the factory.
    @throw protocol_error        Fetch status is not OK.
    @throw no_such_message_error Message does not exist.
    @throw *                     `get_full(unsigned long)`.
    **/
    message_view get_header_only(unsigned long uid);

    /**
    Fetching the raw header of a message.

    @param uid Message to fetch.
    @return    Header lines followed by the empty line.
    @throw protocol_error           Fetch status is not OK.
    @throw no_such_message_error    Message does not exist.
    @throw malformed_response_error Header cannot be located in the response.
    **/
    std::string fetch_header(unsigned long uid);

    void factory(message_factory_t factory);

private:

    /**
    Combining the raw content with the server state of the message and applying the factory.
    **/
    message_view assemble(unsigned long uid, const std::string& raw, bool header_only);

    session_port& session_;

    message_cache& cache_;

    flag_controller& flags_;

    message_factory_t factory_;
};


} // namespace uidbox


#ifdef _MSC_VER
#pragma warning(pop)
#endif
