/*

flag_controller.hpp
-------------------

Copyright (C) 2016, Tomislav Karastojkovic (http://www.alepho.com).

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

*/


#pragma once

#ifdef _MSC_VER
#pragma warning(push)
#pragma warning(disable:4251)
#endif

#include <memory>
#include <string>
#include <vector>
#include <boost/date_time/posix_time/posix_time.hpp>
#include "message.hpp"
#include "response_parser.hpp"
#include "session_port.hpp"
#include "export.hpp"


namespace uidbox
{


/**
Flags, size and internal date of the messages in the selected folder.

Nothing is cached since other clients may change the flags at any time.
**/
class UIDBOX_EXPORT flag_controller
{
public:

    /**
    @param session Session to use, must outlive the controller.
    **/
    explicit flag_controller(session_port& session);

    flag_controller(const flag_controller&) = delete;

    flag_controller(flag_controller&&) = delete;

    ~flag_controller() = default;

    void operator=(const flag_controller&) = delete;

    void operator=(flag_controller&&) = delete;

    /**
    Getting the flags of a message.

    @param uid Message to query.
    @return    Flags of the message, empty if it has none.
    @throw protocol_error           Fetch status is not OK.
    @throw no_such_message_error    Message does not exist.
    @throw malformed_response_error Flag list cannot be parsed.
    **/
    flag_set_t get_flags(unsigned long uid);

    /**
    Replacing the flags of a message by a single request.

    @param uid   Message to change.
    @param flags New flags.
    @throw protocol_error Store status is not OK.
    **/
    void set_flags(unsigned long uid, const flag_set_t& flags);

    /**
    Adding flags to a message, one request per flag in the given order.

    @param uid   Message to change.
    @param flags Flags to add.
    @throw flag_error Store status is not OK; the flags before the failed one remain added.
    **/
    void add_flags(unsigned long uid, const std::vector<std::string>& flags);

    /**
    Removing flags from a message, one request per flag in the given order.

    @param uid   Message to change.
    @param flags Flags to remove.
    @throw flag_error Store status is not OK; the flags before the failed one remain removed.
    **/
    void remove_flags(unsigned long uid, const std::vector<std::string>& flags);

    /**
    Getting the size of a message as reported by the server.

    @param uid Message to query.
    @return    Size in bytes.
    @throw protocol_error           Fetch status is not OK.
    @throw no_such_message_error    Message does not exist.
    @throw malformed_response_error Size cannot be located or parsed.
    **/
    unsigned long size(unsigned long uid);

    /**
    Getting the server assigned received time of a message.

    @param uid Message to query.
    @return    Internal date in UTC.
    @throw protocol_error           Fetch status is not OK.
    @throw no_such_message_error    Message does not exist.
    @throw malformed_response_error Date cannot be located or parsed.
    **/
    boost::posix_time::ptime internal_date(unsigned long uid);

private:

    /**
    Fetching a single data item of a message.

    @param uid  Message to query.
    @param item Data item name such as `FLAGS`.
    @return     Token following the item name.
    @throw protocol_error           Fetch status is not OK.
    @throw no_such_message_error    Empty response.
    @throw malformed_response_error Item not in the response.
    **/
    std::shared_ptr<response_token_t> fetch_item(unsigned long uid, const std::string& item);

    /**
    Storing a single flag change.

    @param uid   Message to change.
    @param mode  Either `+FLAGS` or `-FLAGS`.
    @param flags Flags to store.
    @throw flag_error Store status is not OK.
    **/
    void store(unsigned long uid, const std::string& mode, const std::vector<std::string>& flags);

    session_port& session_;
};


} // namespace uidbox


#ifdef _MSC_VER
#pragma warning(pop)
#endif
