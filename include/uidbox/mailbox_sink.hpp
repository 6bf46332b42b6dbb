/*

mailbox_sink.hpp
----------------

Copyright (C) 2016, Tomislav Karastojkovic (http://www.alepho.com).

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

*/


#pragma once

#include <optional>
#include <string>
#include "message.hpp"
#include "session_port.hpp"
#include "export.hpp"


namespace uidbox
{


/**
Collection able to receive copied messages, such as a mailbox on another server or a local store.
**/
class UIDBOX_EXPORT mailbox_sink
{
public:

    virtual ~mailbox_sink() = default;

    /**
    Adding a message.

    @param msg Message to add.
    @return    Key of the added message.
    **/
    virtual unsigned long add(const message_view& msg) = 0;

    /**
    Making the pending changes permanent.
    **/
    virtual void flush() = 0;

    virtual void lock() = 0;

    virtual void unlock() = 0;

    /**
    Getting the folder name if the sink is a folder reachable through the given session.

    Such a sink receives copies by the server side copy instead of the download and upload.

    @param session Session of the copy source.
    @return        Folder name, or none if the sink is not on that session.
    **/
    virtual std::optional<std::string> folder_on(const session_port& session) const
    {
        return std::nullopt;
    }
};


} // namespace uidbox
