/*

transfer.hpp
------------

Copyright (C) 2016, Tomislav Karastojkovic (http://www.alepho.com).

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

*/


#pragma once

#ifdef _MSC_VER
#pragma warning(push)
#pragma warning(disable:4251)
#endif

#include <string>
#include <variant>
#include "flag_controller.hpp"
#include "mailbox_sink.hpp"
#include "retriever.hpp"
#include "searcher.hpp"
#include "session_port.hpp"
#include "export.hpp"


namespace uidbox
{


/**
Target of a copy or move: nothing, a folder name on the same server, or a sink.

The sink is not owned and must outlive its use as the target.
**/
using target_t = std::variant<std::monostate, std::string, mailbox_sink*>;


/**
Copying, moving and deleting messages of the selected folder.
**/
class UIDBOX_EXPORT transfer
{
public:

    /**
    Target after the resolution against the source session.
    **/
    struct same_server_folder
    {
        std::string name;
    };

    struct foreign_sink
    {
        mailbox_sink* sink;
    };

    struct invalid_target
    {
    };

    using resolved_target_t = std::variant<invalid_target, same_server_folder, foreign_sink>;

    /**
    @param session     Session of the source folder.
    @param folder_name Source folder.
    @param search      Searcher of the source folder.
    @param flags       Flag controller of the source folder.
    @param retrieve    Retriever of the source folder, used for the copies to foreign sinks.
    **/
    transfer(session_port& session, const std::string& folder_name, searcher& search, flag_controller& flags, retriever& retrieve);

    transfer(const transfer&) = delete;

    transfer(transfer&&) = delete;

    ~transfer() = default;

    void operator=(const transfer&) = delete;

    void operator=(transfer&&) = delete;

    /**
    Resolving the target once, so the rest of the operation does not inspect it again.

    A sink being a folder on the source session is resolved to that folder.

    @param target Target to resolve.
    @return       Resolved target.
    **/
    resolved_target_t resolve(const target_t& target) const;

    /**
    Copying a message.

    On the same server the message is copied by the server, unless the target is the source folder itself when nothing happens. Otherwise the
    message is retrieved and added to the sink within its lock.

    @param uid    Message to copy.
    @param target Copy target.
    @throw unsupported_target_error Target is neither a folder name nor a sink.
    @throw no_such_message_error    Message does not exist.
    @throw protocol_error           Copy status is not OK.
    @throw *                        `retriever::get_full(unsigned long)`, `mailbox_sink::add(const message_view&)`.
    **/
    void copy(unsigned long uid, const target_t& target);

    /**
    Copying a message and flagging the source as deleted, unless the target is the source folder.

    The two steps are not atomic: if the flagging fails, the message remains in both folders.

    @param uid    Message to move.
    @param target Move target.
    @throw flag_error Flagging the source failure.
    @throw *          `copy(unsigned long, const target_t&)`.
    **/
    void move(unsigned long uid, const target_t& target);

    /**
    Moving a message to the trash if one is set, otherwise flagging it as deleted.

    @param uid Message to discard.
    @throw * `move(unsigned long, const target_t&)`, `flag_controller::add_flags(unsigned long, const std::vector<std::string>&)`.
    **/
    void discard(unsigned long uid);

    /**
    Discarding a message after checking that it exists.

    @param uid Message to remove.
    @throw no_such_message_error Message does not exist.
    @throw *                     `discard(unsigned long)`.
    **/
    void remove(unsigned long uid);

    /**
    Permanently removing the messages flagged as deleted.

    @throw protocol_error Expunge status is not OK.
    **/
    void expunge();

    /**
    Discarding all messages not flagged as deleted, then expunging.

    @throw * `discard(unsigned long)`, `expunge()`.
    **/
    void clear();

    /**
    Setting the folder receiving the discarded messages.

    @param target Trash folder name or sink, `std::monostate` to discard in place.
    **/
    void trash(const target_t& target);

    const target_t& trash() const;

    /**
    Changing the source folder after the folder switch.

    @param folder_name New source folder.
    **/
    void folder(const std::string& folder_name);

private:

    void copy_resolved(unsigned long uid, const resolved_target_t& target);

    bool is_source(const resolved_target_t& target) const;

    session_port& session_;

    std::string folder_name_;

    searcher& searcher_;

    flag_controller& flags_;

    retriever& retriever_;

    target_t trash_;
};


} // namespace uidbox


#ifdef _MSC_VER
#pragma warning(pop)
#endif
