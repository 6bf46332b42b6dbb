/*

session_port.hpp
----------------

Copyright (C) 2016, Tomislav Karastojkovic (http://www.alepho.com).

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

*/


#pragma once

#include <optional>
#include <string>
#include <vector>
#include "export.hpp"


namespace uidbox
{


/**
Status of a completed command.
**/
enum class status_t {OK, NO, BAD};


/**
One untagged response belonging to a command.

The leading keyword of the response is removed, so a search yields `5 9 12` and a fetch yields `1 (UID 5 FLAGS (\Seen))`. If the response
carries a literal, the text ends with the `{N}` size marker, the literal holds the N bytes, and whatever follows the literal on the wire is
delivered as the text of the next record.
**/
struct UIDBOX_EXPORT response_record_t
{
    std::string text;

    std::optional<std::string> literal;
};


/**
Outcome of a command: the tagged status, the tagged response text and the untagged records.
**/
struct UIDBOX_EXPORT command_result_t
{
    status_t status = status_t::BAD;

    std::string response;

    std::vector<response_record_t> data;

    bool ok() const
    {
        return status == status_t::OK;
    }
};


/**
Escaping the double quote and backslashes, and surrounding with double quotes, as folder names appear in the command arguments.

@param text String to escape.
@return     Quoted string.
**/
UIDBOX_EXPORT std::string to_astring(const std::string& text);


/**
Operations the mailbox layer needs from a protocol session.

Exactly one request is in flight at a time; implementations are not required to be thread safe.
**/
class UIDBOX_EXPORT session_port
{
public:

    virtual ~session_port() = default;

    /**
    Making the folder the active one.

    @param folder_name Folder to select.
    @throw no_such_folder_error The folder does not exist.
    **/
    virtual void select(const std::string& folder_name) = 0;

    /**
    Creating a folder.

    @param folder_name Folder to create.
    @throw protocol_error Creating folder failure.
    **/
    virtual void create(const std::string& folder_name) = 0;

    /**
    Getting the folder selected by the last successful `select()`.

    @return Folder name, empty if none is selected.
    **/
    virtual const std::string& selected() const = 0;

    /**
    Issuing a UID addressed command against the selected folder.

    @param command Command name such as `SEARCH`, `FETCH`, `STORE` or `COPY`.
    @param args    Arguments as they appear on the wire.
    @return        Status and untagged records of the command.
    **/
    virtual command_result_t uid_command(const std::string& command, const std::vector<std::string>& args) = 0;

    /**
    Appending a message to a folder.

    @param folder_name Target folder.
    @param flags       Flag list such as `(\Seen)`, empty for none.
    @param date        Internal date such as `17-Jul-1996 02:44:25 +0000`, empty to let the server choose.
    @param message     Message in the wire format.
    @return            Status of the command.
    **/
    virtual command_result_t append(const std::string& folder_name, const std::string& flags, const std::string& date, const std::string& message) = 0;

    /**
    Permanently removing the messages flagged as deleted from the selected folder.

    @return Status of the command.
    **/
    virtual command_result_t expunge() = 0;

    /**
    Closing the selected folder.
    **/
    virtual void close() = 0;

    /**
    Ending the session.
    **/
    virtual void logout() = 0;

    /**
    Opening a new connection in place of the current one.
    **/
    virtual void reconnect() = 0;

    /**
    Authenticating the connection with the stored credentials.
    **/
    virtual void login() = 0;
};


} // namespace uidbox
