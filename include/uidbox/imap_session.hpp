/*

imap_session.hpp
----------------

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
#include <memory>
#include <optional>
#include <string>
#include <vector>
#include "dialog.hpp"
#include "response_parser.hpp"
#include "session_port.hpp"
#include "export.hpp"


namespace uidbox
{


/**
IMAP session over a network dialog, implementing the session port.
**/
class UIDBOX_EXPORT imap_session : public session_port
{
public:

    /**
    How the connection is secured.

    - NONE: Plain TCP.
    - START_TLS: Plain TCP switched to TLS by the STARTTLS command before the login.
    - IMPLICIT: TLS from the first byte.
    **/
    enum class tls_mode_t {NONE, START_TLS, IMPLICIT};

    /**
    Connection settings of a session.
    **/
    struct options_t
    {
        std::string hostname;

        unsigned port = 143;

        std::string username;

        std::string password;

        tls_mode_t tls_mode = tls_mode_t::NONE;

        /**
        Network timeout after which I/O operations fail. If zero, then no timeout is set.
        **/
        std::chrono::milliseconds timeout{0};

        dialog::ssl_options_t ssl_options{boost::asio::ssl::context::sslv23, boost::asio::ssl::verify_none};

        /**
        Label prefixed to the trace log lines.
        **/
        std::string session_name;
    };

    /**
    Connecting to the server and reading its greeting. The login is a separate step.

    @param options Connection settings.
    @throw *       `reconnect()`.
    **/
    explicit imap_session(const options_t& options);

    /**
    Closing the connection without protocol I/O.
    **/
    ~imap_session() override;

    imap_session(const imap_session&) = delete;

    imap_session(imap_session&&) = delete;

    void operator=(const imap_session&) = delete;

    void operator=(imap_session&&) = delete;

    /**
    @throw no_such_folder_error Folder does not exist.
    @throw protocol_error       Selecting mailbox failure for another reason.
    @throw *                    `dialog::send(const std::string&)`, `dialog::receive()`, `folder_listed(const std::string&)`.
    **/
    void select(const std::string& folder_name) override;

    /**
    @throw protocol_error Creating folder failure.
    @throw *              `dialog::send(const std::string&)`, `dialog::receive()`.
    **/
    void create(const std::string& folder_name) override;

    /**
    @throw session_error Incorrect tag or untagged response.
    @throw *             `dialog::send(const std::string&)`, `dialog::receive()`, `dialog::receive_bytes(std::size_t)`.
    **/
    command_result_t uid_command(const std::string& command, const std::vector<std::string>& args) override;

    /**
    @throw session_error Continuation expected.
    @throw *             `dialog::send(const std::string&)`, `dialog::receive()`.
    **/
    command_result_t append(const std::string& folder_name, const std::string& flags, const std::string& date, const std::string& message) override;

    command_result_t expunge() override;

    /**
    @throw protocol_error Closing mailbox failure.
    **/
    void close() override;

    /**
    Sending the logout command and closing the connection; server errors are logged only.
    **/
    void logout() override;

    /**
    @throw session_error Connection to server failure.
    @throw *             `dialog::connect()`, `switch_tls()`.
    **/
    void reconnect() override;

    /**
    Logging in with the stored credentials.

    @throw protocol_error Authentication failure.
    @throw *              `dialog::send(const std::string&)`, `dialog::receive()`.
    **/
    void login() override;

    const std::string& selected() const override;

    /**
    Setting a label for the trace log lines of this session.

    @param name Label, empty clears it.
    **/
    void set_session_name(const std::string& name);

protected:

    static const std::string UNTAGGED_RESPONSE;

    static const std::string CONTINUE_RESPONSE;

    static const std::string TOKEN_SEPARATOR_STR;

    static const std::string NONEXISTENT_CODE;

    /**
    Formatting a tagged command.

    @param command Command to format.
    @return        Command with the new tag.
    **/
    std::string format(const std::string& command);

    /**
    Sending a command and collecting the response up to the tagged line.

    Untagged responses whose keyword matches one of the given keywords are collected as records, the others are ignored.

    @param command  Command without the tag.
    @param keywords Keywords of the untagged responses to collect.
    @return         Tagged status and collected records.
    @throw session_error Incorrect tag.
    **/
    command_result_t execute(const std::string& command, const std::vector<std::string>& keywords);

    /**
    Receiving the rest of an untagged response, reading the literals by their exact size.

    @param first_text Text of the first line without the tag.
    @param records    Records to append to.
    **/
    void receive_records(const std::string& first_text, std::vector<response_record_t>& records);

    /**
    Checking whether the server lists the folder.

    @param folder_name Folder to look for.
    @return            False only if the listing succeeded without the folder.
    @throw malformed_response_error Parsing the listing failure.
    **/
    bool folder_listed(const std::string& folder_name);

    /**
    Switching to TLS layer.

    @throw session_error Start TLS refused by server.
    **/
    void switch_tls();

    static status_t to_status(const tag_result_response_t& parsed_line);

    options_t options_;

    std::unique_ptr<dialog> dlg_;

    /**
    Tag used to identify requests and responses.
    **/
    unsigned tag_;

    std::string selected_;
};


/**
Error thrown by the IMAP session for protocol violations of the server.
**/
class UIDBOX_EXPORT session_error : public dialog_error
{
public:

    using dialog_error::dialog_error;
};


} // namespace uidbox


#ifdef _MSC_VER
#pragma warning(pop)
#endif
