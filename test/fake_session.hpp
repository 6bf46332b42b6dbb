/*

fake_session.hpp
----------------

Copyright (C) 2016, Tomislav Karastojkovic (http://www.alepho.com).

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

*/


#pragma once

#include <map>
#include <set>
#include <string>
#include <vector>
#include <boost/date_time/posix_time/posix_time.hpp>
#include <uidbox/message.hpp>
#include <uidbox/session_port.hpp>


namespace uidbox
{
namespace test
{


/**
In memory server with several folders, answering the commands the way a real server does.
**/
class fake_session : public session_port
{
public:

    struct stored_message_t
    {
        unsigned long uid;

        std::string raw;

        flag_set_t flags;

        boost::posix_time::ptime internal_date;
    };

    struct folder_t
    {
        unsigned long uid_next = 1;

        std::vector<stored_message_t> messages;
    };

    /**
    Starting with the empty `INBOX` folder.
    **/
    fake_session();

    void select(const std::string& folder_name) override;

    void create(const std::string& folder_name) override;

    command_result_t uid_command(const std::string& command, const std::vector<std::string>& args) override;

    command_result_t append(const std::string& folder_name, const std::string& flags, const std::string& date, const std::string& message) override;

    command_result_t expunge() override;

    void close() override;

    void logout() override;

    void reconnect() override;

    void login() override;

    /**
    Placing a message directly into a folder, as delivered by another client.

    @return UID of the delivered message.
    **/
    unsigned long deliver(const std::string& folder_name, const std::string& raw, const flag_set_t& flags = {},
        const boost::posix_time::ptime& internal_date = boost::posix_time::time_from_string("1996-07-17 09:44:25"));

    /**
    Setting the UID the next message of the folder gets.
    **/
    void uid_next(const std::string& folder_name, unsigned long uid);

    folder_t& folder(const std::string& folder_name);

    /**
    Deleting a folder, as done by another client.
    **/
    void remove_folder(const std::string& folder_name);

    bool has_folder(const std::string& folder_name) const;

    const std::string& selected() const override;

    bool logged_in() const;

    /**
    Number of requests of the given command since the last reset, such as `FETCH`, `STORE`, `SEARCH` or `EXPUNGE`.
    **/
    unsigned count(const std::string& command) const;

    void reset_counts();

    /**
    Answering the next request of the command with the given result instead of executing it.
    **/
    void script(const std::string& command, const command_result_t& result);

    /**
    Answering the next request of the command with a non-OK status.
    **/
    void fail(const std::string& command, status_t status = status_t::NO);

    /**
    Refusing every store of the given flag.
    **/
    void fail_flag(const std::string& flag);

    /**
    Requests in the order received, as in `UID FETCH 5 (RFC822)`.
    **/
    std::vector<std::string> requests;

private:

    command_result_t search(folder_t& box, const std::string& criteria);

    command_result_t fetch(folder_t& box, unsigned long uid, const std::string& item);

    command_result_t store(folder_t& box, unsigned long uid, const std::string& mode, const std::string& flag_list);

    command_result_t copy(folder_t& box, unsigned long uid, const std::string& target);

    stored_message_t* find(folder_t& box, unsigned long uid, std::size_t& sequence);

    static flag_set_t parse_flag_list(const std::string& flag_list);

    static command_result_t status(status_t st, const std::string& response);

    std::map<std::string, folder_t> folders_;

    std::string selected_;

    bool logged_in_;

    std::map<std::string, unsigned> counts_;

    std::map<std::string, command_result_t> scripted_;

    std::set<std::string> failing_flags_;
};


} // namespace test
} // namespace uidbox
