/*

imap_session.cpp
----------------

Copyright (C) 2016, Tomislav Karastojkovic (http://www.alepho.com).

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

*/


#include <algorithm>
#include <cctype>
#include <stdexcept>
#include <memory>
#include <string>
#include <vector>
#include <boost/algorithm/string/join.hpp>
#include <boost/algorithm/string/predicate.hpp>
#include <boost/algorithm/string/case_conv.hpp>
#include <boost/regex.hpp>
#include <uidbox/errors.hpp>
#include <uidbox/imap_session.hpp>
#include <uidbox/log.hpp>


using std::find_if;
using std::make_unique;
using std::stoul;
using std::string;
using std::to_string;
using std::vector;
using boost::iequals;
using boost::istarts_with;
using boost::regex;
using boost::regex_search;
using boost::smatch;
using boost::algorithm::join;
using boost::algorithm::to_upper_copy;


namespace uidbox
{


const string imap_session::UNTAGGED_RESPONSE{"*"};
const string imap_session::CONTINUE_RESPONSE{"+"};
const string imap_session::TOKEN_SEPARATOR_STR{" "};
const string imap_session::NONEXISTENT_CODE{"[NONEXISTENT]"};


imap_session::imap_session(const options_t& options) : options_(options), tag_(0)
{
    reconnect();
}


imap_session::~imap_session()
{
    // No protocol I/O here, the logout is explicit.
    if (dlg_)
        dlg_->close();
}


/*
A refused select leaves no folder selected. A `NO` answer does not tell why by itself: unless the server sends the `NONEXISTENT` code of
RFC 5530, the folder is listed to distinguish a missing folder from a permission refusal.
*/
void imap_session::select(const string& folder_name)
{
    command_result_t result = execute("SELECT " + to_astring(folder_name), {});
    if (result.ok())
    {
        selected_ = folder_name;
        return;
    }

    selected_.clear();
    if (result.status == status_t::NO && (istarts_with(result.response, NONEXISTENT_CODE) || !folder_listed(folder_name)))
        throw no_such_folder_error("Mailbox does not exist.", "Mailbox=`" + folder_name + "`, response=`" + result.response + "`.");
    throw protocol_error("Selecting mailbox failure.", "Mailbox=`" + folder_name + "`, response=`" + result.response + "`.");
}


bool imap_session::folder_listed(const string& folder_name)
{
    command_result_t result = execute("LIST \"\" " + to_astring(folder_name), {"LIST"});
    // Without the listing the folder cannot be told missing.
    if (!result.ok())
        return true;

    for (auto& response : response_parser::parse_records(result.data))
    {
        const token_list_t& tokens = response.mandatory();
        if (tokens.empty())
            continue;
        const auto& name = tokens.back();
        if (name->token_type == response_token_t::token_type_t::ATOM && name->atom == folder_name)
            return true;
        if (name->token_type == response_token_t::token_type_t::LITERAL && name->literal == folder_name)
            return true;
    }
    return false;
}


void imap_session::create(const string& folder_name)
{
    command_result_t result = execute("CREATE " + to_astring(folder_name), {});
    if (!result.ok())
        throw protocol_error("Creating folder failure.", "Response=`" + result.response + "`.");
}


command_result_t imap_session::uid_command(const string& command, const vector<string>& args)
{
    const string cmd_upper = to_upper_copy(command);
    // Store and fetch both answer by the untagged fetch responses.
    const string keyword = (cmd_upper == "STORE") ? "FETCH" : cmd_upper;
    string line = "UID " + cmd_upper;
    if (!args.empty())
        line += TOKEN_SEPARATOR_STR + join(args, TOKEN_SEPARATOR_STR);
    return execute(line, {keyword});
}


command_result_t imap_session::append(const string& folder_name, const string& flags, const string& date, const string& message)
{
    string cmd = "APPEND " + to_astring(folder_name);
    if (!flags.empty())
        cmd += TOKEN_SEPARATOR_STR + flags;
    if (!date.empty())
        cmd += TOKEN_SEPARATOR_STR + to_astring(date);
    cmd += " {" + to_string(message.size()) + "}";
    dlg_->send(format(cmd));

    command_result_t result;
    bool continued = false;
    while (true)
    {
        string line = dlg_->receive();
        // Some servers send the continuation without any text.
        if (!continued && line.compare(0, CONTINUE_RESPONSE.size(), CONTINUE_RESPONSE) == 0)
        {
            dlg_->send(message);
            continued = true;
            continue;
        }
        tag_result_response_t parsed_line = response_parser::parse_tag_result(line);
        if (parsed_line.tag == to_string(tag_))
        {
            result.status = to_status(parsed_line);
            result.response = parsed_line.response;
            break;
        }
        else if (parsed_line.tag != UNTAGGED_RESPONSE)
            throw session_error("Expecting the untagged response.", "Tag=`" + parsed_line.tag + "`.");
    }
    if (!result.ok())
        logger()->warn("Appending to `{}` failed: {}", folder_name, result.response);
    return result;
}


command_result_t imap_session::expunge()
{
    return execute("EXPUNGE", {});
}


void imap_session::close()
{
    command_result_t result = execute("CLOSE", {});
    if (!result.ok())
        throw protocol_error("Closing mailbox failure.", "Response=`" + result.response + "`.");
    selected_.clear();
}


void imap_session::logout()
{
    try
    {
        command_result_t result = execute("LOGOUT", {});
        if (!result.ok())
            logger()->warn("Logout refused: {}", result.response);
    }
    catch (const dialog_error& exc)
    {
        // Servers may drop the connection right after the bye.
        logger()->debug("Logout ended the connection: {} {}", exc.what(), exc.details());
    }
    selected_.clear();
    dlg_->close();
}


void imap_session::reconnect()
{
    if (dlg_)
        dlg_->close();
    selected_.clear();
    dlg_ = make_unique<dialog>(options_.hostname, options_.port, options_.timeout);
    dlg_->set_session_name(options_.session_name);
    dlg_->connect();
    if (options_.tls_mode == tls_mode_t::IMPLICIT)
        dlg_->start_tls(options_.ssl_options);

    string line = dlg_->receive();
    tag_result_response_t parsed_line = response_parser::parse_tag_result(line);
    if (parsed_line.tag != UNTAGGED_RESPONSE)
        throw session_error("Incorrect tag.", "Tag=`" + parsed_line.tag + "`.");
    if (!parsed_line.result.has_value() || parsed_line.result.value() != tag_result_response_t::OK)
        throw session_error("Connection to server failure.", "Line=`" + line + "`.");
    logger()->debug("Greeting from {}: {}", options_.hostname, parsed_line.response);

    if (options_.tls_mode == tls_mode_t::START_TLS)
        switch_tls();
}


void imap_session::login()
{
    command_result_t result = execute("LOGIN " + to_astring(options_.username) + TOKEN_SEPARATOR_STR + to_astring(options_.password), {});
    if (!result.ok())
        throw protocol_error("Authentication failure.", "Response=`" + result.response + "`.");
}


const string& imap_session::selected() const
{
    return selected_;
}


void imap_session::set_session_name(const string& name)
{
    options_.session_name = name;
    if (dlg_)
        dlg_->set_session_name(name);
}


string imap_session::format(const string& command)
{
    return to_string(++tag_) + TOKEN_SEPARATOR_STR + command;
}


/*
According to the RFC 3501, servers may send untagged responses unrelated to the command at any time (EXISTS, RECENT, EXPUNGE, flag updates
of other clients), so only the responses with the expected keyword are collected and the rest is ignored.
*/
command_result_t imap_session::execute(const string& command, const vector<string>& keywords)
{
    dlg_->send(format(command));

    command_result_t result;
    while (true)
    {
        string line = dlg_->receive();
        tag_result_response_t parsed_line = response_parser::parse_tag_result(line);
        if (parsed_line.tag == UNTAGGED_RESPONSE)
        {
            // Either `* KEYWORD rest` or `* NUMBER KEYWORD rest`.
            string text = parsed_line.result.has_value() ? line.substr(line.find(TOKEN_SEPARATOR_STR) + 1) : parsed_line.response;
            string::size_type first_end = text.find(TOKEN_SEPARATOR_STR);
            string first = text.substr(0, first_end);
            string keyword = first;
            string record_text = first_end == string::npos ? string() : text.substr(first_end + 1);
            bool numbered = !first.empty() && std::all_of(first.begin(), first.end(), [](char c) { return isdigit(static_cast<unsigned char>(c)); });
            if (numbered)
            {
                string::size_type keyword_end = record_text.find(TOKEN_SEPARATOR_STR);
                keyword = record_text.substr(0, keyword_end);
                record_text = first + (keyword_end == string::npos ? string() : TOKEN_SEPARATOR_STR + record_text.substr(keyword_end + 1));
            }

            auto wanted = find_if(keywords.begin(), keywords.end(), [&keyword](const string& k) { return iequals(k, keyword); });
            if (wanted != keywords.end())
                receive_records(record_text, result.data);
            else
            {
                vector<response_record_t> unsolicited;
                receive_records(record_text, unsolicited);
            }
        }
        else if (parsed_line.tag == to_string(tag_))
        {
            result.status = to_status(parsed_line);
            result.response = parsed_line.response;
            if (!result.ok())
                logger()->warn("Command `{}` answered by {}", command.substr(0, command.find(TOKEN_SEPARATOR_STR)), parsed_line.to_string());
            break;
        }
        else
            throw session_error("Incorrect tag.", "Tag=`" + parsed_line.tag + "`.");
    }
    return result;
}


void imap_session::receive_records(const string& first_text, vector<response_record_t>& records)
{
    static const regex LITERAL_REGEX{R"(\{(\d+)\}$)"};

    string text = first_text;
    while (true)
    {
        response_record_t record;
        record.text = text;
        smatch match;
        if (!regex_search(text, match, LITERAL_REGEX))
        {
            records.push_back(std::move(record));
            return;
        }

        try
        {
            record.literal = dlg_->receive_bytes(stoul(match[1].str()));
        }
        catch (const std::out_of_range& exc)
        {
            throw session_error("Literal size out of range.", exc.what());
        }
        records.push_back(std::move(record));
        // The response continues on the line following the literal bytes.
        text = dlg_->receive();
    }
}


void imap_session::switch_tls()
{
    command_result_t result = execute("STARTTLS", {});
    if (!result.ok())
        throw session_error("Start TLS refused by server.", "Response=`" + result.response + "`.");
    dlg_->start_tls(options_.ssl_options);
}


status_t imap_session::to_status(const tag_result_response_t& parsed_line)
{
    if (!parsed_line.result.has_value())
        return status_t::BAD;
    switch (parsed_line.result.value())
    {
        case tag_result_response_t::OK:
            return status_t::OK;

        case tag_result_response_t::NO:
            return status_t::NO;

        default:
            return status_t::BAD;
    }
}


} // namespace uidbox
