/*

flag_controller.cpp
-------------------

Copyright (C) 2016, Tomislav Karastojkovic (http://www.alepho.com).

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

*/


#include <algorithm>
#include <cctype>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>
#include <uidbox/errors.hpp>
#include <uidbox/flag_controller.hpp>
#include <uidbox/log.hpp>


using std::shared_ptr;
using std::stoul;
using std::string;
using std::to_string;
using std::vector;
using boost::posix_time::ptime;


namespace uidbox
{


flag_controller::flag_controller(session_port& session) : session_(session)
{
}


flag_set_t flag_controller::get_flags(unsigned long uid)
{
    auto flags_token = fetch_item(uid, "FLAGS");
    if (flags_token->token_type != response_token_t::token_type_t::LIST)
        throw malformed_response_error("Flag list expected.", "UID=" + to_string(uid) + ".");

    flag_set_t flags;
    for (const auto& flag : flags_token->parenthesized_list)
    {
        if (flag->token_type != response_token_t::token_type_t::ATOM || flag->atom.empty())
            throw malformed_response_error("Flag expected.", "UID=" + to_string(uid) + ".");
        flags.insert(flag->atom);
    }
    return flags;
}


void flag_controller::set_flags(unsigned long uid, const flag_set_t& flags)
{
    const string flag_list = format_flag_list(flags);
    command_result_t result = session_.uid_command("STORE", {to_string(uid), "FLAGS", flag_list});
    if (!result.ok())
        throw protocol_error("Setting flags failure.", "UID=" + to_string(uid) + ", flags=`" + flag_list + "`, response=`" +
            result.response + "`.");
}


void flag_controller::add_flags(unsigned long uid, const vector<string>& flags)
{
    store(uid, "+FLAGS", flags);
}


void flag_controller::remove_flags(unsigned long uid, const vector<string>& flags)
{
    store(uid, "-FLAGS", flags);
}


unsigned long flag_controller::size(unsigned long uid)
{
    auto size_token = fetch_item(uid, "RFC822.SIZE");
    const string& atom = size_token->atom;
    if (size_token->token_type != response_token_t::token_type_t::ATOM || atom.empty() ||
        !std::all_of(atom.begin(), atom.end(), [](char c) { return isdigit(static_cast<unsigned char>(c)); }))
        throw malformed_response_error("Size expected.", "UID=" + to_string(uid) + ", size=`" + atom + "`.");
    try
    {
        return stoul(atom);
    }
    catch (const std::out_of_range& exc)
    {
        throw malformed_response_error("Size out of range.", exc.what());
    }
}


ptime flag_controller::internal_date(unsigned long uid)
{
    auto date_token = fetch_item(uid, "INTERNALDATE");
    if (date_token->token_type != response_token_t::token_type_t::ATOM)
        throw malformed_response_error("Internal date expected.", "UID=" + to_string(uid) + ".");
    return parse_internal_date(date_token->atom);
}


shared_ptr<response_token_t> flag_controller::fetch_item(unsigned long uid, const string& item)
{
    command_result_t result = session_.uid_command("FETCH", {to_string(uid), "(" + item + ")"});
    if (!result.ok())
        throw protocol_error("Fetching " + item + " failure.", "UID=" + to_string(uid) + ", response=`" + result.response + "`.");

    vector<response_parser> responses = response_parser::parse_records(result.data);
    const response_parser* fetched = response_parser::find_fetch(responses, uid);
    if (fetched == nullptr)
        throw no_such_message_error("No such message.", "UID=" + to_string(uid) + ".");
    auto value = fetched->find_value(item);
    if (value == nullptr)
        throw malformed_response_error(item + " not found in the fetch response.", "UID=" + to_string(uid) + ".");
    return value;
}


void flag_controller::store(unsigned long uid, const string& mode, const vector<string>& flags)
{
    for (const auto& flag : flags)
    {
        command_result_t result = session_.uid_command("STORE", {to_string(uid), mode, "(" + flag + ")"});
        if (!result.ok())
            throw flag_error("Storing flag failure.", "UID=" + to_string(uid) + ", mode=" + mode + ", response=`" + result.response + "`.",
                flag);
        logger()->debug("Message {} {} {}.", uid, mode, flag);
    }
}


} // namespace uidbox
