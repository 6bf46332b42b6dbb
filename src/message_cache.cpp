/*

message_cache.cpp
-----------------

Copyright (C) 2016, Tomislav Karastojkovic (http://www.alepho.com).

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

*/


#include <string>
#include <vector>
#include <uidbox/errors.hpp>
#include <uidbox/log.hpp>
#include <uidbox/message_cache.hpp>
#include <uidbox/response_parser.hpp>


using std::string;
using std::to_string;
using std::vector;


namespace uidbox
{


message_cache::message_cache(session_port& session) : session_(session)
{
}


const string& message_cache::fetch(unsigned long uid)
{
    if (holds(uid))
        return raw_;

    command_result_t result = session_.uid_command("FETCH", {to_string(uid), "(RFC822)"});
    if (!result.ok())
        throw protocol_error("Fetching message failure.", "UID=" + to_string(uid) + ", response=`" + result.response + "`.");

    vector<response_parser> responses = response_parser::parse_records(result.data);
    const response_parser* fetched = response_parser::find_fetch(responses, uid);
    if (fetched == nullptr)
        throw no_such_message_error("No such message.", "UID=" + to_string(uid) + ".");
    auto body = fetched->find_value("RFC822");
    if (body == nullptr)
        throw malformed_response_error("Message not found in the fetch response.", "UID=" + to_string(uid) + ".");

    // Small messages may come as the quoted string instead of the literal.
    if (body->token_type == response_token_t::token_type_t::LITERAL)
        raw_ = body->literal;
    else if (body->token_type == response_token_t::token_type_t::ATOM)
        raw_ = body->atom;
    else
        throw malformed_response_error("Message not found in the fetch response.", "UID=" + to_string(uid) + ".");
    uid_ = uid;
    logger()->debug("Message {} cached, {} bytes.", uid, raw_.size());
    return raw_;
}


void message_cache::invalidate()
{
    uid_.reset();
    raw_.clear();
}


bool message_cache::holds(unsigned long uid) const
{
    return uid_.has_value() && uid_.value() == uid;
}


} // namespace uidbox
